#include "cordon/isolation.hpp"

#include "cordon/figure.hpp"
#include "cordon/frame.hpp"
#include "cordon/interpreter.hpp"

namespace cordon {

IsolationGuard::IsolationGuard(std::shared_ptr<const Dataset> source, std::string binding, bool bind_df_alias)
    : source_(std::move(source)), binding_(std::move(binding)), bind_df_alias_(bind_df_alias) {
  if (source_) fingerprint_ = source_->fingerprint();
}

void IsolationGuard::bind(Interpreter& interp) const {
  Dataset copy = source_ ? *source_ : Dataset();
  auto frame = std::make_shared<FrameObject>(std::move(copy));
  interp.set_global(binding_, Value(frame));
  // Both names refer to the same copy.
  if (bind_df_alias_ && binding_ != "df") interp.set_global("df", Value(frame));
}

std::optional<Artifact> IsolationGuard::capture(const Interpreter& interp, const std::string& result_name) const {
  const Value* value = interp.find_global(result_name);
  if (!value) return std::nullopt;
  return artifact_from_value(*value);
}

bool IsolationGuard::source_intact() const { return !source_ || source_->fingerprint() == fingerprint_; }

std::optional<Artifact> artifact_from_value(const Value& value) {
  Artifact artifact;
  if (value.is_number() || value.is_str()) {
    artifact.kind = ArtifactKind::scalar;
    artifact.payload = to_json_value(value);
    return artifact;
  }
  if (value.as<FrameObject>() || value.as<SeriesObject>()) {
    auto rendered = value.as_object()->to_json(0);
    if (!rendered) return std::nullopt;
    artifact.kind = ArtifactKind::table;
    artifact.payload = std::move(*rendered);
    return artifact;
  }
  if (auto figure = value.as<FigureObject>()) {
    artifact.kind = ArtifactKind::figure;
    artifact.payload = figure->spec;
    return artifact;
  }
  return std::nullopt;
}

}  // namespace cordon
