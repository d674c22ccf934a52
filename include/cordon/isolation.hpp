#pragma once

// cordon/isolation.hpp: Isolation Guard.
//
// Before execution the guard binds a deep copy of the caller's dataset into
// the program's globals; the program never sees the caller's object. After
// normal completion it reads the expected result binding and converts it to
// an Artifact. Both steps run on the executing worker, so nothing of the
// interpreter's heap crosses the executor boundary.
//
// INTEGRITY:
//   The source fingerprint is taken at construction; source_intact() recomputes
//   it on the host side after the run.

#include <memory>
#include <optional>
#include <string>

#include "cordon/dataset.hpp"
#include "cordon/types.hpp"
#include "cordon/value.hpp"

namespace cordon {

class Interpreter;

class IsolationGuard {
 public:
  IsolationGuard(std::shared_ptr<const Dataset> source, std::string binding, bool bind_df_alias);

  // Binds a fresh copy under `binding` (and `df` when enabled).
  void bind(Interpreter& interp) const;

  /**
   * @brief Reads `result_name` from the program's globals.
   * @return nullopt when the name is unbound or holds an unrecognized shape.
   */
  std::optional<Artifact> capture(const Interpreter& interp, const std::string& result_name) const;

  bool source_intact() const;
  const std::string& source_fingerprint() const { return fingerprint_; }

 private:
  std::shared_ptr<const Dataset> source_;
  std::string binding_;
  bool bind_df_alias_;
  std::string fingerprint_;
};

// number, bool, str -> scalar; DataFrame, Series -> table; Figure -> figure.
std::optional<Artifact> artifact_from_value(const Value& value);

}  // namespace cordon
