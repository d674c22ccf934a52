#pragma once

// cordon/figure.hpp: Chart figures built by the `chart` module.
//
// A figure is nothing but a declarative spec: {"data":[trace...],
// "layout":{...}} in the shape plotting front-ends consume. Building one
// never renders anything; the spec is returned to the caller as a figure
// Artifact and drawn elsewhere.

#include <map>
#include <optional>
#include <string>

#include "cordon/jsonlite.hpp"
#include "cordon/value.hpp"

namespace cordon {

class FigureObject : public Object {
 public:
  FigureObject();

  std::string type_name() const override { return "Figure"; }
  std::string repr(int depth) const override;
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  std::optional<jsonlite::Value> to_json(int depth) const override;

  jsonlite::Array& traces();
  jsonlite::Object& layout();

  jsonlite::Object spec;
};

// Members of the `chart` module: bar, line, scatter, histogram, pie, box,
// table and Figure.
std::map<std::string, Value> chart_module_members();

}  // namespace cordon
