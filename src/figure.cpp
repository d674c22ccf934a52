#include "cordon/figure.hpp"

#include <set>
#include <unordered_map>

#include "cordon/frame.hpp"
#include "cordon/interpreter.hpp"

namespace cordon {

namespace {

// Prefixes that expand "xaxis_title_text" into {"xaxis":{"title":{"text":..}}}.
const std::set<std::string>& layout_containers() {
  static const std::set<std::string> kNames = {"title", "xaxis", "yaxis", "legend", "font", "margin", "hoverlabel"};
  return kNames;
}

const std::set<std::string>& trace_containers() {
  static const std::set<std::string> kNames = {"marker", "line", "textfont", "hoverlabel"};
  return kNames;
}

std::vector<std::string> split_path(const std::string& key, const std::set<std::string>& containers) {
  const auto first = key.find('_');
  if (first == std::string::npos || containers.count(key.substr(0, first)) == 0) return {key};
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = key.find('_', start);
    parts.push_back(key.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return parts;
}

void merge_into(jsonlite::Object& dst, const std::string& key, jsonlite::Value value) {
  // A bare string title means {"text": title}.
  if (key == "title" && value.is_string()) {
    jsonlite::Object t;
    t["text"] = std::move(value);
    value = jsonlite::Value(std::move(t));
  }
  auto it = dst.find(key);
  if (it != dst.end() && it->second.is_object() && value.is_object()) {
    auto& target = std::get<jsonlite::Object>(it->second.v);
    for (auto& [k, v] : std::get<jsonlite::Object>(value.v)) merge_into(target, k, std::move(v));
    return;
  }
  dst[key] = std::move(value);
}

void set_path(jsonlite::Object& dst, const std::vector<std::string>& path, jsonlite::Value value) {
  jsonlite::Object* node = &dst;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    auto& slot = (*node)[path[i]];
    if (!slot.is_object()) slot = jsonlite::Value(jsonlite::Object{});
    node = &std::get<jsonlite::Object>(slot.v);
  }
  merge_into(*node, path.back(), std::move(value));
}

void apply_updates(Interpreter& interp, jsonlite::Object& target, const CallArgs& args, const char* fn,
                   const std::set<std::string>& containers) {
  if (args.positional.size() > 1) throw_type_error(std::string(fn) + "() takes at most 1 positional argument");
  if (!args.positional.empty()) {
    auto dict = args.positional.front().as<DictObject>();
    if (!dict) throw_type_error(std::string(fn) + "() expects a dict of properties");
    for (const auto& [k, v] : dict->entries()) set_path(target, split_path(str(k), containers), to_json_value(v));
  }
  for (const auto& [k, v] : args.keywords) {
    interp.check_interrupts();
    set_path(target, split_path(k, containers), to_json_value(v));
  }
}

// One plotted dimension: a column of the frame, a Series, or a sequence.
struct Axis {
  bool present{false};
  std::string label;
  std::vector<Value> values;
};

Axis resolve_axis(Interpreter& interp, const std::shared_ptr<FrameObject>& frame, const ArgBinder& args,
                  std::size_t idx, const char* role) {
  Axis axis;
  if (!args.has(idx) || args.get(idx).is_none()) return axis;
  const Value& spec = args.get(idx);
  axis.present = true;
  if (spec.is_str()) {
    if (!frame) throw_value_error(std::string(role) + "='" + spec.as_str() + "' requires a data_frame");
    const Column* c = frame->data.column(spec.as_str());
    if (c == nullptr) {
      throw_value_error("Value of '" + std::string(role) + "' is not the name of a column in 'data_frame'. Got: " +
                        spec.as_str());
    }
    axis.label = c->name;
    SeriesObject view(*c);
    axis.values.reserve(view.size());
    for (std::size_t r = 0; r < view.size(); ++r) axis.values.push_back(view.at(r));
    return axis;
  }
  if (auto s = spec.as<SeriesObject>()) {
    axis.label = s->data.name;
    for (std::size_t r = 0; r < s->size(); ++r) axis.values.push_back(s->at(r));
    return axis;
  }
  if (spec.as<ListObject>() || spec.as<TupleObject>() || spec.as<RangeObject>()) {
    axis.values = interp.to_vector(spec);
    return axis;
  }
  throw_type_error(std::string(role) + " must be a column name, a Series or a list");
}

jsonlite::Value json_array(const std::vector<Value>& values, const std::vector<std::size_t>* rows = nullptr) {
  jsonlite::Array out;
  if (rows == nullptr) {
    out.reserve(values.size());
    for (const auto& v : values) out.push_back(to_json_value(v));
  } else {
    out.reserve(rows->size());
    for (std::size_t r : *rows) out.push_back(to_json_value(values[r]));
  }
  return jsonlite::Value(std::move(out));
}

std::shared_ptr<FrameObject> frame_arg(const ArgBinder& args) {
  if (!args.has(0) || args.get(0).is_none()) return nullptr;
  auto frame = args.get(0).as<FrameObject>();
  if (!frame) throw_type_error("data_frame must be a DataFrame");
  return frame;
}

std::string display_label(const Value& labels, const std::string& name) {
  if (auto d = labels.as<DictObject>()) {
    if (const Value* v = d->find(Value(name))) return str(*v);
  }
  return name;
}

void require_same_length(const Axis& a, const Axis& b, const char* what) {
  if (a.present && b.present && a.values.size() != b.values.size()) {
    throw_value_error(std::string("All arguments should have the same length (") + what + ")");
  }
}

// Row groups for `color=`: one trace per distinct value, in first-seen order.
std::vector<std::pair<std::string, std::vector<std::size_t>>> color_groups(const Axis& color, std::size_t n) {
  std::vector<std::pair<std::string, std::vector<std::size_t>>> groups;
  if (!color.present) {
    std::vector<std::size_t> rows(n);
    for (std::size_t i = 0; i < n; ++i) rows[i] = i;
    groups.emplace_back("", std::move(rows));
    return groups;
  }
  std::unordered_map<std::string, std::size_t> lookup;
  for (std::size_t r = 0; r < n && r < color.values.size(); ++r) {
    auto [it, inserted] = lookup.emplace(hash_key(color.values[r]), groups.size());
    if (inserted) groups.emplace_back(str(color.values[r]), std::vector<std::size_t>{});
    groups[it->second].second.push_back(r);
  }
  return groups;
}

void apply_common_layout(FigureObject& fig, const ArgBinder& args, std::size_t title_idx, const Value& labels,
                         const Axis* x, const Axis* y) {
  jsonlite::Object& layout = fig.layout();
  if (args.has(title_idx) && !args.get(title_idx).is_none()) {
    merge_into(layout, "title", jsonlite::Value(str(args.get(title_idx))));
  }
  if (x != nullptr && !x->label.empty()) set_path(layout, {"xaxis", "title"}, display_label(labels, x->label));
  if (y != nullptr && !y->label.empty()) set_path(layout, {"yaxis", "title"}, display_label(labels, y->label));
}

void apply_size(FigureObject& fig, const ArgBinder& args, std::size_t width_idx) {
  if (args.has(width_idx)) fig.layout()["width"] = to_json_value(args.get(width_idx));
  if (args.has(width_idx + 1)) fig.layout()["height"] = to_json_value(args.get(width_idx + 1));
}

// bar / line / scatter share one shape: x, y, optional color split.
Value xy_chart(Interpreter& interp, CallArgs& a, const std::string& kind) {
  ArgBinder args("chart." + kind, a,
                 {"data_frame", "x", "y", "color", "title", "labels", "width", "height", "orientation", "size",
                  "markers", "barmode"});
  interp.check_interrupts();
  const auto frame = frame_arg(args);
  const Axis x = resolve_axis(interp, frame, args, 1, "x");
  const Axis y = resolve_axis(interp, frame, args, 2, "y");
  const Axis color = resolve_axis(interp, frame, args, 3, "color");
  const Axis size = resolve_axis(interp, frame, args, 9, "size");
  if (!x.present && !y.present) throw_value_error("chart." + kind + "() needs x or y");
  require_same_length(x, y, "x and y");
  require_same_length(x.present ? x : y, color, "color");
  const std::size_t n = x.present ? x.values.size() : y.values.size();
  interp.check_size(n);

  auto fig = std::make_shared<FigureObject>();
  for (const auto& [name, rows] : color_groups(color, n)) {
    jsonlite::Object trace;
    if (kind == "bar") {
      trace["type"] = "bar";
      if (args.has(8) && !args.get(8).is_none()) trace["orientation"] = str(args.get(8));
    } else {
      trace["type"] = "scatter";
      std::string mode = kind == "line" ? "lines" : "markers";
      if (kind == "line" && truthy(args.get_or(10, Value(false)))) mode = "lines+markers";
      trace["mode"] = mode;
    }
    if (x.present) trace["x"] = json_array(x.values, &rows);
    if (y.present) trace["y"] = json_array(y.values, &rows);
    if (size.present) {
      require_same_length(x.present ? x : y, size, "size");
      jsonlite::Object marker;
      marker["size"] = json_array(size.values, &rows);
      trace["marker"] = std::move(marker);
    }
    if (color.present) {
      trace["name"] = name;
      trace["legendgroup"] = name;
    }
    fig->traces().emplace_back(std::move(trace));
  }
  const Value labels = args.get_or(5, Value());
  apply_common_layout(*fig, args, 4, labels, &x, &y);
  apply_size(*fig, args, 6);
  if (color.present && !color.label.empty()) {
    set_path(fig->layout(), {"legend", "title"}, display_label(labels, color.label));
  }
  if (args.has(11)) fig->layout()["barmode"] = to_json_value(args.get(11));
  return Value(fig);
}

Value histogram_chart(Interpreter& interp, CallArgs& a) {
  ArgBinder args("chart.histogram", a, {"data_frame", "x", "nbins", "color", "title", "labels", "width", "height"});
  interp.check_interrupts();
  const auto frame = frame_arg(args);
  const Axis x = resolve_axis(interp, frame, args, 1, "x");
  const Axis color = resolve_axis(interp, frame, args, 3, "color");
  if (!x.present) throw_value_error("chart.histogram() needs x");
  require_same_length(x, color, "color");
  auto fig = std::make_shared<FigureObject>();
  for (const auto& [name, rows] : color_groups(color, x.values.size())) {
    jsonlite::Object trace;
    trace["type"] = "histogram";
    trace["x"] = json_array(x.values, &rows);
    if (args.has(2) && !args.get(2).is_none()) {
      const std::int64_t bins = to_int(args.get(2), "nbins must be an integer");
      if (bins <= 0) throw_value_error("nbins must be positive");
      trace["nbinsx"] = bins;
    }
    if (color.present) trace["name"] = name;
    fig->traces().emplace_back(std::move(trace));
  }
  const Value labels = args.get_or(5, Value());
  apply_common_layout(*fig, args, 4, labels, &x, nullptr);
  if (color.present) fig->layout()["barmode"] = "overlay";
  apply_size(*fig, args, 6);
  return Value(fig);
}

Value pie_chart(Interpreter& interp, CallArgs& a) {
  ArgBinder args("chart.pie", a, {"data_frame", "names", "values", "title", "hole", "width", "height"});
  interp.check_interrupts();
  const auto frame = frame_arg(args);
  const Axis names = resolve_axis(interp, frame, args, 1, "names");
  const Axis values = resolve_axis(interp, frame, args, 2, "values");
  if (!values.present) throw_value_error("chart.pie() needs values");
  require_same_length(names, values, "names and values");
  jsonlite::Object trace;
  trace["type"] = "pie";
  trace["values"] = json_array(values.values);
  if (names.present) trace["labels"] = json_array(names.values);
  if (args.has(4)) trace["hole"] = to_double(args.get(4), "hole must be a number");
  auto fig = std::make_shared<FigureObject>();
  fig->traces().emplace_back(std::move(trace));
  apply_common_layout(*fig, args, 3, Value(), nullptr, nullptr);
  apply_size(*fig, args, 5);
  return Value(fig);
}

Value box_chart(Interpreter& interp, CallArgs& a) {
  ArgBinder args("chart.box", a, {"data_frame", "x", "y", "title", "labels", "width", "height"});
  interp.check_interrupts();
  const auto frame = frame_arg(args);
  const Axis x = resolve_axis(interp, frame, args, 1, "x");
  const Axis y = resolve_axis(interp, frame, args, 2, "y");
  if (!y.present && !x.present) throw_value_error("chart.box() needs x or y");
  require_same_length(x, y, "x and y");
  jsonlite::Object trace;
  trace["type"] = "box";
  if (x.present) trace["x"] = json_array(x.values);
  if (y.present) trace["y"] = json_array(y.values);
  auto fig = std::make_shared<FigureObject>();
  fig->traces().emplace_back(std::move(trace));
  apply_common_layout(*fig, args, 3, args.get_or(4, Value()), &x, &y);
  apply_size(*fig, args, 5);
  return Value(fig);
}

Value table_chart(Interpreter& interp, CallArgs& a) {
  ArgBinder args("chart.table", a, {"data_frame", "title", "width", "height"}, 1);
  interp.check_interrupts();
  const Value& source = args.get(0);
  if (!source.as<FrameObject>() && !source.as<SeriesObject>()) {
    throw_type_error("chart.table() expects a DataFrame or Series");
  }
  // Reuse the artifact rendering: {"columns":[...],"rows":[[...]]}.
  const jsonlite::Value rendered = to_json_value(source);
  const auto& obj = std::get<jsonlite::Object>(rendered.v);
  const auto& columns = std::get<jsonlite::Array>(obj.at("columns").v);
  const auto& rows = std::get<jsonlite::Array>(obj.at("rows").v);
  jsonlite::Array cells(columns.size(), jsonlite::Value(jsonlite::Array{}));
  for (const auto& row : rows) {
    const auto& r = std::get<jsonlite::Array>(row.v);
    for (std::size_t c = 0; c < r.size() && c < cells.size(); ++c) {
      std::get<jsonlite::Array>(cells[c].v).push_back(r[c]);
    }
  }
  jsonlite::Object header;
  header["values"] = jsonlite::Value(columns);
  jsonlite::Object cell_block;
  cell_block["values"] = jsonlite::Value(std::move(cells));
  jsonlite::Object trace;
  trace["type"] = "table";
  trace["header"] = std::move(header);
  trace["cells"] = std::move(cell_block);
  auto fig = std::make_shared<FigureObject>();
  fig->traces().emplace_back(std::move(trace));
  apply_common_layout(*fig, args, 1, Value(), nullptr, nullptr);
  apply_size(*fig, args, 2);
  return Value(fig);
}

Value figure_constructor(Interpreter& interp, CallArgs& a) {
  ArgBinder args("chart.Figure", a, {"data", "layout"});
  auto fig = std::make_shared<FigureObject>();
  if (args.has(0) && !args.get(0).is_none()) {
    interp.for_each(args.get(0), [&](const Value& trace) {
      if (!trace.as<DictObject>()) throw_type_error("Figure data must be a list of trace dicts");
      fig->traces().push_back(to_json_value(trace));
      return true;
    });
  }
  if (args.has(1) && !args.get(1).is_none()) {
    auto layout = args.get(1).as<DictObject>();
    if (!layout) throw_type_error("Figure layout must be a dict");
    for (const auto& [k, v] : layout->entries()) merge_into(fig->layout(), str(k), to_json_value(v));
  }
  return Value(fig);
}

}  // namespace

FigureObject::FigureObject() {
  spec["data"] = jsonlite::Value(jsonlite::Array{});
  spec["layout"] = jsonlite::Value(jsonlite::Object{});
}

jsonlite::Array& FigureObject::traces() { return std::get<jsonlite::Array>(spec["data"].v); }
jsonlite::Object& FigureObject::layout() { return std::get<jsonlite::Object>(spec["layout"].v); }

std::string FigureObject::repr(int) const {
  const auto& data = std::get<jsonlite::Array>(spec.at("data").v);
  std::string kinds;
  for (const auto& t : data) {
    if (!t.is_object()) continue;
    const auto& obj = std::get<jsonlite::Object>(t.v);
    if (!kinds.empty()) kinds += ", ";
    kinds += jsonlite::get_string(obj, "type", "?");
  }
  return "Figure(traces=[" + kinds + "])";
}

std::optional<jsonlite::Value> FigureObject::to_json(int) const { return jsonlite::Value(spec); }

std::optional<Value> FigureObject::attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<FigureObject>(self);
  if (name == "data") return from_json_value(interp, spec.at("data"));
  if (name == "layout") return from_json_value(interp, spec.at("layout"));
  if (name == "update_layout") {
    return Value(make_native("Figure.update_layout", [me](Interpreter& in, CallArgs& a) {
      apply_updates(in, me->layout(), a, "update_layout", layout_containers());
      return Value(me);
    }));
  }
  if (name == "update_traces") {
    return Value(make_native("Figure.update_traces", [me](Interpreter& in, CallArgs& a) {
      for (auto& trace : me->traces()) {
        if (!trace.is_object()) continue;
        apply_updates(in, std::get<jsonlite::Object>(trace.v), a, "update_traces", trace_containers());
      }
      return Value(me);
    }));
  }
  if (name == "update_xaxes" || name == "update_yaxes") {
    const std::string axis = name == "update_xaxes" ? "xaxis" : "yaxis";
    return Value(make_native("Figure." + name, [me, axis](Interpreter& in, CallArgs& a) {
      auto& slot = me->layout()[axis];
      if (!slot.is_object()) slot = jsonlite::Value(jsonlite::Object{});
      apply_updates(in, std::get<jsonlite::Object>(slot.v), a, "update_axes", layout_containers());
      return Value(me);
    }));
  }
  if (name == "add_trace") {
    return Value(make_native("Figure.add_trace", [me](Interpreter&, CallArgs& a) {
      ArgBinder args("Figure.add_trace", a, {"trace"}, 1);
      if (auto other = args.get(0).as<FigureObject>()) {
        for (const auto& t : other->traces()) me->traces().push_back(t);
      } else if (args.get(0).as<DictObject>()) {
        me->traces().push_back(to_json_value(args.get(0)));
      } else {
        throw_type_error("add_trace() expects a trace dict or a Figure");
      }
      return Value(me);
    }));
  }
  if (name == "add_annotation") {
    return Value(make_native("Figure.add_annotation", [me](Interpreter& in, CallArgs& a) {
      jsonlite::Object note;
      apply_updates(in, note, a, "add_annotation", trace_containers());
      auto& slot = me->layout()["annotations"];
      if (!slot.is_array()) slot = jsonlite::Value(jsonlite::Array{});
      std::get<jsonlite::Array>(slot.v).emplace_back(std::move(note));
      return Value(me);
    }));
  }
  if (name == "to_dict") {
    return Value(make_native("Figure.to_dict", [me](Interpreter& in, CallArgs& a) {
      ArgBinder("Figure.to_dict", a, {});
      return from_json_value(in, jsonlite::Value(me->spec));
    }));
  }
  if (name == "to_json") {
    return Value(make_native("Figure.to_json", [me](Interpreter&, CallArgs& a) {
      ArgBinder("Figure.to_json", a, {});
      return Value(jsonlite::to_json(jsonlite::Value(me->spec)));
    }));
  }
  // Rendering is the caller's job; show() only exists so scripts written
  // for interactive use still run.
  if (name == "show") {
    return Value(make_native("Figure.show", [](Interpreter&, CallArgs&) { return Value(); }));
  }
  return std::nullopt;
}

std::map<std::string, Value> chart_module_members() {
  std::map<std::string, Value> m;
  for (const char* kind : {"bar", "line", "scatter"}) {
    const std::string k = kind;
    m[k] = Value(make_native("chart." + k, [k](Interpreter& in, CallArgs& a) { return xy_chart(in, a, k); }));
  }
  m["histogram"] = Value(make_native("chart.histogram", histogram_chart));
  m["pie"] = Value(make_native("chart.pie", pie_chart));
  m["box"] = Value(make_native("chart.box", box_chart));
  m["table"] = Value(make_native("chart.table", table_chart));
  m["Figure"] = Value(make_native("chart.Figure", figure_constructor));
  return m;
}

}  // namespace cordon
