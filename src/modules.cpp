#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>

#include "cordon/figure.hpp"
#include "cordon/frame.hpp"
#include "cordon/interpreter.hpp"
#include "cordon/library.hpp"

namespace cordon {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

using Members = std::map<std::string, Value>;

Value fn(const std::string& name, NativeFn f) { return Value(make_native(name, std::move(f))); }

double nan_value() { return std::numeric_limits<double>::quiet_NaN(); }

// numeric.* reductions ignore NaN the way the column reductions do.
std::vector<double> drop_nan(std::vector<double> v) {
  v.erase(std::remove_if(v.begin(), v.end(), [](double d) { return std::isnan(d); }), v.end());
  return v;
}

Value elementwise(Interpreter& interp, const Value& x, const std::function<double(double)>& f, const char* name) {
  if (x.is_number()) return Value(f(to_double(x, "")));
  if (auto s = x.as<SeriesObject>()) {
    const std::vector<double> values = numeric_values(interp, x, false);
    std::vector<double> out(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
      if ((i & 1023) == 0) interp.check_interrupts();
      out[i] = std::isnan(values[i]) ? values[i] : f(values[i]);
    }
    Column c = Column::numeric(s->data.name, std::move(out));
    return Value(std::make_shared<SeriesObject>(std::move(c), s->index));
  }
  std::vector<Value> out;
  interp.for_each(x, [&](const Value& v) {
    out.push_back(Value(f(to_double(v, std::string(name) + "() expects numbers"))));
    return true;
  });
  return Value(interp.new_list(std::move(out)));
}

Value numbers_list(Interpreter& interp, const std::vector<double>& values) {
  std::vector<Value> out;
  out.reserve(values.size());
  for (double d : values) out.push_back(Value(d));
  return Value(interp.new_list(std::move(out)));
}

// -- numeric ----------------------------------------------------------------

Members numeric_members() {
  Members m;
  auto reduction = [](const std::string& name, double (*f)(const std::vector<double>&)) {
    return fn("numeric." + name, [name, f](Interpreter& in, CallArgs& a) {
      ArgBinder args("numeric." + name, a, {"a"}, 1);
      return Value(f(drop_nan(numeric_values(in, args.get(0)))));
    });
  };
  m["mean"] = reduction("mean", stats::mean);
  m["sum"] = reduction("sum", stats::sum);
  m["min"] = reduction("min", stats::min);
  m["max"] = reduction("max", stats::max);
  m["median"] = fn("numeric.median", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.median", a, {"a"}, 1);
    return Value(stats::median(drop_nan(numeric_values(in, args.get(0)))));
  });
  m["std"] = fn("numeric.std", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.std", a, {"a", "ddof"}, 1);
    const int ddof = static_cast<int>(to_int(args.get_or(1, Value(0)), "ddof must be an integer"));
    return Value(stats::stddev(drop_nan(numeric_values(in, args.get(0))), ddof));
  });
  m["var"] = fn("numeric.var", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.var", a, {"a", "ddof"}, 1);
    const int ddof = static_cast<int>(to_int(args.get_or(1, Value(0)), "ddof must be an integer"));
    return Value(stats::variance(drop_nan(numeric_values(in, args.get(0))), ddof));
  });
  m["percentile"] = fn("numeric.percentile", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.percentile", a, {"a", "q"}, 2);
    const std::vector<double> values = drop_nan(numeric_values(in, args.get(0)));
    auto one = [&](const Value& q) {
      const double p = to_double(q, "percentile q must be a number");
      if (!(p >= 0.0 && p <= 100.0)) throw_value_error("Percentiles must be in the range [0, 100]");
      return stats::quantile(values, p / 100.0);
    };
    if (args.get(1).is_number()) return Value(one(args.get(1)));
    std::vector<double> out;
    in.for_each(args.get(1), [&](const Value& q) {
      out.push_back(one(q));
      return true;
    });
    return numbers_list(in, out);
  });

  auto unary = [](const std::string& name, double (*f)(double)) {
    return fn("numeric." + name, [name, f](Interpreter& in, CallArgs& a) {
      ArgBinder args("numeric." + name, a, {"x"}, 1);
      return elementwise(in, args.get(0), f, name.c_str());
    });
  };
  m["sqrt"] = unary("sqrt", [](double d) { return std::sqrt(d); });
  m["log"] = unary("log", [](double d) { return std::log(d); });
  m["log10"] = unary("log10", [](double d) { return std::log10(d); });
  m["exp"] = unary("exp", [](double d) { return std::exp(d); });
  m["abs"] = unary("abs", [](double d) { return std::fabs(d); });
  m["floor"] = unary("floor", [](double d) { return std::floor(d); });
  m["ceil"] = unary("ceil", [](double d) { return std::ceil(d); });
  m["round"] = fn("numeric.round", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.round", a, {"x", "decimals"}, 1);
    const double scale = std::pow(10.0, static_cast<double>(to_int(args.get_or(1, Value(0)), "decimals must be an integer")));
    return elementwise(in, args.get(0), [scale](double d) {
      const double scaled = d * scale;
      return std::isfinite(scaled) ? std::nearbyint(scaled) / scale : d;
    }, "round");
  });
  m["clip"] = fn("numeric.clip", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.clip", a, {"x", "a_min", "a_max"}, 3);
    const double lo = args.get(1).is_none() ? -std::numeric_limits<double>::infinity() : to_double(args.get(1), "a_min");
    const double hi = args.get(2).is_none() ? std::numeric_limits<double>::infinity() : to_double(args.get(2), "a_max");
    if (lo > hi) throw_value_error("clip: a_min must not exceed a_max");
    return elementwise(in, args.get(0), [lo, hi](double d) { return std::min(std::max(d, lo), hi); }, "clip");
  });
  m["isnan"] = fn("numeric.isnan", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.isnan", a, {"x"}, 1);
    const Value& x = args.get(0);
    if (x.is_none()) return Value(true);
    if (x.is_number()) return Value(std::isnan(to_double(x, "")));
    if (auto s = x.as<SeriesObject>()) {
      std::vector<std::uint8_t> out(s->size());
      for (std::size_t r = 0; r < s->size(); ++r) out[r] = s->data.is_missing(r) ? 1 : 0;
      return Value(std::make_shared<SeriesObject>(Column::boolean(s->data.name, std::move(out)), s->index));
    }
    std::vector<Value> out;
    in.for_each(x, [&](const Value& v) {
      out.push_back(Value(v.is_none() || (v.is_float() && std::isnan(v.as_float()))));
      return true;
    });
    return Value(in.new_list(std::move(out)));
  });
  m["cumsum"] = fn("numeric.cumsum", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.cumsum", a, {"a"}, 1);
    std::vector<double> values = numeric_values(in, args.get(0), false);
    double running = 0.0;
    for (double& d : values) {
      running += d;
      d = running;
    }
    if (auto s = args.get(0).as<SeriesObject>()) {
      return Value(std::make_shared<SeriesObject>(Column::numeric(s->data.name, std::move(values)), s->index));
    }
    return numbers_list(in, values);
  });
  m["arange"] = fn("numeric.arange", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.arange", a, {"start", "stop", "step"}, 1);
    Value start = args.get(0);
    Value stop = args.get_or(1, Value());
    if (stop.is_none()) {
      stop = start;
      start = Value(0);
    }
    const Value step = args.get_or(2, Value(1));
    const bool integral = start.is_int() && stop.is_int() && step.is_int();
    const double s0 = to_double(start, "arange start");
    const double s1 = to_double(stop, "arange stop");
    const double st = to_double(step, "arange step");
    if (st == 0.0) throw_value_error("arange: step must not be zero");
    const double count = std::ceil((s1 - s0) / st);
    const std::size_t n = count > 0 ? static_cast<std::size_t>(std::min(count, 1e15)) : 0;
    in.check_size(n);
    std::vector<Value> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      if ((i & 1023) == 0) in.check_interrupts();
      if (integral) out.push_back(Value(start.as_int() + static_cast<std::int64_t>(i) * step.as_int()));
      else out.push_back(Value(s0 + static_cast<double>(i) * st));
    }
    return Value(in.new_list(std::move(out)));
  });
  m["linspace"] = fn("numeric.linspace", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("numeric.linspace", a, {"start", "stop", "num"}, 2);
    const double s0 = to_double(args.get(0), "linspace start");
    const double s1 = to_double(args.get(1), "linspace stop");
    const std::int64_t num = to_int(args.get_or(2, Value(50)), "linspace num must be an integer");
    if (num < 0) throw_value_error("Number of samples must be non-negative");
    in.check_size(static_cast<std::size_t>(num));
    std::vector<double> out(static_cast<std::size_t>(num));
    for (std::int64_t i = 0; i < num; ++i) {
      out[static_cast<std::size_t>(i)] = num == 1 ? s0 : s0 + (s1 - s0) * static_cast<double>(i) / static_cast<double>(num - 1);
    }
    return numbers_list(in, out);
  });
  m["pi"] = Value(kPi);
  m["e"] = Value(kE);
  m["nan"] = Value(nan_value());
  m["inf"] = Value(std::numeric_limits<double>::infinity());
  return m;
}

// -- math -------------------------------------------------------------------

double math_domain(double result, double input) {
  if (std::isnan(result) && !std::isnan(input)) throw_value_error("math domain error");
  return result;
}

Members math_members() {
  Members m;
  auto unary = [](const std::string& name, double (*f)(double)) {
    return fn("math." + name, [name, f](Interpreter&, CallArgs& a) {
      ArgBinder args("math." + name, a, {"x"}, 1);
      const double x = to_double(args.get(0), "must be real number");
      return Value(math_domain(f(x), x));
    });
  };
  m["sqrt"] = fn("math.sqrt", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.sqrt", a, {"x"}, 1);
    const double x = to_double(args.get(0), "must be real number");
    if (x < 0) throw_value_error("math domain error");
    return Value(std::sqrt(x));
  });
  m["log"] = fn("math.log", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.log", a, {"x", "base"}, 1);
    const double x = to_double(args.get(0), "must be real number");
    if (x <= 0) throw_value_error("math domain error");
    if (!args.has(1)) return Value(std::log(x));
    const double base = to_double(args.get(1), "must be real number");
    if (base <= 0 || base == 1.0) throw_value_error("math domain error");
    return Value(std::log(x) / std::log(base));
  });
  for (const char* name : {"log10", "log2"}) {
    const std::string n = name;
    m[n] = fn("math." + n, [n](Interpreter&, CallArgs& a) {
      ArgBinder args("math." + n, a, {"x"}, 1);
      const double x = to_double(args.get(0), "must be real number");
      if (x <= 0) throw_value_error("math domain error");
      return Value(n == "log10" ? std::log10(x) : std::log2(x));
    });
  }
  m["exp"] = unary("exp", [](double d) { return std::exp(d); });
  m["fabs"] = unary("fabs", [](double d) { return std::fabs(d); });
  m["sin"] = unary("sin", [](double d) { return std::sin(d); });
  m["cos"] = unary("cos", [](double d) { return std::cos(d); });
  m["tan"] = unary("tan", [](double d) { return std::tan(d); });
  m["asin"] = unary("asin", [](double d) { return std::asin(d); });
  m["acos"] = unary("acos", [](double d) { return std::acos(d); });
  m["atan"] = unary("atan", [](double d) { return std::atan(d); });
  m["radians"] = unary("radians", [](double d) { return d * kPi / 180.0; });
  m["degrees"] = unary("degrees", [](double d) { return d * 180.0 / kPi; });
  for (const char* name : {"floor", "ceil", "trunc"}) {
    const std::string n = name;
    m[n] = fn("math." + n, [n](Interpreter&, CallArgs& a) {
      ArgBinder args("math." + n, a, {"x"}, 1);
      if (args.get(0).is_int()) return args.get(0);
      const double x = to_double(args.get(0), "must be real number");
      const double r = n == "floor" ? std::floor(x) : n == "ceil" ? std::ceil(x) : std::trunc(x);
      if (!std::isfinite(r)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
      if (std::fabs(r) >= 9.2e18) throw ScriptError("OverflowError", "int too large");
      return Value(static_cast<std::int64_t>(r));
    });
  }
  m["pow"] = fn("math.pow", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.pow", a, {"x", "y"}, 2);
    const double x = to_double(args.get(0), "must be real number");
    const double y = to_double(args.get(1), "must be real number");
    return Value(math_domain(std::pow(x, y), x + y));
  });
  m["atan2"] = fn("math.atan2", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.atan2", a, {"y", "x"}, 2);
    return Value(std::atan2(to_double(args.get(0), "must be real number"), to_double(args.get(1), "must be real number")));
  });
  m["hypot"] = fn("math.hypot", [](Interpreter&, CallArgs& a) {
    double acc = 0.0;
    if (!a.keywords.empty()) throw_type_error("hypot() takes no keyword arguments");
    for (const auto& v : a.positional) {
      const double d = to_double(v, "must be real number");
      acc += d * d;
    }
    return Value(std::sqrt(acc));
  });
  m["isnan"] = fn("math.isnan", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.isnan", a, {"x"}, 1);
    return Value(std::isnan(to_double(args.get(0), "must be real number")));
  });
  m["isinf"] = fn("math.isinf", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.isinf", a, {"x"}, 1);
    return Value(std::isinf(to_double(args.get(0), "must be real number")));
  });
  m["isfinite"] = fn("math.isfinite", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.isfinite", a, {"x"}, 1);
    return Value(std::isfinite(to_double(args.get(0), "must be real number")));
  });
  m["isclose"] = fn("math.isclose", [](Interpreter&, CallArgs& a) {
    ArgBinder args("math.isclose", a, {"a", "b", "rel_tol", "abs_tol"}, 2);
    const double x = to_double(args.get(0), "must be real number");
    const double y = to_double(args.get(1), "must be real number");
    const double rel = to_double(args.get_or(2, Value(1e-9)), "rel_tol");
    const double abs_tol = to_double(args.get_or(3, Value(0.0)), "abs_tol");
    if (x == y) return Value(true);
    const double diff = std::fabs(x - y);
    return Value(diff <= std::max(rel * std::max(std::fabs(x), std::fabs(y)), abs_tol));
  });
  m["fsum"] = fn("math.fsum", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("math.fsum", a, {"iterable"}, 1);
    // Kahan summation.
    double sum = 0.0;
    double c = 0.0;
    in.for_each(args.get(0), [&](const Value& v) {
      const double y = to_double(v, "must be real number") - c;
      const double t = sum + y;
      c = (t - sum) - y;
      sum = t;
      return true;
    });
    return Value(sum);
  });
  m["pi"] = Value(kPi);
  m["e"] = Value(kE);
  m["tau"] = Value(2 * kPi);
  m["inf"] = Value(std::numeric_limits<double>::infinity());
  m["nan"] = Value(nan_value());
  return m;
}

// -- statistics --------------------------------------------------------------

[[noreturn]] void statistics_error(const std::string& message) { throw ScriptError("StatisticsError", message); }

std::vector<double> sample(Interpreter& in, const Value& data, std::size_t at_least, const char* what) {
  std::vector<double> v = numeric_values(in, data);
  if (v.size() < at_least) {
    statistics_error(std::string(what) + (at_least == 1 ? " requires at least one data point"
                                                        : " requires at least two data points"));
  }
  return v;
}

Members statistics_members() {
  Members m;
  m["mean"] = fn("statistics.mean", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.mean", a, {"data"}, 1);
    return Value(stats::mean(sample(in, args.get(0), 1, "mean")));
  });
  m["fmean"] = m["mean"];
  m["median"] = fn("statistics.median", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.median", a, {"data"}, 1);
    return Value(stats::median(sample(in, args.get(0), 1, "median")));
  });
  m["median_low"] = fn("statistics.median_low", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.median_low", a, {"data"}, 1);
    std::vector<double> v = sample(in, args.get(0), 1, "median_low");
    std::sort(v.begin(), v.end());
    return Value(v[(v.size() - 1) / 2]);
  });
  m["median_high"] = fn("statistics.median_high", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.median_high", a, {"data"}, 1);
    std::vector<double> v = sample(in, args.get(0), 1, "median_high");
    std::sort(v.begin(), v.end());
    return Value(v[v.size() / 2]);
  });
  m["mode"] = fn("statistics.mode", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.mode", a, {"data"}, 1);
    const std::vector<Value> items = in.to_vector(args.get(0));
    if (items.empty()) statistics_error("no mode for empty data");
    std::unordered_map<std::string, std::size_t> counts;
    std::size_t best = 0;
    std::size_t best_count = 0;
    for (std::size_t i = 0; i < items.size(); ++i) {
      const std::size_t c = ++counts[hash_key(items[i])];
      if (c > best_count) {
        best = i;
        best_count = c;
      }
    }
    return items[best];
  });
  m["stdev"] = fn("statistics.stdev", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.stdev", a, {"data"}, 1);
    return Value(stats::stddev(sample(in, args.get(0), 2, "stdev"), 1));
  });
  m["variance"] = fn("statistics.variance", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.variance", a, {"data"}, 1);
    return Value(stats::variance(sample(in, args.get(0), 2, "variance"), 1));
  });
  m["pstdev"] = fn("statistics.pstdev", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.pstdev", a, {"data"}, 1);
    return Value(stats::stddev(sample(in, args.get(0), 1, "pstdev"), 0));
  });
  m["pvariance"] = fn("statistics.pvariance", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.pvariance", a, {"data"}, 1);
    return Value(stats::variance(sample(in, args.get(0), 1, "pvariance"), 0));
  });
  m["quantiles"] = fn("statistics.quantiles", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.quantiles", a, {"data", "n"}, 1);
    const std::vector<double> v = sample(in, args.get(0), 2, "quantiles");
    const std::int64_t n = to_int(args.get_or(1, Value(4)), "n must be an integer");
    if (n < 1) statistics_error("n must be at least 1");
    in.check_size(static_cast<std::size_t>(n - 1));
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(n - 1));
    for (std::int64_t i = 1; i < n; ++i) {
      in.check_interrupts();
      out.push_back(stats::quantile(v, static_cast<double>(i) / static_cast<double>(n)));
    }
    return numbers_list(in, out);
  });
  m["correlation"] = fn("statistics.correlation", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("statistics.correlation", a, {"x", "y"}, 2);
    const std::vector<double> x = numeric_values(in, args.get(0));
    const std::vector<double> y = numeric_values(in, args.get(1));
    if (x.size() != y.size()) statistics_error("correlation requires that both inputs have same number of data points");
    if (x.size() < 2) statistics_error("correlation requires at least two data points");
    const double mx = stats::mean(x);
    const double my = stats::mean(y);
    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
      sxy += (x[i] - mx) * (y[i] - my);
      sxx += (x[i] - mx) * (x[i] - mx);
      syy += (y[i] - my) * (y[i] - my);
    }
    if (sxx == 0.0 || syy == 0.0) statistics_error("at least one of the inputs is constant");
    return Value(sxy / std::sqrt(sxx * syy));
  });
  m["StatisticsError"] = builtin_catalogue().at("StatisticsError");
  return m;
}

// -- tabular -----------------------------------------------------------------

Value frame_ctor(Interpreter& in, CallArgs& a) {
  ArgBinder args("tabular.frame", a, {"data", "columns"});
  return make_frame(in, args.get_or(0, Value()), args.get_or(1, Value()));
}

Value series_ctor(Interpreter& in, CallArgs& a) {
  ArgBinder args("tabular.series", a, {"data", "name"});
  const Value name = args.get_or(1, Value());
  return make_series(in, args.get_or(0, Value(in.new_list())), name.is_none() ? std::string() : str(name));
}

Members tabular_members() {
  Members m;
  m["frame"] = fn("tabular.frame", frame_ctor);
  m["series"] = fn("tabular.series", series_ctor);
  // Type objects for isinstance(x, tabular.DataFrame).
  m["DataFrame"] = Value(std::make_shared<TypeObject>("DataFrame", frame_ctor));
  m["Series"] = Value(std::make_shared<TypeObject>("Series", series_ctor));
  m["concat"] = fn("tabular.concat", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("tabular.concat", a, {"objs", "ignore_index"}, 1);
    return concat_tables(in, args.get(0));
  });
  m["to_numeric"] = fn("tabular.to_numeric", [](Interpreter& in, CallArgs& a) {
    ArgBinder args("tabular.to_numeric", a, {"arg", "errors"}, 1);
    return to_numeric(in, args.get(0), args.has(1) ? str(args.get(1)) : "raise");
  });
  m["isna"] = fn("tabular.isna", [](Interpreter&, CallArgs& a) {
    ArgBinder args("tabular.isna", a, {"obj"}, 1);
    const Value& v = args.get(0);
    if (auto s = v.as<SeriesObject>()) {
      std::vector<std::uint8_t> out(s->size());
      for (std::size_t r = 0; r < s->size(); ++r) out[r] = s->data.is_missing(r) ? 1 : 0;
      return Value(std::make_shared<SeriesObject>(Column::boolean(s->data.name, std::move(out)), s->index));
    }
    return Value(v.is_none() || (v.is_float() && std::isnan(v.as_float())));
  });
  return m;
}

std::shared_ptr<ModuleObject> build(const std::string& name, Members members) {
  auto module = std::make_shared<ModuleObject>(name);
  module->attrs = std::move(members);
  return module;
}

}  // namespace

const std::set<std::string>& module_names() {
  static const std::set<std::string> kNames = {"numeric", "tabular", "chart", "math", "statistics"};
  return kNames;
}

std::shared_ptr<ModuleObject> instantiate_module(const std::string& name) {
  if (name == "numeric") return build(name, numeric_members());
  if (name == "tabular") return build(name, tabular_members());
  if (name == "chart") return build(name, chart_module_members());
  if (name == "math") return build(name, math_members());
  if (name == "statistics") return build(name, statistics_members());
  return nullptr;
}

}  // namespace cordon
