#include <public/errors.hpp>
#include <public/parameter_space.hpp>

#include "private/smiles.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace basil {

namespace {

const double kDiscreteTolerance = 1e-9;

std::string format_number(double v) {
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream ss;
    ss << std::setprecision(precision) << v;
    if (precision == 17 || std::strtod(ss.str().c_str(), nullptr) == v) {
      return ss.str();
    }
  }
  return std::string();
}

void require(bool condition, const std::string &message) {
  if (!condition) {
    throw ValidationError(message);
  }
}

} // namespace

double ParameterValue::as_number() const {
  if (!_numeric) {
    throw ValidationError("Expected a number but got text '" + _text + "'");
  }
  return _number;
}

const std::string &ParameterValue::as_text() const {
  if (_numeric) {
    throw ValidationError("Expected text but got number " +
                          format_number(_number));
  }
  return _text;
}

std::string ParameterValue::to_string() const {
  return _numeric ? format_number(_number) : _text;
}

json ParameterValue::to_json() const {
  if (_numeric) {
    return json(_number);
  }
  return json(_text);
}

ParameterValue ParameterValue::from_json(const json &j) {
  if (j.is_number()) {
    return ParameterValue(j.get<double>());
  }
  if (j.is_string()) {
    return ParameterValue(j.get<std::string>());
  }
  throw ValidationError("Parameter value must be a number or a string, got " +
                        j.dump());
}

bool ParameterValue::operator==(const ParameterValue &other) const {
  if (_numeric != other._numeric) {
    return false;
  }
  return _numeric ? _number == other._number : _text == other._text;
}

std::string to_string(ParameterKind kind) {
  switch (kind) {
  case ParameterKind::Continuous:
    return "continuous";
  case ParameterKind::Discrete:
    return "discrete";
  case ParameterKind::Categorical:
    return "categorical";
  case ParameterKind::Fixed:
    return "fixed";
  case ParameterKind::Chemistry:
    return "chemistry";
  }
  return "unknown";
}

ParameterKind parameter_kind_from_string(const std::string &name) {
  if (name == "continuous")
    return ParameterKind::Continuous;
  if (name == "discrete")
    return ParameterKind::Discrete;
  if (name == "categorical")
    return ParameterKind::Categorical;
  if (name == "fixed")
    return ParameterKind::Fixed;
  if (name == "chemistry")
    return ParameterKind::Chemistry;
  throw ValidationError("Unknown parameter kind: " + name);
}

Parameter Parameter::continuous(std::string name, double lower, double upper) {
  Parameter p;
  p.name = std::move(name);
  p.kind = ParameterKind::Continuous;
  p.lower = lower;
  p.upper = upper;
  return p;
}

Parameter Parameter::discrete(std::string name, std::vector<double> values) {
  Parameter p;
  p.name = std::move(name);
  p.kind = ParameterKind::Discrete;
  p.values = std::move(values);
  return p;
}

Parameter Parameter::categorical(std::string name,
                                 std::vector<std::string> levels) {
  Parameter p;
  p.name = std::move(name);
  p.kind = ParameterKind::Categorical;
  p.levels = std::move(levels);
  return p;
}

Parameter Parameter::fixed(std::string name, ParameterValue value) {
  Parameter p;
  p.name = std::move(name);
  p.kind = ParameterKind::Fixed;
  p.fixed_value = std::move(value);
  return p;
}

Parameter Parameter::chemistry(std::string name,
                               std::vector<ChemistryCandidate> candidates) {
  Parameter p;
  p.name = std::move(name);
  p.kind = ParameterKind::Chemistry;
  p.candidates = std::move(candidates);
  return p;
}

void Parameter::validate() const {
  require(!name.empty(), "Parameter name must not be empty");
  require(!is_reserved_column_name(name),
          "Parameter name '" + name + "' is reserved");
  const std::string where = "Parameter '" + name + "': ";

  switch (kind) {
  case ParameterKind::Continuous:
    require(std::isfinite(lower) && std::isfinite(upper),
            where + "bounds must be finite");
    require(lower <= upper, where + "lower bound exceeds upper bound");
    require(std::isfinite(upper - lower), where + "bound span is not finite");
    break;
  case ParameterKind::Discrete: {
    require(!values.empty(), where + "discrete values must not be empty");
    std::set<double> seen;
    for (double v : values) {
      require(std::isfinite(v), where + "discrete values must be finite");
      require(seen.insert(v).second,
              where + "duplicate discrete value " + format_number(v));
    }
    require(std::isfinite(*seen.rbegin() - *seen.begin()),
            where + "discrete value span is not finite");
    break;
  }
  case ParameterKind::Categorical: {
    require(!levels.empty(), where + "categorical levels must not be empty");
    std::set<std::string> seen;
    for (const auto &level : levels) {
      require(!level.empty(), where + "categorical level must not be empty");
      require(seen.insert(level).second,
              where + "duplicate categorical level '" + level + "'");
    }
    break;
  }
  case ParameterKind::Fixed:
    if (fixed_value.is_number()) {
      require(std::isfinite(fixed_value.as_number()),
              where + "fixed value must be finite");
    }
    break;
  case ParameterKind::Chemistry: {
    require(!candidates.empty(), where + "candidate pool must not be empty");
    std::set<std::string> seen;
    for (const auto &candidate : candidates) {
      require(!candidate.label.empty(), where + "candidate label is empty");
      require(seen.insert(candidate.label).second,
              where + "duplicate candidate '" + candidate.label + "'");
      std::string error;
      require(detail::parse_smiles(candidate.smiles, error),
              where + "invalid SMILES for '" + candidate.label +
                  "': " + error);
    }
    break;
  }
  }
}

bool Parameter::accepts(const ParameterValue &value) const {
  switch (kind) {
  case ParameterKind::Continuous:
    return value.is_number() && value.as_number() >= lower &&
           value.as_number() <= upper;
  case ParameterKind::Discrete:
    if (!value.is_number()) {
      return false;
    }
    return std::any_of(values.begin(), values.end(), [&](double v) {
      return std::fabs(v - value.as_number()) <= kDiscreteTolerance;
    });
  case ParameterKind::Categorical:
  case ParameterKind::Chemistry: {
    if (!value.is_text()) {
      return false;
    }
    auto options = labels();
    return std::find(options.begin(), options.end(), value.as_text()) !=
           options.end();
  }
  case ParameterKind::Fixed:
    return value == fixed_value;
  }
  return false;
}

std::vector<std::string> Parameter::labels() const {
  if (kind == ParameterKind::Categorical) {
    return levels;
  }
  std::vector<std::string> out;
  if (kind == ParameterKind::Chemistry) {
    out.reserve(candidates.size());
    for (const auto &c : candidates) {
      out.push_back(c.label);
    }
  }
  return out;
}

json Parameter::to_json() const {
  json j;
  j["name"] = name;
  j["kind"] = to_string(kind);
  switch (kind) {
  case ParameterKind::Continuous:
    j["lower"] = lower;
    j["upper"] = upper;
    break;
  case ParameterKind::Discrete:
    j["values"] = values;
    break;
  case ParameterKind::Categorical:
    j["levels"] = levels;
    break;
  case ParameterKind::Fixed:
    j["value"] = fixed_value.to_json();
    break;
  case ParameterKind::Chemistry: {
    json pool = json::array();
    for (const auto &c : candidates) {
      pool.push_back({{"label", c.label}, {"smiles", c.smiles}});
    }
    j["candidates"] = pool;
    break;
  }
  }
  return j;
}

Parameter Parameter::from_json(const json &j) {
  try {
    Parameter p;
    p.name = j.at("name").get<std::string>();
    p.kind = parameter_kind_from_string(j.at("kind").get<std::string>());
    switch (p.kind) {
    case ParameterKind::Continuous:
      p.lower = j.at("lower").get<double>();
      p.upper = j.at("upper").get<double>();
      break;
    case ParameterKind::Discrete:
      p.values = j.at("values").get<std::vector<double>>();
      break;
    case ParameterKind::Categorical:
      p.levels = j.at("levels").get<std::vector<std::string>>();
      break;
    case ParameterKind::Fixed:
      p.fixed_value = ParameterValue::from_json(j.at("value"));
      break;
    case ParameterKind::Chemistry:
      for (const auto &c : j.at("candidates")) {
        p.candidates.push_back(ChemistryCandidate{
            c.at("label").get<std::string>(), c.at("smiles").get<std::string>()});
      }
      break;
    }
    return p;
  } catch (const json::exception &e) {
    throw ValidationError(std::string("Malformed parameter: ") + e.what());
  }
}

bool Parameter::operator==(const Parameter &o) const {
  return name == o.name && kind == o.kind && lower == o.lower &&
         upper == o.upper && values == o.values && levels == o.levels &&
         fixed_value == o.fixed_value && candidates == o.candidates;
}

void ParameterSpace::validate() const {
  require(!_parameters.empty(), "Parameter space must not be empty");
  std::set<std::string> names;
  for (const auto &p : _parameters) {
    p.validate();
    require(names.insert(p.name).second,
            "Duplicate parameter name '" + p.name + "'");
  }
}

bool ParameterSpace::contains(const Row &row) const {
  if (row.size() != _parameters.size()) {
    return false;
  }
  for (const auto &p : _parameters) {
    auto it = row.find(p.name);
    if (it == row.end() || !p.accepts(it->second)) {
      return false;
    }
  }
  return true;
}

const Parameter *ParameterSpace::find(const std::string &name) const {
  for (const auto &p : _parameters) {
    if (p.name == name) {
      return &p;
    }
  }
  return nullptr;
}

std::vector<std::string> ParameterSpace::names() const {
  std::vector<std::string> out;
  out.reserve(_parameters.size());
  for (const auto &p : _parameters) {
    out.push_back(p.name);
  }
  return out;
}

json ParameterSpace::to_json() const {
  json j = json::array();
  for (const auto &p : _parameters) {
    j.push_back(p.to_json());
  }
  return j;
}

ParameterSpace ParameterSpace::from_json(const json &j) {
  if (!j.is_array()) {
    throw ValidationError("Parameters must be a JSON array");
  }
  ParameterSpace space;
  for (const auto &item : j) {
    space.add(Parameter::from_json(item));
  }
  return space;
}

const std::vector<std::string> &reserved_column_names() {
  static const std::vector<std::string> names = {
      "batch_id",     "row_index",   "status",        "source",
      "generated_at", "ingested_at", "config_version"};
  return names;
}

bool is_reserved_column_name(const std::string &name) {
  const auto &names = reserved_column_names();
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace basil
