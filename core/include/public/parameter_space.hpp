#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace basil {

/**
 * @brief A single parameter assignment: a number for continuous and discrete
 * parameters, a text label for categorical and chemistry parameters.
 */
class ParameterValue {
public:
  ParameterValue() : _numeric(true), _number(0.0) {}
  ParameterValue(double number) : _numeric(true), _number(number) {}
  ParameterValue(int number)
      : _numeric(true), _number(static_cast<double>(number)) {}
  ParameterValue(std::string text)
      : _numeric(false), _number(0.0), _text(std::move(text)) {}
  ParameterValue(const char *text)
      : _numeric(false), _number(0.0), _text(text) {}

  bool is_number() const { return _numeric; }
  bool is_text() const { return !_numeric; }

  /// @throws ValidationError if the value holds text.
  double as_number() const;
  /// @throws ValidationError if the value holds a number.
  const std::string &as_text() const;

  /// Shortest round-trippable rendering (numbers use 17 significant digits).
  std::string to_string() const;

  nlohmann::json to_json() const;
  static ParameterValue from_json(const nlohmann::json &j);

  bool operator==(const ParameterValue &other) const;
  bool operator!=(const ParameterValue &other) const {
    return !(*this == other);
  }

private:
  bool _numeric;
  double _number;
  std::string _text;
};

using Row = std::map<std::string, ParameterValue>;

enum class ParameterKind { Continuous, Discrete, Categorical, Fixed, Chemistry };

std::string to_string(ParameterKind kind);
/// @throws ValidationError on an unknown kind name.
ParameterKind parameter_kind_from_string(const std::string &name);

struct ChemistryCandidate {
  std::string label;
  std::string smiles;

  bool operator==(const ChemistryCandidate &o) const {
    return label == o.label && smiles == o.smiles;
  }
};

/**
 * @brief One controllable variable of an experiment. Only the fields of its
 * kind are meaningful; the named constructors fill them in.
 */
struct Parameter {
  std::string name;
  ParameterKind kind = ParameterKind::Continuous;

  double lower = 0.0; // continuous
  double upper = 0.0;
  std::vector<double> values;                 // discrete
  std::vector<std::string> levels;            // categorical
  ParameterValue fixed_value;                 // fixed
  std::vector<ChemistryCandidate> candidates; // chemistry

  static Parameter continuous(std::string name, double lower, double upper);
  static Parameter discrete(std::string name, std::vector<double> values);
  static Parameter categorical(std::string name,
                               std::vector<std::string> levels);
  static Parameter fixed(std::string name, ParameterValue value);
  static Parameter chemistry(std::string name,
                             std::vector<ChemistryCandidate> candidates);

  /// @throws ValidationError describing the first inconsistency found.
  void validate() const;

  /// True if @p value lies in this parameter's declared domain.
  bool accepts(const ParameterValue &value) const;

  /// Labels a categorical or chemistry parameter may take.
  std::vector<std::string> labels() const;

  nlohmann::json to_json() const;
  static Parameter from_json(const nlohmann::json &j);

  bool operator==(const Parameter &other) const;
  bool operator!=(const Parameter &other) const { return !(*this == other); }
};

/**
 * @brief Ordered set of parameters with unique names.
 */
class ParameterSpace {
public:
  ParameterSpace() = default;
  explicit ParameterSpace(std::vector<Parameter> parameters)
      : _parameters(std::move(parameters)) {}

  void add(Parameter parameter) { _parameters.push_back(std::move(parameter)); }

  /// @throws ValidationError on duplicate names, empty space or bad domains.
  void validate() const;

  /// Every parameter is assigned and in-domain. Extra keys are rejected.
  bool contains(const Row &row) const;

  const Parameter *find(const std::string &name) const;
  const std::vector<Parameter> &parameters() const { return _parameters; }
  std::vector<std::string> names() const;
  size_t size() const { return _parameters.size(); }
  bool empty() const { return _parameters.empty(); }

  nlohmann::json to_json() const;
  static ParameterSpace from_json(const nlohmann::json &j);

  bool operator==(const ParameterSpace &other) const {
    return _parameters == other._parameters;
  }
  bool operator!=(const ParameterSpace &other) const {
    return !(*this == other);
  }

private:
  std::vector<Parameter> _parameters;
};

/// Column names used by run files; parameters and objectives may not use them.
const std::vector<std::string> &reserved_column_names();
bool is_reserved_column_name(const std::string &name);

} // namespace basil
