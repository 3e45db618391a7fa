#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

namespace basil {

enum class Direction { Maximize, Minimize };

std::string to_string(Direction direction);
Direction direction_from_string(const std::string &name);

/// Measured value of each objective for one experiment.
using Measurement = std::map<std::string, double>;

struct Objective {
  std::string name;
  Direction direction = Direction::Maximize;
  double weight = 1.0;
  boost::optional<double> lower;
  boost::optional<double> upper;

  Objective() = default;
  Objective(std::string name_, Direction direction_, double weight_ = 1.0)
      : name(std::move(name_)), direction(direction_), weight(weight_) {}
  Objective(std::string name_, Direction direction_, double weight_,
            double lower_, double upper_)
      : name(std::move(name_)), direction(direction_), weight(weight_),
        lower(lower_), upper(upper_) {}

  bool has_bounds() const { return lower && upper; }

  /// Value mapped to [0, 1] over the bounds, flipped for minimize.
  double desirability(double value) const;

  nlohmann::json to_json() const;
  static Objective from_json(const nlohmann::json &j);

  bool operator==(const Objective &o) const {
    return name == o.name && direction == o.direction && weight == o.weight &&
           lower == o.lower && upper == o.upper;
  }
  bool operator!=(const Objective &o) const { return !(*this == o); }
};

/**
 * @brief Ordered list of optimization targets and the scalarization the
 * engine maximizes.
 *
 * One objective: the raw value, negated when minimizing.
 * Several objectives: weighted geometric mean of per-objective
 * desirabilities, each in [0, 1]. Every objective then needs bounds.
 */
class ObjectiveSpec {
public:
  ObjectiveSpec() = default;
  explicit ObjectiveSpec(std::vector<Objective> objectives)
      : _objectives(std::move(objectives)) {}

  void add(Objective objective) { _objectives.push_back(std::move(objective)); }

  /// @throws ValidationError
  void validate() const;

  /// @throws ValidationError if @p m misses an objective, names an unknown
  /// one or holds a non-finite value.
  void check_measurement(const Measurement &m) const;

  /// Scalar the engine maximizes. @p m must pass check_measurement().
  double scalarize(const Measurement &m) const;

  const Objective *find(const std::string &name) const;
  const std::vector<Objective> &objectives() const { return _objectives; }
  std::vector<std::string> names() const;
  size_t size() const { return _objectives.size(); }
  bool empty() const { return _objectives.empty(); }

  nlohmann::json to_json() const;
  static ObjectiveSpec from_json(const nlohmann::json &j);

  bool operator==(const ObjectiveSpec &o) const {
    return _objectives == o._objectives;
  }
  bool operator!=(const ObjectiveSpec &o) const { return !(*this == o); }

private:
  std::vector<Objective> _objectives;
};

} // namespace basil
