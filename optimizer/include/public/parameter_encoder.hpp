#pragma once
#include <cstddef>
#include <vector>

#include <Eigen/Core>

#include <public/parameter_space.hpp>

namespace basil {

/**
 * @brief Maps rows of a parameter space to points of the unit cube the
 * engine searches, and back.
 *
 * continuous  1 dimension, (v - lower) / (upper - lower)
 * discrete    1 dimension over [min, max] of the values, decoded to the
 *             nearest value
 * categorical one dimension per level, decoded by argmax
 * chemistry   one dimension per candidate, decoded by argmax
 * fixed       no dimension, restored verbatim on decode
 */
class ParameterEncoder {
public:
  explicit ParameterEncoder(ParameterSpace space);

  size_t dim() const { return _dim; }

  /// @throws ValidationError if @p row is not in the space.
  Eigen::VectorXd encode(const Row &row) const;

  /// Components are clamped to [0, 1]. @throws ValidationError on a size
  /// mismatch.
  Row decode(const Eigen::VectorXd &x) const;

  const ParameterSpace &space() const { return _space; }

private:
  struct Slot {
    size_t offset;
    size_t width;
    double lower;
    double upper;
  };

  ParameterSpace _space;
  std::vector<Slot> _slots;
  size_t _dim;
};

} // namespace basil
