#include <public/errors.hpp>
#include <public/parameter_encoder.hpp>

#include <algorithm>
#include <cmath>

namespace basil {

namespace {

double clamp01(double v) {
  if (!(v > 0.0)) {
    return 0.0;
  }
  return v > 1.0 ? 1.0 : v;
}

} // namespace

ParameterEncoder::ParameterEncoder(ParameterSpace space)
    : _space(std::move(space)), _dim(0) {
  for (const auto &p : _space.parameters()) {
    Slot slot{_dim, 0, 0.0, 0.0};
    switch (p.kind) {
    case ParameterKind::Continuous:
      slot.width = 1;
      slot.lower = p.lower;
      slot.upper = p.upper;
      break;
    case ParameterKind::Discrete:
      slot.width = 1;
      if (!p.values.empty()) {
        slot.lower = *std::min_element(p.values.begin(), p.values.end());
        slot.upper = *std::max_element(p.values.begin(), p.values.end());
      }
      break;
    case ParameterKind::Categorical:
    case ParameterKind::Chemistry:
      slot.width = p.labels().size();
      break;
    case ParameterKind::Fixed:
      break;
    }
    _dim += slot.width;
    _slots.push_back(slot);
  }
}

Eigen::VectorXd ParameterEncoder::encode(const Row &row) const {
  if (!_space.contains(row)) {
    throw ValidationError("Row is outside the parameter space");
  }
  Eigen::VectorXd x = Eigen::VectorXd::Zero(_dim);
  const auto &params = _space.parameters();
  for (size_t i = 0; i < params.size(); ++i) {
    const Parameter &p = params[i];
    const Slot &slot = _slots[i];
    const ParameterValue &value = row.at(p.name);
    switch (p.kind) {
    case ParameterKind::Continuous:
    case ParameterKind::Discrete: {
      double span = slot.upper - slot.lower;
      x(slot.offset) =
          span > 0.0 ? clamp01((value.as_number() - slot.lower) / span) : 0.5;
      break;
    }
    case ParameterKind::Categorical:
    case ParameterKind::Chemistry: {
      const std::vector<std::string> labels = p.labels();
      auto it = std::find(labels.begin(), labels.end(), value.as_text());
      x(slot.offset + std::distance(labels.begin(), it)) = 1.0;
      break;
    }
    case ParameterKind::Fixed:
      break;
    }
  }
  return x;
}

Row ParameterEncoder::decode(const Eigen::VectorXd &x) const {
  if (static_cast<size_t>(x.size()) != _dim) {
    throw ValidationError("Encoded point has " + std::to_string(x.size()) +
                          " dimensions, expected " + std::to_string(_dim));
  }
  Row row;
  const auto &params = _space.parameters();
  for (size_t i = 0; i < params.size(); ++i) {
    const Parameter &p = params[i];
    const Slot &slot = _slots[i];
    switch (p.kind) {
    case ParameterKind::Continuous: {
      double v = slot.lower + clamp01(x(slot.offset)) * (slot.upper - slot.lower);
      row[p.name] = std::min(std::max(v, p.lower), p.upper);
      break;
    }
    case ParameterKind::Discrete: {
      double target =
          slot.lower + clamp01(x(slot.offset)) * (slot.upper - slot.lower);
      double best = p.values.front();
      for (double v : p.values) {
        if (std::fabs(v - target) < std::fabs(best - target)) {
          best = v;
        }
      }
      row[p.name] = best;
      break;
    }
    case ParameterKind::Categorical:
    case ParameterKind::Chemistry: {
      const std::vector<std::string> labels = p.labels();
      size_t best = 0;
      for (size_t k = 1; k < slot.width; ++k) {
        if (x(slot.offset + k) > x(slot.offset + best)) {
          best = k;
        }
      }
      row[p.name] = labels[best];
      break;
    }
    case ParameterKind::Fixed:
      row[p.name] = p.fixed_value;
      break;
    }
  }
  return row;
}

} // namespace basil
