#include <public/fallback_sampler.hpp>

namespace basil {

namespace {

uint64_t entropy_seed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

FallbackSampler::FallbackSampler(boost::optional<uint64_t> seed)
    : _rng(seed ? *seed : entropy_seed()) {}

std::vector<Row> FallbackSampler::sample(const ParameterSpace &space,
                                         size_t n) {
  std::vector<Row> rows;
  rows.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    rows.push_back(_draw(space));
  }
  return rows;
}

std::vector<Row> FallbackSampler::sample(const ParameterSpace &space, size_t n,
                                         boost::optional<uint64_t> seed) {
  FallbackSampler sampler(seed);
  return sampler.sample(space, n);
}

Row FallbackSampler::_draw(const ParameterSpace &space) {
  Row row;
  for (const auto &p : space.parameters()) {
    switch (p.kind) {
    case ParameterKind::Continuous:
      if (p.upper > p.lower) {
        std::uniform_real_distribution<double> dist(p.lower, p.upper);
        row[p.name] = dist(_rng);
      } else {
        row[p.name] = p.lower;
      }
      break;
    case ParameterKind::Discrete: {
      std::uniform_int_distribution<size_t> pick(0, p.values.size() - 1);
      row[p.name] = p.values[pick(_rng)];
      break;
    }
    case ParameterKind::Categorical:
    case ParameterKind::Chemistry: {
      const std::vector<std::string> labels = p.labels();
      std::uniform_int_distribution<size_t> pick(0, labels.size() - 1);
      row[p.name] = labels[pick(_rng)];
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
