#pragma once
#include <cstdint>
#include <random>
#include <vector>

#include <boost/optional.hpp>

#include <public/parameter_space.hpp>

namespace basil {

/**
 * @brief Uniform random rows over a parameter space. Needs no engine and
 * cannot fail for a validated space.
 */
class FallbackSampler {
public:
  /// Without a seed the stream is seeded from std::random_device.
  explicit FallbackSampler(boost::optional<uint64_t> seed = boost::none);

  std::vector<Row> sample(const ParameterSpace &space, size_t n);

  /// One-shot form; equal seeds give equal rows.
  static std::vector<Row> sample(const ParameterSpace &space, size_t n,
                                 boost::optional<uint64_t> seed);

private:
  Row _draw(const ParameterSpace &space);

  std::mt19937_64 _rng;
};

} // namespace basil
