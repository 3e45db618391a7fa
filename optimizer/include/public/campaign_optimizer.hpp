#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <nlohmann/json.hpp>

namespace basil {

/**
 * @brief Engine contract behind the optimizer adapter.
 *
 * Works in the unit cube [0, 1]^dim_in and maximizes a scalar observation.
 * Implementations need not be thread safe; the adapter never shares one
 * instance between threads and runs long calls on a clone().
 */
class CampaignOptimizer {
public:
  virtual ~CampaignOptimizer() = default;

  virtual size_t dim_in() const = 0;

  /// Number of samples fed through update() or load().
  virtual size_t observation_count() const = 0;

  /**
   * @brief Propose @p n distinct points.
   *
   * @p stop is polled between candidates and during each search; when set,
   * the call returns early with fewer points.
   */
  virtual std::vector<Eigen::VectorXd> act(size_t n,
                                           const std::atomic<bool> &stop) = 0;

  virtual void update(const Eigen::VectorXd &sample, double observation) = 0;

  /// Refit the surrogate hyperparameters to everything seen so far.
  virtual void refit() = 0;

  /**
   * @return Best observed sample followed by its predicted mean and
   * uncertainty (size dim_in + 2), or an empty vector before any update.
   */
  virtual Eigen::VectorXd best_arm_prediction() const = 0;

  virtual std::string save() const = 0;

  /// @throws std::exception on a malformed or mismatching blob.
  virtual void load(const std::string &blob) = 0;

  virtual std::unique_ptr<CampaignOptimizer> clone() const = 0;
};

/**
 * @brief Engine choice read from a campaign's settings bag.
 *
 * kernel: squared_exp_ard (default), matern_5_2, matern_3_2
 * acquisition: ucb (default), ei
 * initial_random_samples: observations before the surrogate drives
 * proposals (default 3)
 */
struct EngineSettings {
  std::string kernel = "squared_exp_ard";
  std::string acquisition = "ucb";
  size_t initial_random_samples = 3;

  /// @throws OptimizerUnavailable on unknown or malformed values.
  static EngineSettings from_json(const nlohmann::json &settings);
};

using OptimizerFactory = std::function<std::unique_ptr<CampaignOptimizer>(
    size_t dim_in, const nlohmann::json &settings)>;

/// Engine on limbo's Gaussian process. @throws OptimizerUnavailable
std::unique_ptr<CampaignOptimizer>
make_limbo_optimizer(size_t dim_in, const nlohmann::json &settings);

} // namespace basil
