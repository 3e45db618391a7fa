#include "private/limbo_campaign_optimizer.hpp"
#include <public/campaign_optimizer.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>

namespace basil {

namespace {

using detail::LimboCampaignOptimizer;
using detail::Params;

template <typename Kernel>
std::unique_ptr<CampaignOptimizer> with_acquisition(const EngineSettings &s,
                                                    size_t dim_in) {
  if (s.acquisition == "ucb") {
    return std::unique_ptr<CampaignOptimizer>(
        new LimboCampaignOptimizer<Kernel, limbo::acqui::UCB>(
            dim_in, s.initial_random_samples));
  }
  if (s.acquisition == "ei") {
    return std::unique_ptr<CampaignOptimizer>(
        new LimboCampaignOptimizer<Kernel, limbo::acqui::EI>(
            dim_in, s.initial_random_samples));
  }
  throw OptimizerUnavailable("Unsupported acquisition function: " +
                             s.acquisition);
}

} // namespace

EngineSettings EngineSettings::from_json(const nlohmann::json &settings) {
  EngineSettings s;
  if (settings.is_null()) {
    return s;
  }
  if (!settings.is_object()) {
    throw OptimizerUnavailable("Optimizer settings must be a JSON object");
  }
  try {
    if (settings.count("kernel")) {
      s.kernel = settings.at("kernel").get<std::string>();
    }
    if (settings.count("acquisition")) {
      s.acquisition = settings.at("acquisition").get<std::string>();
    }
    if (settings.count("initial_random_samples")) {
      const auto &n = settings.at("initial_random_samples");
      if (!n.is_number_integer() || n.get<long long>() < 0) {
        throw OptimizerUnavailable(
            "initial_random_samples must be a non-negative integer");
      }
      s.initial_random_samples = n.get<size_t>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw OptimizerUnavailable(std::string("Malformed optimizer settings: ") +
                               e.what());
  }
  return s;
}

std::unique_ptr<CampaignOptimizer>
make_limbo_optimizer(size_t dim_in, const nlohmann::json &settings) {
  if (dim_in == 0) {
    throw OptimizerUnavailable("Parameter space has no free dimension");
  }
  EngineSettings s = EngineSettings::from_json(settings);
  get_logger("optimizer")
      ->debug("Creating limbo engine: dim_in={} kernel={} acquisition={}",
              dim_in, s.kernel, s.acquisition);
  if (s.kernel == "squared_exp_ard") {
    return with_acquisition<limbo::kernel::SquaredExpARD<Params>>(s, dim_in);
  }
  if (s.kernel == "matern_5_2") {
    return with_acquisition<limbo::kernel::MaternFiveHalves<Params>>(s, dim_in);
  }
  if (s.kernel == "matern_3_2") {
    return with_acquisition<limbo::kernel::MaternThreeHalves<Params>>(s,
                                                                     dim_in);
  }
  throw OptimizerUnavailable("Unsupported kernel: " + s.kernel);
}

} // namespace basil
