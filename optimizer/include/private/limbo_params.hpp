#pragma once
#include <limbo/limbo.hpp>

namespace basil {
namespace detail {

using namespace limbo;

struct Params {
  struct opt_nloptnograd : public defaults::opt_nloptnograd {
    BO_PARAM(int, iterations, 500);
  };

  struct kernel : public defaults::kernel {
    BO_PARAM(double, noise, 0.01);
    BO_PARAM(bool, optimize_noise, true);
  };

  struct kernel_squared_exp_ard : public defaults::kernel_squared_exp_ard {
    BO_PARAM(double, sigma_sq, 1);
    BO_PARAM(int, k, 0);
  };

  struct kernel_maternfivehalves : public defaults::kernel_maternfivehalves {
    BO_PARAM(double, sigma_sq, 1);
    BO_PARAM(double, l, 0.25);
  };

  struct kernel_maternthreehalves : public defaults::kernel_maternthreehalves {
    BO_PARAM(double, sigma_sq, 1);
    BO_PARAM(double, l, 0.25);
  };

  struct acqui_ucb : public defaults::acqui_ucb {
    BO_PARAM(double, alpha, 0.5);
  };

  struct acqui_ei : public defaults::acqui_ei {
    BO_PARAM(double, jitter, 0.01);
  };

  struct opt_rprop : public defaults::opt_rprop {};

  struct opt_parallelrepeater : public defaults::opt_parallelrepeater {
    BO_PARAM(int, repeats, 10);
    BO_PARAM(double, epsilon, 1);
  };

  struct mean_constant : public defaults::mean_constant {
    BO_PARAM(double, constant, 0);
  };
};

using mean_t = mean::Constant<Params>;
using gp_opt_t = model::gp::KernelMeanLFOpt<Params>;
using acqui_opt_t = opt::NLOptNoGrad<Params>;

template <typename Kernel>
using gp_t = model::GP<Params, Kernel, mean_t, gp_opt_t>;

} // namespace detail
} // namespace basil
