#pragma once
/** @file  fake_campaign_optimizer.hpp
 *  @brief CampaignOptimizer and EventSink derivatives with controlled
 *  behaviour for adapter and orchestrator testing.
 */

#include <public/campaign_optimizer.hpp>
#include <public/events.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace basil {
namespace test {

inline void sleep_in_slices(int ms) {
  const auto until =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

/**
 * @brief Knobs and counters shared by a fake engine and all of its clones.
 */
struct FakeEngineControl {
  std::atomic<bool> fail_act{false};
  std::atomic<bool> fail_update{false};
  std::atomic<bool> fail_load{false};
  std::atomic<int> act_delay_ms{0};
  std::atomic<int> update_delay_ms{0};
  std::atomic<int> refit_delay_ms{0};

  std::atomic<int> created{0};
  std::atomic<int> act_calls{0};
  std::atomic<int> updates{0};
  std::atomic<int> refits{0};
  std::atomic<int> loads{0};
};

class FakeCampaignOptimizer : public CampaignOptimizer {
public:
  FakeCampaignOptimizer(size_t dim, std::shared_ptr<FakeEngineControl> control)
      : _dim(dim), _control(std::move(control)) {}

  size_t dim_in() const override { return _dim; }
  size_t observation_count() const override { return _samples.size(); }

  std::vector<Eigen::VectorXd> act(size_t n,
                                   const std::atomic<bool> &stop) override {
    ++_control->act_calls;
    const auto until = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(_control->act_delay_ms.load());
    while (std::chrono::steady_clock::now() < until) {
      if (stop.load()) {
        throw std::runtime_error("stopped");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (_control->fail_act) {
      throw std::runtime_error("act failed");
    }
    std::vector<Eigen::VectorXd> points;
    for (size_t i = 0; i < n; ++i) {
      Eigen::VectorXd x(_dim);
      for (size_t j = 0; j < _dim; ++j) {
        x(j) = std::fmod(0.13 * (i + 1) + 0.29 * (j + 1), 1.0);
      }
      points.push_back(x);
    }
    return points;
  }

  void update(const Eigen::VectorXd &sample, double observation) override {
    sleep_in_slices(_control->update_delay_ms.load());
    if (_control->fail_update) {
      throw std::runtime_error("update failed");
    }
    ++_control->updates;
    _samples.push_back(sample);
    _observations.push_back(observation);
  }

  void refit() override {
    sleep_in_slices(_control->refit_delay_ms.load());
    ++_control->refits;
  }

  Eigen::VectorXd best_arm_prediction() const override {
    if (_samples.empty()) {
      return Eigen::VectorXd();
    }
    size_t best = std::distance(
        _observations.begin(),
        std::max_element(_observations.begin(), _observations.end()));
    Eigen::VectorXd v(_dim + 2);
    v.head(_dim) = _samples[best];
    v(_dim) = _observations[best];
    v(_dim + 1) = 0.0;
    return v;
  }

  std::string save() const override {
    std::ostringstream out;
    out << std::setprecision(17) << "fake " << _dim << " " << _samples.size()
        << "\n";
    for (size_t i = 0; i < _samples.size(); ++i) {
      out << _observations[i];
      for (long j = 0; j < _samples[i].size(); ++j) {
        out << " " << _samples[i](j);
      }
      out << "\n";
    }
    return out.str();
  }

  void load(const std::string &blob) override {
    ++_control->loads;
    if (_control->fail_load) {
      throw std::runtime_error("load failed");
    }
    std::istringstream in(blob);
    std::string magic;
    size_t dim = 0;
    size_t n = 0;
    if (!(in >> magic >> dim >> n) || magic != "fake" || dim != _dim) {
      throw std::runtime_error("not a fake engine blob");
    }
    std::vector<Eigen::VectorXd> samples;
    std::vector<double> observations;
    for (size_t i = 0; i < n; ++i) {
      double y = 0.0;
      Eigen::VectorXd x(_dim);
      if (!(in >> y)) {
        throw std::runtime_error("truncated fake engine blob");
      }
      for (size_t j = 0; j < _dim; ++j) {
        if (!(in >> x(j))) {
          throw std::runtime_error("truncated fake engine blob");
        }
      }
      samples.push_back(x);
      observations.push_back(y);
    }
    _samples = std::move(samples);
    _observations = std::move(observations);
  }

  std::unique_ptr<CampaignOptimizer> clone() const override {
    return std::unique_ptr<CampaignOptimizer>(new FakeCampaignOptimizer(*this));
  }

  const std::vector<double> &observations() const { return _observations; }

private:
  size_t _dim;
  std::shared_ptr<FakeEngineControl> _control;
  std::vector<Eigen::VectorXd> _samples;
  std::vector<double> _observations;
};

inline OptimizerFactory
fake_engine_factory(std::shared_ptr<FakeEngineControl> control) {
  return [control](size_t dim, const nlohmann::json &)
             -> std::unique_ptr<CampaignOptimizer> {
    ++control->created;
    return std::unique_ptr<CampaignOptimizer>(
        new FakeCampaignOptimizer(dim, control));
  };
}

class MockEventSink : public EventSink {
public:
  MOCK_METHOD(void, publish, (const CampaignEvent &), (override));
};

/**
 * @brief Keeps every published event.
 */
class RecordingEventSink : public EventSink {
public:
  void publish(const CampaignEvent &event) override {
    std::lock_guard<std::mutex> lock(_mutex);
    _events.push_back(event);
  }

  std::vector<CampaignEvent> events() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events;
  }

  std::vector<EventType> types() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<EventType> out;
    for (const auto &e : _events) {
      out.push_back(e.type);
    }
    return out;
  }

  size_t count(EventType type) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::count_if(_events.begin(), _events.end(),
                         [type](const CampaignEvent &e) {
                           return e.type == type;
                         });
  }

  void clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _events.clear();
  }

private:
  mutable std::mutex _mutex;
  std::vector<CampaignEvent> _events;
};

} // namespace test
} // namespace basil
