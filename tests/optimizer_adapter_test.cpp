#include <public/atomic_file.hpp>
#include <public/campaign_store.hpp>
#include <public/errors.hpp>
#include <public/optimizer_adapter.hpp>

#include "campaign_fixtures.hpp"
#include "fake_campaign_optimizer.hpp"
#include "temp_workspace.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>

using namespace basil;
using namespace basil::test;

namespace {

class OptimizerAdapterTest : public ::testing::Test {
protected:
  OptimizerAdapterTest()
      : control(std::make_shared<FakeEngineControl>()),
        adapter(fake_engine_factory(control)),
        config(CampaignConfig::create(reaction_spec())),
        store(workspace.path(), config.id()) {
    store.save_config(config);
  }

  // Appends a completed batch of n rows with z = 1, 2, ...
  void complete_rows(size_t n) {
    RunBatch batch;
    batch.batch_id = history.next_batch_id();
    batch.config_version = config.version();
    for (size_t i = 0; i < n; ++i) {
      batch.rows.push_back(Row{{"x", static_cast<double>(i)}, {"y", "B"}});
    }
    history.append_batch(batch);
    std::vector<RunResult> results;
    for (size_t i = 0; i < n; ++i) {
      RunResult r;
      r.batch_id = batch.batch_id;
      r.row_index = i;
      r.values = {{"z", static_cast<double>(history.result_count() + i + 1)}};
      results.push_back(r);
    }
    history.complete_batch(batch.batch_id, results);
  }

  TempWorkspace workspace;
  std::shared_ptr<FakeEngineControl> control;
  OptimizerAdapter adapter;
  CampaignConfig config;
  CampaignStore store;
  RunHistory history;
};

} // namespace

TEST_F(OptimizerAdapterTest, first_resolve_rebuilds_and_persists) {
  complete_rows(3);
  OptimizerHandle h = adapter.resolve(config, history, store);
  EXPECT_TRUE(h.valid());
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Rebuilt);
  EXPECT_EQ(h.observations, 3u);
  EXPECT_EQ(h.config_hash, config.config_hash());
  EXPECT_EQ(control->created.load(), 1);
  EXPECT_EQ(control->updates.load(), 3);

  boost::optional<OptimizerStateRecord> state = store.load_optimizer_state();
  ASSERT_TRUE(state);
  EXPECT_EQ(state->config_hash, config.config_hash());
  EXPECT_EQ(state->observations, 3u);
}

TEST_F(OptimizerAdapterTest, second_resolve_reuses_live_engine) {
  OptimizerHandle first = adapter.resolve(config, history, store);
  OptimizerHandle second = adapter.resolve(config, history, store);
  EXPECT_EQ(second.origin, OptimizerHandle::Origin::Live);
  EXPECT_EQ(second.id, first.id);
  EXPECT_EQ(control->created.load(), 1);
  EXPECT_EQ(adapter.live_count(), 1u);
}

TEST_F(OptimizerAdapterTest, fresh_adapter_restores_persisted_state) {
  complete_rows(2);
  adapter.resolve(config, history, store);

  OptimizerAdapter other(fake_engine_factory(control));
  const int updates = control->updates;
  OptimizerHandle h = other.resolve(config, history, store);
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Restored);
  EXPECT_EQ(h.observations, 2u);
  EXPECT_EQ(control->loads.load(), 1);
  EXPECT_EQ(control->updates.load(), updates);
}

TEST_F(OptimizerAdapterTest, state_of_another_config_is_rebuilt) {
  complete_rows(2);
  adapter.resolve(config, history, store);

  CampaignSpec spec = config.spec();
  spec.parameters.add(Parameter::discrete("time", {1.0, 2.0}));
  ASSERT_TRUE(config.edit(spec));

  OptimizerAdapter other(fake_engine_factory(control));
  OptimizerHandle h = other.resolve(config, history, store);
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Rebuilt);
  // the old rows lack "time" and are left out of the rebuild
  EXPECT_EQ(h.observations, 0u);
  EXPECT_EQ(control->loads.load(), 0);
  EXPECT_EQ(store.load_optimizer_state()->config_hash, config.config_hash());
}

TEST_F(OptimizerAdapterTest, state_with_fewer_observations_is_rebuilt) {
  complete_rows(2);
  adapter.resolve(config, history, store);
  complete_rows(2);

  OptimizerAdapter other(fake_engine_factory(control));
  OptimizerHandle h = other.resolve(config, history, store);
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Rebuilt);
  EXPECT_EQ(h.observations, 4u);
}

TEST_F(OptimizerAdapterTest, live_engine_is_dropped_when_history_moves_on) {
  OptimizerHandle first = adapter.resolve(config, history, store);
  complete_rows(1);
  OptimizerHandle second = adapter.resolve(config, history, store);
  EXPECT_NE(second.id, first.id);
  EXPECT_FALSE(adapter.is_live(first));
  EXPECT_TRUE(adapter.is_live(second));
}

TEST_F(OptimizerAdapterTest, corrupt_state_is_rebuilt) {
  complete_rows(2);
  adapter.resolve(config, history, store);
  control->fail_load = true;

  OptimizerAdapter other(fake_engine_factory(control));
  OptimizerHandle h = other.resolve(config, history, store);
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Rebuilt);
  EXPECT_EQ(h.observations, 2u);
}

TEST_F(OptimizerAdapterTest, unreadable_state_file_is_rebuilt) {
  write_file_atomic(store.optimizer_state_path(), "BASIL-OPTSTATE 1\nnope\n");
  OptimizerHandle h = adapter.resolve(config, history, store);
  EXPECT_EQ(h.origin, OptimizerHandle::Origin::Rebuilt);
  EXPECT_TRUE(store.load_optimizer_state());
}

TEST_F(OptimizerAdapterTest, space_without_free_dimension_is_unavailable) {
  CampaignSpec spec;
  spec.name = "fixed";
  spec.parameters.add(Parameter::fixed("solvent", "water"));
  spec.objectives.add(Objective("z", Direction::Maximize));
  CampaignConfig fixed = CampaignConfig::create(spec);
  CampaignStore fixed_store(workspace.path(), fixed.id());
  EXPECT_THROW(adapter.resolve(fixed, RunHistory(), fixed_store),
               OptimizerUnavailable);
}

TEST_F(OptimizerAdapterTest, suggest_batch_decodes_rows) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  std::vector<Row> rows =
      adapter.suggest_batch(h, config, 5, std::chrono::milliseconds(5000));
  ASSERT_EQ(rows.size(), 5u);
  for (const auto &row : rows) {
    EXPECT_TRUE(config.parameters().contains(row));
  }
  EXPECT_THROW(adapter.suggest_batch(h, config, 0,
                                     std::chrono::milliseconds(5000)),
               ValidationError);
}

TEST_F(OptimizerAdapterTest, suggest_batch_is_bounded_by_the_timeout) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  control->act_delay_ms = 2000;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(
      adapter.suggest_batch(h, config, 2, std::chrono::milliseconds(100)),
      OptimizerUnavailable);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
  // the live engine is untouched by the abandoned call
  EXPECT_TRUE(adapter.is_live(h));
}

TEST_F(OptimizerAdapterTest, suggest_batch_honours_cancellation) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  control->act_delay_ms = 2000;
  std::atomic<bool> cancel(true);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.suggest_batch(h, config, 2,
                                     std::chrono::milliseconds(30000), &cancel),
               OptimizerUnavailable);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
}

TEST_F(OptimizerAdapterTest, engine_failure_is_unavailable) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  control->fail_act = true;
  EXPECT_THROW(
      adapter.suggest_batch(h, config, 2, std::chrono::milliseconds(5000)),
      OptimizerUnavailable);
}

TEST_F(OptimizerAdapterTest, released_handle_is_unavailable) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  adapter.release(h);
  EXPECT_FALSE(adapter.is_live(h));
  EXPECT_THROW(
      adapter.suggest_batch(h, config, 1, std::chrono::milliseconds(5000)),
      OptimizerUnavailable);
}

TEST_F(OptimizerAdapterTest, observe_feeds_only_new_results) {
  complete_rows(2);
  OptimizerHandle h = adapter.resolve(config, history, store);
  EXPECT_EQ(control->updates.load(), 2);

  complete_rows(3);
  OptimizerHandle updated = adapter.observe(h, config, history, store);
  EXPECT_EQ(updated.id, h.id);
  EXPECT_EQ(updated.observations, 5u);
  EXPECT_EQ(control->updates.load(), 5);
  EXPECT_EQ(store.load_optimizer_state()->observations, 5u);

  // nothing new: no engine work
  adapter.observe(updated, config, history, store);
  EXPECT_EQ(control->updates.load(), 5);
}

TEST_F(OptimizerAdapterTest, observe_failure_releases_the_engine) {
  OptimizerHandle h = adapter.resolve(config, history, store);
  complete_rows(1);
  control->fail_update = true;
  EXPECT_THROW(adapter.observe(h, config, history, store),
               OptimizerUnavailable);
  EXPECT_FALSE(adapter.is_live(h));
}

TEST_F(OptimizerAdapterTest, rebuild_is_bounded_by_the_timeout) {
  complete_rows(3);
  control->refit_delay_ms = 2000;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.resolve(config, history, store,
                               std::chrono::milliseconds(100)),
               OptimizerUnavailable);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
  EXPECT_EQ(adapter.live_count(), 0u);
  EXPECT_FALSE(store.load_optimizer_state());
}

TEST_F(OptimizerAdapterTest, rebuild_honours_cancellation) {
  complete_rows(3);
  control->update_delay_ms = 2000;
  std::atomic<bool> cancel(true);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.resolve(config, history, store,
                               std::chrono::milliseconds(30000), &cancel),
               OptimizerUnavailable);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
  EXPECT_EQ(adapter.live_count(), 0u);
}

TEST_F(OptimizerAdapterTest, slow_observe_keeps_the_stored_state) {
  complete_rows(2);
  OptimizerHandle h = adapter.resolve(config, history, store);
  complete_rows(2);
  control->refit_delay_ms = 2000;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(adapter.observe(h, config, history, store,
                               std::chrono::milliseconds(100)),
               OptimizerUnavailable);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(1000));
  EXPECT_FALSE(adapter.is_live(h));
  EXPECT_EQ(store.load_optimizer_state()->observations, 2u);
}

TEST_F(OptimizerAdapterTest, best_arm_reports_best_observation) {
  OptimizerHandle empty = adapter.resolve(config, history, store);
  EXPECT_FALSE(adapter.best_arm(empty, config));

  complete_rows(3);
  OptimizerHandle h = adapter.resolve(config, history, store);
  boost::optional<BestArm> best = adapter.best_arm(h, config);
  ASSERT_TRUE(best);
  EXPECT_EQ(best->row.at("x"), ParameterValue(2.0));
  EXPECT_EQ(best->row.at("y"), ParameterValue("B"));
  EXPECT_DOUBLE_EQ(best->mean, 3.0);
}

TEST(optimizer_adapter_tests, usable_observations_skip_foreign_rows) {
  CampaignConfig config = CampaignConfig::create(reaction_spec());
  RunHistory history;
  RunBatch batch;
  batch.batch_id = "batch-000001";
  batch.rows = {Row{{"x", 1.0}, {"y", "A"}}, Row{{"x", 1.0}, {"y", "D"}}};
  history.append_batch(batch);
  RunResult a;
  a.batch_id = batch.batch_id;
  a.row_index = 0;
  a.values = {{"z", 1.0}};
  RunResult b = a;
  b.row_index = 1;
  history.complete_batch(batch.batch_id, {a, b});

  EXPECT_EQ(usable_observations(config, history).size(), 1u);

  CampaignSpec spec = config.spec();
  spec.objectives = ObjectiveSpec(
      {Objective("z", Direction::Maximize, 1.0, 0.0, 10.0),
       Objective("w", Direction::Minimize, 1.0, 0.0, 10.0)});
  config.edit(spec);
  EXPECT_TRUE(usable_observations(config, history).empty());
}
