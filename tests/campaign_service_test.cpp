#include <public/atomic_file.hpp>
#include <public/campaign_service.hpp>
#include <public/errors.hpp>

#include "campaign_fixtures.hpp"
#include "fake_campaign_optimizer.hpp"
#include "temp_workspace.hpp"

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <cctype>
#include <set>
#include <thread>

using namespace basil;
using namespace basil::test;
using json = nlohmann::json;

namespace fs = boost::filesystem;

namespace {

class CampaignServiceTest : public ::testing::Test {
protected:
  CampaignServiceTest()
      : control(std::make_shared<FakeEngineControl>()),
        sink(std::make_shared<RecordingEventSink>()) {
    config.workspace = workspace.path();
    config.optimizer_timeout = std::chrono::milliseconds(5000);
    config.fallback_seed = 3;
    config.log_level = "warn";
  }

  std::unique_ptr<CampaignService> make_service() {
    return std::unique_ptr<CampaignService>(
        new CampaignService(config, sink, fake_engine_factory(control)));
  }

  TempWorkspace workspace;
  std::shared_ptr<FakeEngineControl> control;
  std::shared_ptr<RecordingEventSink> sink;
  ServiceConfig config;
};

} // namespace

TEST_F(CampaignServiceTest, create_list_and_remember) {
  auto service = make_service();
  EXPECT_FALSE(service->recent_campaign());
  EXPECT_TRUE(service->list_campaigns().empty());

  const std::string first = service->create_campaign(reaction_spec());
  const std::string second = service->create_campaign(coupling_spec());
  EXPECT_NE(first, second);
  EXPECT_TRUE(service->is_open(first));
  EXPECT_TRUE(service->is_open(second));
  EXPECT_EQ(*service->recent_campaign(), second);

  std::vector<CampaignSummary> listed = service->list_campaigns();
  ASSERT_EQ(listed.size(), 2u);
  std::set<std::string> names;
  for (const auto &s : listed) {
    names.insert(s.name);
    EXPECT_EQ(s.version, 1);
  }
  EXPECT_EQ(names, (std::set<std::string>{"reaction", "suzuki coupling"}));

  service->open_campaign(first);
  EXPECT_EQ(*service->recent_campaign(), first);
}

TEST_F(CampaignServiceTest, recent_campaign_survives_a_restart) {
  std::string id;
  {
    auto service = make_service();
    id = service->create_campaign(reaction_spec());
  }
  auto service = make_service();
  EXPECT_EQ(*service->recent_campaign(), id);
  EXPECT_FALSE(service->is_open(id));

  // campaigns open on first use
  EXPECT_EQ(service->get_history(id).batch_count(), 0u);
  EXPECT_TRUE(service->is_open(id));
}

TEST_F(CampaignServiceTest, settings_keep_unknown_keys) {
  write_file_atomic(workspace.path() / "settings.json",
                    R"({"theme": "dark", "recent_campaign": "gone"})");
  auto service = make_service();
  EXPECT_EQ(*service->recent_campaign(), "gone");

  const std::string id = service->create_campaign(reaction_spec());
  json saved = json::parse(read_file(workspace.path() / "settings.json"));
  EXPECT_EQ(saved.at("theme"), "dark");
  EXPECT_EQ(saved.at("recent_campaign"), id);
}

TEST_F(CampaignServiceTest, unreadable_settings_fall_back_to_defaults) {
  write_file_atomic(workspace.path() / "settings.json", "{ not json");
  auto service = make_service();
  EXPECT_FALSE(service->recent_campaign());
}

TEST_F(CampaignServiceTest, unknown_campaign) {
  auto service = make_service();
  EXPECT_THROW(service->get_history("nope"), CampaignNotFound);
  EXPECT_THROW(service->generate_next_batch("nope", 2), CampaignNotFound);
  EXPECT_THROW(service->record_results("nope", "batch-000001", {}),
               CampaignNotFound);
  EXPECT_FALSE(service->is_open("nope"));
}

TEST_F(CampaignServiceTest, ids_cannot_leave_the_workspace) {
  auto service = make_service();
  const std::string id = service->create_campaign(reaction_spec());
  service->close_campaign(id);

  // a real campaign reachable through a relative path is still not found
  const std::string sideways = "../campaigns/" + id;
  EXPECT_THROW(service->get_history(sideways), CampaignNotFound);
  EXPECT_THROW(service->open_campaign("../../etc"), CampaignNotFound);
  std::string upper = id;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  EXPECT_THROW(service->get_history(upper), CampaignNotFound);
  EXPECT_NO_THROW(service->get_history(id));
}

TEST_F(CampaignServiceTest, generate_then_record) {
  auto service = make_service();
  const std::string id = service->create_campaign(reaction_spec());

  EXPECT_THROW(service->generate_next_batch(id, 0), ValidationError);

  std::shared_ptr<BatchTask> task = service->generate_next_batch(id, 3);
  RunBatch batch = task->get();
  EXPECT_TRUE(task->done());
  EXPECT_DOUBLE_EQ(task->progress(), 1.0);
  EXPECT_EQ(batch.rows.size(), 3u);
  EXPECT_EQ(batch.source, BatchSource::Optimizer);

  std::vector<Measurement> rows = {{{"z", 1.0}}, {{"z", 2.0}}, {{"z", 3.0}}};
  EXPECT_TRUE(service->record_results(id, batch.batch_id, rows));
  EXPECT_FALSE(service->record_results(id, batch.batch_id, rows));
  EXPECT_EQ(service->get_history(id).result_count(), 3u);

  boost::optional<BestArm> best = service->best_arm(id);
  ASSERT_TRUE(best);
  EXPECT_DOUBLE_EQ(best->mean, 3.0);
}

TEST_F(CampaignServiceTest, campaigns_work_in_parallel) {
  auto service = make_service();
  const std::string a = service->create_campaign(reaction_spec());
  const std::string b = service->create_campaign(coupling_spec());

  auto ta = service->generate_next_batch(a, 2);
  auto tb = service->generate_next_batch(b, 2);
  EXPECT_EQ(ta->get().batch_id, "batch-000001");
  EXPECT_EQ(tb->get().batch_id, "batch-000001");
  EXPECT_EQ(service->get_history(a).batch_count(), 1u);
  EXPECT_EQ(service->get_history(b).batch_count(), 1u);
}

TEST_F(CampaignServiceTest, edit_campaign) {
  auto service = make_service();
  const std::string id = service->create_campaign(reaction_spec());

  CampaignSpec spec = service->get_config(id).spec();
  spec.description = "renamed";
  EXPECT_FALSE(service->edit_campaign(id, spec));
  spec.objectives.add(Objective("purity", Direction::Maximize));
  EXPECT_TRUE(service->edit_campaign(id, spec));
  EXPECT_EQ(service->get_config(id).version(), 2);
}

TEST_F(CampaignServiceTest, import_results) {
  auto service = make_service();
  const std::string id = service->create_campaign(reaction_spec());
  RunBatch batch = service->import_results(
      id, {{Row{{"x", 4.0}, {"y", "A"}}, {{"z", 1.5}}}});
  EXPECT_EQ(batch.source, BatchSource::Import);
  EXPECT_EQ(service->get_history(id).result_count(), 1u);
}

TEST_F(CampaignServiceTest, close_releases_the_campaign) {
  auto service = make_service();
  const std::string id = service->create_campaign(reaction_spec());

  auto other = make_service();
  EXPECT_THROW(other->get_history(id), StorageError);

  EXPECT_TRUE(service->close_campaign(id));
  EXPECT_FALSE(service->close_campaign(id));
  EXPECT_FALSE(service->is_open(id));
  EXPECT_NO_THROW(other->get_history(id));
}

TEST_F(CampaignServiceTest, listing_skips_broken_campaigns) {
  auto service = make_service();
  service->create_campaign(reaction_spec());
  const fs::path broken =
      workspace.path() / "campaigns" / "1b4e28ba-2fa1-41d2-883f-0016d3cca427";
  fs::create_directories(broken);
  write_file_atomic(broken / "config.json", "not a config");
  const fs::path stray = workspace.path() / "campaigns" / "notes";
  fs::create_directories(stray);
  write_file_atomic(stray / "config.json", "{}");

  std::vector<CampaignSummary> listed = service->list_campaigns();
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].name, "reaction");
}

TEST_F(CampaignServiceTest, unknown_log_level_is_rejected) {
  config.log_level = "chatty";
  EXPECT_THROW(make_service(), ValidationError);
}

TEST(batch_task_tests, reports_progress_and_result) {
  auto task = BatchTask::start([](const GenerateOptions &o) {
    o.progress(0.5);
    RunBatch b;
    b.batch_id = "batch-000007";
    return b;
  });
  EXPECT_EQ(task->get().batch_id, "batch-000007");
  EXPECT_DOUBLE_EQ(task->progress(), 0.5);
  EXPECT_TRUE(task->wait_for(std::chrono::milliseconds(0)));
}

TEST(batch_task_tests, rethrows_the_error) {
  auto task = BatchTask::start([](const GenerateOptions &) -> RunBatch {
    throw StorageError("disk full");
  });
  task->wait();
  EXPECT_TRUE(task->done());
  EXPECT_THROW(task->get(), StorageError);
}

TEST(batch_task_tests, cancel_reaches_the_work) {
  auto task = BatchTask::start([](const GenerateOptions &o) -> RunBatch {
    while (!o.cancel->cancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    throw OperationCancelled("cancelled");
  });
  EXPECT_FALSE(task->wait_for(std::chrono::milliseconds(20)));
  EXPECT_FALSE(task->cancel_requested());
  task->cancel();
  EXPECT_TRUE(task->cancel_requested());
  EXPECT_THROW(task->get(), OperationCancelled);
}

TEST(service_config_tests, defaults) {
  ServiceConfig c = ServiceConfig::from_json(json::object());
  EXPECT_EQ(c.workspace, fs::path("."));
  EXPECT_EQ(c.optimizer_timeout.count(), 30000);
  EXPECT_EQ(c.log_level, "info");
  EXPECT_FALSE(c.fallback_seed);
}

TEST(service_config_tests, reads_every_key) {
  ServiceConfig c = ServiceConfig::from_json({{"workspace", "/data/basil"},
                                              {"optimizer_timeout_ms", 250},
                                              {"log_level", "debug"},
                                              {"fallback_seed", 9}});
  EXPECT_EQ(c.workspace, fs::path("/data/basil"));
  EXPECT_EQ(c.optimizer_timeout.count(), 250);
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_EQ(*c.fallback_seed, 9u);
  EXPECT_EQ(ServiceConfig::from_json(c.to_json()).to_json(), c.to_json());

  EXPECT_FALSE(ServiceConfig::from_json({{"fallback_seed", nullptr}}).fallback_seed);
}

TEST(service_config_tests, rejects_bad_values) {
  EXPECT_THROW(ServiceConfig::from_json(json::array()), ValidationError);
  EXPECT_THROW(ServiceConfig::from_json({{"optimizer_timeout_ms", 0}}),
               ValidationError);
  EXPECT_THROW(ServiceConfig::from_json({{"optimizer_timeout_ms", "5"}}),
               ValidationError);
  EXPECT_THROW(ServiceConfig::from_json({{"fallback_seed", -1}}),
               ValidationError);
  EXPECT_THROW(ServiceConfig::from_json({{"workspace", 4}}), ValidationError);
}

TEST(config_loader_tests, relative_workspace_follows_the_file) {
  TempWorkspace dir;
  write_file_atomic(dir.path() / "basil.json",
                    R"({"workspace": "data", "optimizer_timeout_ms": 1000})");
  ServiceConfig c = ConfigLoader(dir.path() / "basil.json").load();
  EXPECT_EQ(c.workspace, dir.path() / "data");
  EXPECT_EQ(c.optimizer_timeout.count(), 1000);

  write_file_atomic(dir.path() / "abs.json", R"({"workspace": "/srv/basil"})");
  EXPECT_EQ(ConfigLoader(dir.path() / "abs.json").load().workspace,
            fs::path("/srv/basil"));
}

TEST(config_loader_tests, reports_unreadable_files) {
  TempWorkspace dir;
  EXPECT_THROW(ConfigLoader(dir.path() / "missing.json").load(), StorageError);
  write_file_atomic(dir.path() / "bad.json", "{");
  EXPECT_THROW(ConfigLoader(dir.path() / "bad.json").load(), ValidationError);
}
