#include <public/campaign_service.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>
#include <public/service_config.hpp>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

using namespace basil;

// Synthetic laboratory response. Optimum at temperature 0.5, ratio -0.5 with
// catalyst "Pd".
struct DummyEval {
  double noise_stddev = 0.01;

  double operator()(const Row &row) const {
    const double temperature = row.at("temperature").as_number();
    const double ratio = row.at("ratio").as_number();
    const std::string &catalyst = row.at("catalyst").as_text();

    double y = 1.0 - std::hypot(temperature - 0.5, ratio + 0.5);
    if (catalyst == "Ni") {
      y -= 0.2;
    } else if (catalyst == "Cu") {
      y -= 0.4;
    }
    std::random_device rd;
    std::mt19937 gen(rd());
    std::normal_distribution<> d(0.0, noise_stddev);
    return y + d(gen);
  }
};

CampaignSpec demo_spec() {
  CampaignSpec spec;
  spec.name = "campaign_demo";
  spec.description = "Synthetic response surface";
  spec.parameters.add(Parameter::continuous("temperature", 0.0, 1.0));
  spec.parameters.add(Parameter::continuous("ratio", -1.0, 1.0));
  spec.parameters.add(
      Parameter::categorical("catalyst", {"Pd", "Ni", "Cu"}));
  spec.parameters.add(Parameter::fixed("solvent", "water"));
  spec.objectives.add(Objective("yield", Direction::Maximize));
  spec.settings["kernel"] = "squared_exp_ard";
  spec.settings["acquisition"] = "ucb";
  return spec;
}

int main(int argc, char **argv) {
  try {
    ServiceConfig config;
    if (argc > 1) {
      config = ConfigLoader(argv[1]).load();
    }
    const int rounds = argc > 2 ? std::atoi(argv[2]) : 10;
    const int batch_size = argc > 3 ? std::atoi(argv[3]) : 3;
    if (rounds <= 0 || batch_size <= 0) {
      std::cerr << "usage: campaign_demo [config.json] [rounds] [batch_size]"
                << std::endl;
      return 2;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    CampaignService service(config);
    const std::string id = service.create_campaign(demo_spec());
    std::cout << "Optimizing synthetic response in campaign " << id
              << std::endl;

    DummyEval eval;
    for (int round = 0; round < rounds; ++round) {
      std::shared_ptr<BatchTask> task =
          service.generate_next_batch(id, static_cast<size_t>(batch_size));
      RunBatch batch = task->get();

      std::vector<Measurement> results;
      for (const auto &row : batch.rows) {
        results.push_back(Measurement{{"yield", eval(row)}});
      }
      service.record_results(id, batch.batch_id, results);
      std::cout << "Round " << round << ": " << batch.batch_id << " ("
                << to_string(batch.source) << ")" << std::endl;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double total_time =
        std::chrono::duration<double>(end_time - start_time).count();

    std::cout << "Optimization completed successfully!" << std::endl;
    std::cout << "Total time: " << total_time << " seconds" << std::endl;

    boost::optional<BestArm> best = service.best_arm(id);
    if (best) {
      std::cout << "Best observed:";
      for (const auto &kv : best->row) {
        std::cout << " " << kv.first << "=" << kv.second.to_string();
      }
      std::cout << " predicted yield " << best->mean << " (+/- "
                << std::sqrt(best->uncertainty) << ")" << std::endl;
    }
    service.close_campaign(id);
  } catch (const BasilError &e) {
    get_logger("service")->error("{}: {}", e.kind(), e.what());
    return 1;
  } catch (const std::exception &e) {
    get_logger("service")->error("{}", e.what());
    return 1;
  }
  return 0;
}
