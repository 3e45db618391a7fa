#include <public/errors.hpp>
#include <public/objective_spec.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace basil;

TEST(objective_spec_tests, single_objective_uses_raw_value) {
  ObjectiveSpec maximize({Objective("z", Direction::Maximize)});
  EXPECT_DOUBLE_EQ(maximize.scalarize({{"z", 4.5}}), 4.5);

  ObjectiveSpec minimize({Objective("z", Direction::Minimize)});
  EXPECT_DOUBLE_EQ(minimize.scalarize({{"z", 4.5}}), -4.5);
}

TEST(objective_spec_tests, desirability_is_clamped) {
  Objective up("yield", Direction::Maximize, 1.0, 0.0, 100.0);
  EXPECT_DOUBLE_EQ(up.desirability(25.0), 0.25);
  EXPECT_DOUBLE_EQ(up.desirability(150.0), 1.0);
  EXPECT_DOUBLE_EQ(up.desirability(-3.0), 0.0);

  Objective down("cost", Direction::Minimize, 1.0, 0.0, 50.0);
  EXPECT_DOUBLE_EQ(down.desirability(10.0), 0.8);
  EXPECT_DOUBLE_EQ(down.desirability(80.0), 0.0);
}

TEST(objective_spec_tests, several_objectives_blend_by_weighted_geometric_mean) {
  ObjectiveSpec spec({Objective("a", Direction::Maximize, 1.0, 0.0, 10.0),
                      Objective("b", Direction::Minimize, 1.0, 0.0, 100.0)});
  EXPECT_NO_THROW(spec.validate());
  EXPECT_DOUBLE_EQ(spec.scalarize({{"a", 10.0}, {"b", 0.0}}), 1.0);
  EXPECT_NEAR(spec.scalarize({{"a", 5.0}, {"b", 50.0}}), 0.5, 1e-12);

  ObjectiveSpec weighted({Objective("a", Direction::Maximize, 3.0, 0.0, 10.0),
                          Objective("b", Direction::Minimize, 1.0, 0.0, 100.0)});
  EXPECT_NEAR(weighted.scalarize({{"a", 10.0}, {"b", 75.0}}),
              std::pow(0.25, 0.25), 1e-12);
}

TEST(objective_spec_tests, zero_weight_objective_is_ignored) {
  ObjectiveSpec spec({Objective("a", Direction::Maximize, 1.0, 0.0, 10.0),
                      Objective("b", Direction::Maximize, 0.0, 0.0, 10.0)});
  EXPECT_NO_THROW(spec.validate());
  EXPECT_NEAR(spec.scalarize({{"a", 4.0}, {"b", 0.0}}), 0.4, 1e-12);
}

TEST(objective_spec_tests, worst_value_does_not_collapse_the_blend) {
  ObjectiveSpec spec({Objective("a", Direction::Maximize, 1.0, 0.0, 10.0),
                      Objective("b", Direction::Maximize, 1.0, 0.0, 10.0)});
  double low = spec.scalarize({{"a", 0.0}, {"b", 10.0}});
  double lower = spec.scalarize({{"a", 0.0}, {"b", 5.0}});
  EXPECT_GT(low, 0.0);
  EXPECT_GT(low, lower);
}

TEST(objective_spec_tests, validation) {
  EXPECT_THROW(ObjectiveSpec().validate(), ValidationError);

  EXPECT_THROW(ObjectiveSpec({Objective("a", Direction::Maximize),
                              Objective("a", Direction::Minimize)})
                   .validate(),
               ValidationError);

  EXPECT_THROW(ObjectiveSpec({Objective("a", Direction::Maximize, -1.0)})
                   .validate(),
               ValidationError);

  // bounds are needed once several objectives are blended
  EXPECT_THROW(ObjectiveSpec({Objective("a", Direction::Maximize),
                              Objective("b", Direction::Maximize)})
                   .validate(),
               ValidationError);

  EXPECT_THROW(
      ObjectiveSpec({Objective("a", Direction::Maximize, 0.0, 0.0, 1.0),
                     Objective("b", Direction::Maximize, 0.0, 0.0, 1.0)})
          .validate(),
      ValidationError);

  EXPECT_THROW(ObjectiveSpec({Objective("a", Direction::Maximize, 1.0, 5.0,
                                        5.0)})
                   .validate(),
               ValidationError);

  EXPECT_THROW(ObjectiveSpec({Objective("status", Direction::Maximize)})
                   .validate(),
               ValidationError);
}

TEST(objective_spec_tests, check_measurement) {
  ObjectiveSpec spec({Objective("a", Direction::Maximize, 1.0, 0.0, 10.0),
                      Objective("b", Direction::Minimize, 1.0, 0.0, 100.0)});
  EXPECT_NO_THROW(spec.check_measurement({{"a", 1.0}, {"b", 2.0}}));
  EXPECT_THROW(spec.check_measurement({{"a", 1.0}}), ValidationError);
  EXPECT_THROW(spec.check_measurement(
                   {{"a", 1.0}, {"b", std::numeric_limits<double>::quiet_NaN()}}),
               ValidationError);
  EXPECT_THROW(spec.check_measurement({{"a", 1.0}, {"b", 2.0}, {"c", 3.0}}),
               ValidationError);
}

TEST(objective_spec_tests, json_round_trip) {
  ObjectiveSpec spec({Objective("yield", Direction::Maximize, 2.0, 0.0, 100.0),
                      Objective("cost", Direction::Minimize)});
  EXPECT_EQ(ObjectiveSpec::from_json(spec.to_json()), spec);

  nlohmann::json bad = nlohmann::json::array();
  bad.push_back({{"name", "z"}, {"direction", "sideways"}});
  EXPECT_THROW(ObjectiveSpec::from_json(bad), ValidationError);
}
