#include <public/errors.hpp>
#include <public/parameter_encoder.hpp>

#include "campaign_fixtures.hpp"

#include <gtest/gtest.h>

using namespace basil;
using namespace basil::test;

TEST(parameter_encoder_tests, dimension_counts_free_coordinates) {
  // temperature 1 + equivalents 1 + two catalysts, the fixed solvent adds none
  EXPECT_EQ(ParameterEncoder(coupling_spec().parameters).dim(), 4u);
  EXPECT_EQ(ParameterEncoder(reaction_spec().parameters).dim(), 4u);

  ParameterSpace fixed_only;
  fixed_only.add(Parameter::fixed("solvent", "water"));
  EXPECT_EQ(ParameterEncoder(fixed_only).dim(), 0u);
}

TEST(parameter_encoder_tests, encode_normalizes_to_unit_cube) {
  ParameterEncoder encoder(coupling_spec().parameters);
  Eigen::VectorXd x = encoder.encode(Row{{"temperature", 70.0},
                                         {"equivalents", 2.0},
                                         {"catalyst", "NiCl2"},
                                         {"solvent", "THF, dry"}});
  ASSERT_EQ(x.size(), 4);
  EXPECT_DOUBLE_EQ(x(0), 0.5);
  EXPECT_DOUBLE_EQ(x(1), 1.0);
  EXPECT_DOUBLE_EQ(x(2), 0.0);
  EXPECT_DOUBLE_EQ(x(3), 1.0);
}

TEST(parameter_encoder_tests, decode_snaps_to_the_space) {
  ParameterEncoder encoder(coupling_spec().parameters);
  Eigen::VectorXd x(4);
  x << 1.7, 0.3, 0.9, 0.2;
  Row row = encoder.decode(x);
  EXPECT_TRUE(encoder.space().contains(row));
  EXPECT_EQ(row.at("temperature"), ParameterValue(120.0));
  EXPECT_EQ(row.at("equivalents"), ParameterValue(1.5));
  EXPECT_EQ(row.at("catalyst"), ParameterValue("Pd(PPh3)4"));
  EXPECT_EQ(row.at("solvent"), ParameterValue("THF, dry"));
}

TEST(parameter_encoder_tests, decode_inverts_encode) {
  ParameterEncoder encoder(reaction_spec().parameters);
  Row row{{"x", 2.5}, {"y", "C"}};
  EXPECT_EQ(encoder.decode(encoder.encode(row)), row);
}

TEST(parameter_encoder_tests, rejects_foreign_input) {
  ParameterEncoder encoder(reaction_spec().parameters);
  EXPECT_THROW(encoder.encode(Row{{"x", 11.0}, {"y", "A"}}), ValidationError);
  EXPECT_THROW(encoder.decode(Eigen::VectorXd::Zero(2)), ValidationError);
}
