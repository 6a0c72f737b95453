// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "neurolap/hopfield/energy.h"

#include "Eigen/Core"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {
namespace {

using ::testing::DoubleEq;
using ::testing::DoubleNear;

Eigen::ArrayXXd SmallCosts() {
  Eigen::ArrayXXd costs(2, 2);
  costs << 1, 2, 3, 4;
  return costs;
}

TEST(ComputeEnergyTest, PermutationMatrixOnlyPaysCost) {
  Eigen::ArrayXXd activations(2, 2);
  activations << 1, 0, 0, 1;
  const EnergyTerms terms =
      ComputeEnergyTerms(activations, SmallCosts(), HopfieldParams());
  EXPECT_EQ(terms.row_penalty, 0.0);
  EXPECT_EQ(terms.column_penalty, 0.0);
  EXPECT_EQ(terms.count_penalty, 0.0);
  EXPECT_THAT(terms.cost, DoubleEq(2.5));
  EXPECT_THAT(terms.Total(), DoubleEq(2.5));
}

TEST(ComputeEnergyTest, UniformGridIsFeasibleForPenalties) {
  const Eigen::ArrayXXd activations = Eigen::ArrayXXd::Constant(2, 2, 0.5);
  EXPECT_THAT(ComputeEnergy(activations, SmallCosts(), HopfieldParams()),
              DoubleEq(2.5));
}

TEST(ComputeEnergyTest, AllTermsWeighted) {
  HopfieldParams params;
  params.set_row_penalty_weight(2.0);
  params.set_column_penalty_weight(3.0);
  params.set_count_penalty_weight(0.5);
  params.set_cost_weight(0.1);
  params.set_scale_count_penalty(false);
  const Eigen::ArrayXXd activations = Eigen::ArrayXXd::Ones(2, 2);
  const EnergyTerms terms =
      ComputeEnergyTerms(activations, SmallCosts(), params);
  // Row and column sums are 2, the grand total is 4.
  EXPECT_THAT(terms.row_penalty, DoubleEq(2.0));
  EXPECT_THAT(terms.column_penalty, DoubleEq(3.0));
  EXPECT_THAT(terms.count_penalty, DoubleEq(1.0));
  EXPECT_THAT(terms.cost, DoubleEq(0.5));
  EXPECT_THAT(ComputeEnergy(activations, SmallCosts(), params),
              DoubleEq(6.5));
}

TEST(ComputePotentialDriftTest, ColumnViolation) {
  HopfieldParams params;
  params.set_row_penalty_weight(1.0);
  params.set_column_penalty_weight(2.0);
  params.set_count_penalty_weight(3.0);
  params.set_cost_weight(0.5);
  params.set_scale_count_penalty(false);
  Eigen::ArrayXXd activations(2, 2);
  activations << 1, 0, 1, 0;
  const Eigen::ArrayXXd drift =
      ComputePotentialDrift(activations, SmallCosts(), params);
  Eigen::ArrayXXd expected(2, 2);
  expected << 2.5, -1.0, 3.5, 0.0;
  EXPECT_TRUE(drift.isApprox(expected)) << drift;
}

TEST(ComputePotentialDriftTest, RowViolation) {
  HopfieldParams params;
  params.set_count_penalty_weight(3.0);
  params.set_cost_weight(0.5);
  params.set_scale_count_penalty(false);
  Eigen::ArrayXXd activations(2, 2);
  activations << 1, 1, 0, 0;
  const Eigen::ArrayXXd drift =
      ComputePotentialDrift(activations, SmallCosts(), params);
  Eigen::ArrayXXd expected(2, 2);
  expected << 1.5, 2.0, 0.5, 1.0;
  EXPECT_TRUE(drift.isApprox(expected)) << drift;
}

TEST(ComputePotentialDriftTest, EmptyGridPullsEveryCellUp) {
  const Eigen::ArrayXXd drift =
      ComputePotentialDrift(Eigen::ArrayXXd::Zero(2, 2),
                            Eigen::ArrayXXd::Zero(2, 2), HopfieldParams());
  // -1 per row, -1 per column and -2 / 2 for the count.
  EXPECT_TRUE((drift == -3.0).all()) << drift;
}

TEST(EffectiveCountPenaltyWeightTest, DividesByMatrixSize) {
  HopfieldParams params;
  params.set_count_penalty_weight(3.0);
  EXPECT_DOUBLE_EQ(EffectiveCountPenaltyWeight(params, 1), 3.0);
  EXPECT_DOUBLE_EQ(EffectiveCountPenaltyWeight(params, 50), 0.06);
  params.set_scale_count_penalty(false);
  EXPECT_EQ(EffectiveCountPenaltyWeight(params, 50), 3.0);
}

TEST(ComputeEnergyTest, CountPenaltyScaledBySize) {
  HopfieldParams params;
  params.set_count_penalty_weight(2.0);
  const Eigen::ArrayXXd activations = Eigen::ArrayXXd::Ones(2, 2);
  // Count residual 2, weight 2 / 2.
  EXPECT_THAT(ComputeEnergyTerms(activations, SmallCosts(), params)
                  .count_penalty,
              DoubleEq(2.0));
  params.set_scale_count_penalty(false);
  EXPECT_THAT(ComputeEnergyTerms(activations, SmallCosts(), params)
                  .count_penalty,
              DoubleEq(4.0));
}

// On a large grid the scaled count pull is of the same order as the row and
// column pulls instead of n times larger.
TEST(ComputePotentialDriftTest, ScaledCountTermOnLargeGrid) {
  const int n = 50;
  const Eigen::ArrayXXd activations =
      Eigen::ArrayXXd::Constant(n, n, 2.0 / n);
  const Eigen::ArrayXXd drift = ComputePotentialDrift(
      activations, Eigen::ArrayXXd::Zero(n, n), HopfieldParams());
  // Row and column residuals are 1 each, the count residual is n.
  EXPECT_THAT(drift(0, 0), DoubleNear(3.0, 1e-9));
  EXPECT_TRUE(drift.isApproxToConstant(drift(0, 0))) << drift(0, 0);
}

}  // namespace
}  // namespace neurolap::hopfield
