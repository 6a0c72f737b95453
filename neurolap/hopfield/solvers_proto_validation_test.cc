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

#include "neurolap/hopfield/solvers_proto_validation.h"

#include <limits>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {
namespace {

using ::testing::HasSubstr;

TEST(ValidateTerminationCriteria, DefaultIsValid) {
  TerminationCriteria criteria;
  const absl::Status status = ValidateTerminationCriteria(criteria);
  EXPECT_TRUE(status.ok()) << status;
}

TEST(ValidateTerminationCriteria, BadIterationLimit) {
  TerminationCriteria criteria;
  criteria.set_iteration_limit(0);
  const absl::Status status = ValidateTerminationCriteria(criteria);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("iteration_limit"));
}

TEST(ValidateTerminationCriteria, BadConvergenceThreshold) {
  TerminationCriteria criteria;
  criteria.set_convergence_threshold(0.0);
  const absl::Status status = ValidateTerminationCriteria(criteria);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("convergence_threshold"));
}

TEST(ValidateTerminationCriteria, NanConvergenceThreshold) {
  TerminationCriteria criteria;
  criteria.set_convergence_threshold(std::numeric_limits<double>::quiet_NaN());
  const absl::Status status = ValidateTerminationCriteria(criteria);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("convergence_threshold is NAN"));
}

TEST(ValidateTerminationCriteria, BadTimeSecLimit) {
  TerminationCriteria criteria;
  criteria.set_time_sec_limit(-1.0);
  const absl::Status status = ValidateTerminationCriteria(criteria);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("time_sec_limit"));
}

TEST(ValidateTerminationCriteria, ZeroTimeSecLimitIsValid) {
  TerminationCriteria criteria;
  criteria.set_time_sec_limit(0.0);
  EXPECT_TRUE(ValidateTerminationCriteria(criteria).ok());
}

TEST(ValidateMatrixLimits, DefaultIsValid) {
  MatrixLimits limits;
  EXPECT_TRUE(ValidateMatrixLimits(limits).ok());
}

TEST(ValidateMatrixLimits, BadMaxSize) {
  MatrixLimits limits;
  limits.set_max_size(0);
  const absl::Status status = ValidateMatrixLimits(limits);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("max_size"));
}

TEST(ValidateMatrixLimits, BadMaxCostValue) {
  MatrixLimits limits;
  limits.set_max_cost_value(0.0);
  const absl::Status status = ValidateMatrixLimits(limits);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("max_cost_value must be positive"));
}

TEST(ValidateMatrixLimits, InfiniteMaxCostValueIsValid) {
  MatrixLimits limits;
  limits.set_max_cost_value(std::numeric_limits<double>::infinity());
  EXPECT_TRUE(ValidateMatrixLimits(limits).ok());
}

TEST(ValidateHopfieldParams, DefaultIsValid) {
  HopfieldParams params;
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_TRUE(status.ok()) << status;
}

TEST(ValidateHopfieldParams, BadTerminationCriteria) {
  HopfieldParams params;
  params.mutable_termination_criteria()->set_iteration_limit(-3);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("iteration_limit"));
  EXPECT_THAT(status.message(), HasSubstr("termination_criteria"));
}

TEST(ValidateHopfieldParams, BadMatrixLimits) {
  HopfieldParams params;
  params.mutable_matrix_limits()->set_max_size(-1);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("max_size"));
}

TEST(ValidateHopfieldParams, BadRowPenaltyWeight) {
  HopfieldParams params;
  params.set_row_penalty_weight(0.0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("row_penalty_weight"));
}

TEST(ValidateHopfieldParams, BadColumnPenaltyWeight) {
  HopfieldParams params;
  params.set_column_penalty_weight(-1.0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("column_penalty_weight"));
}

TEST(ValidateHopfieldParams, BadCountPenaltyWeight) {
  HopfieldParams params;
  params.set_count_penalty_weight(std::numeric_limits<double>::infinity());
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("count_penalty_weight"));
}

TEST(ValidateHopfieldParams, BadCostWeight) {
  HopfieldParams params;
  params.set_cost_weight(std::numeric_limits<double>::quiet_NaN());
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("cost_weight is NAN"));
}

TEST(ValidateHopfieldParams, BadStepSize) {
  HopfieldParams params;
  params.set_step_size(-0.1);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("step_size must be positive"));
}

TEST(ValidateHopfieldParams, BadInitialTemperature) {
  HopfieldParams params;
  params.set_initial_temperature(0.0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("initial_temperature"));
}

TEST(ValidateHopfieldParams, BadMinTemperature) {
  HopfieldParams params;
  params.set_min_temperature(0.0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("min_temperature"));
}

TEST(ValidateHopfieldParams, MinTemperatureAboveInitialTemperature) {
  HopfieldParams params;
  params.set_initial_temperature(0.5);
  params.set_min_temperature(0.6);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("min_temperature must not exceed"));
}

TEST(ValidateHopfieldParams, BadTemperatureDecay) {
  HopfieldParams params;
  params.set_temperature_decay(1.5);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("temperature_decay"));
}

TEST(ValidateHopfieldParams, UnitTemperatureDecayIsValid) {
  HopfieldParams params;
  params.set_temperature_decay(1.0);
  EXPECT_TRUE(ValidateHopfieldParams(params).ok());
}

TEST(ValidateHopfieldParams, BadInitialPerturbation) {
  HopfieldParams params;
  params.set_initial_perturbation(1.0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("initial_perturbation"));
}

TEST(ValidateHopfieldParams, BadLogInterval) {
  HopfieldParams params;
  params.set_log_interval(0);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("log_interval"));
}

TEST(ValidateHopfieldParams, BadVerbosityLevel) {
  HopfieldParams params;
  params.set_verbosity_level(-1);
  const absl::Status status = ValidateHopfieldParams(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("verbosity_level"));
}

}  // namespace
}  // namespace neurolap::hopfield
