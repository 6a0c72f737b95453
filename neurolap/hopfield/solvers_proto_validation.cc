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

#include <cmath>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

using ::absl::InvalidArgumentError;
using ::absl::OkStatus;

namespace {

absl::Status CheckNonNegative(const double value,
                              const absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (value < 0) {
    return InvalidArgumentError(absl::StrCat(name, " must be non-negative"));
  }
  return OkStatus();
}

absl::Status CheckPositive(const double value, const absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (value <= 0) {
    return InvalidArgumentError(absl::StrCat(name, " must be positive"));
  }
  return OkStatus();
}

absl::Status CheckPositiveAndFinite(const double value,
                                    const absl::string_view name) {
  RETURN_IF_ERROR(CheckPositive(value, name));
  if (std::isinf(value)) {
    return InvalidArgumentError(absl::StrCat(name, " must be finite"));
  }
  return OkStatus();
}

}  // namespace

absl::Status ValidateTerminationCriteria(const TerminationCriteria& criteria) {
  if (criteria.iteration_limit() < 1) {
    return InvalidArgumentError("iteration_limit must be at least 1");
  }
  RETURN_IF_ERROR(CheckPositive(criteria.convergence_threshold(),
                                "convergence_threshold"));
  RETURN_IF_ERROR(
      CheckNonNegative(criteria.time_sec_limit(), "time_sec_limit"));
  return OkStatus();
}

absl::Status ValidateMatrixLimits(const MatrixLimits& limits) {
  if (limits.max_size() < 1) {
    return InvalidArgumentError("max_size must be at least 1");
  }
  RETURN_IF_ERROR(CheckPositive(limits.max_cost_value(), "max_cost_value"));
  return OkStatus();
}

absl::Status ValidateHopfieldParams(const HopfieldParams& params) {
  RETURN_IF_ERROR(ValidateTerminationCriteria(params.termination_criteria()))
      << "termination_criteria invalid";
  RETURN_IF_ERROR(ValidateMatrixLimits(params.matrix_limits()))
      << "matrix_limits invalid";
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.row_penalty_weight(),
                                         "row_penalty_weight"));
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.column_penalty_weight(),
                                         "column_penalty_weight"));
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.count_penalty_weight(),
                                         "count_penalty_weight"));
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.cost_weight(), "cost_weight"));
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.step_size(), "step_size"));
  RETURN_IF_ERROR(CheckPositiveAndFinite(params.initial_temperature(),
                                         "initial_temperature"));
  RETURN_IF_ERROR(
      CheckPositiveAndFinite(params.min_temperature(), "min_temperature"));
  if (params.min_temperature() > params.initial_temperature()) {
    return InvalidArgumentError(
        "min_temperature must not exceed initial_temperature");
  }
  if (std::isnan(params.temperature_decay())) {
    return InvalidArgumentError("temperature_decay is NAN");
  }
  if (params.temperature_decay() <= 0 || params.temperature_decay() > 1) {
    return InvalidArgumentError("temperature_decay must be in (0, 1]");
  }
  if (std::isnan(params.initial_perturbation())) {
    return InvalidArgumentError("initial_perturbation is NAN");
  }
  if (params.initial_perturbation() < 0 || params.initial_perturbation() >= 1) {
    return InvalidArgumentError("initial_perturbation must be in [0, 1)");
  }
  if (params.verbosity_level() < 0) {
    return InvalidArgumentError("verbosity_level must be non-negative");
  }
  if (params.log_interval() < 1) {
    return InvalidArgumentError("log_interval must be at least 1");
  }
  return OkStatus();
}

}  // namespace neurolap::hopfield
