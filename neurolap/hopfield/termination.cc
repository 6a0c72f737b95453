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

#include "neurolap/hopfield/termination.h"

#include <optional>
#include <string>

#include "absl/strings/str_format.h"
#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

std::optional<TerminationReason> CheckTerminationCriteria(
    const TerminationCriteria& criteria, const IterationStats& stats) {
  if (stats.max_activation_delta() < criteria.convergence_threshold()) {
    return TERMINATION_REASON_CONVERGED;
  }
  if (stats.iteration_number() >= criteria.iteration_limit()) {
    return TERMINATION_REASON_ITERATION_LIMIT;
  }
  if (stats.cumulative_time_sec() >= criteria.time_sec_limit()) {
    return TERMINATION_REASON_TIME_LIMIT;
  }
  return std::nullopt;
}

std::string TerminationString(const TerminationCriteria& criteria,
                              const TerminationReason reason,
                              const IterationStats& stats) {
  switch (reason) {
    case TERMINATION_REASON_CONVERGED:
      return absl::StrFormat("max activation delta %g below threshold %g",
                             stats.max_activation_delta(),
                             criteria.convergence_threshold());
    case TERMINATION_REASON_ITERATION_LIMIT:
      return absl::StrFormat(
          "iteration limit %d reached with max activation delta %g",
          criteria.iteration_limit(), stats.max_activation_delta());
    case TERMINATION_REASON_TIME_LIMIT:
      return absl::StrFormat("time limit %gs reached after %d iterations",
                             criteria.time_sec_limit(),
                             stats.iteration_number());
    default:
      return "";
  }
}

}  // namespace neurolap::hopfield
