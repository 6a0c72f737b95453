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

#ifndef NEUROLAP_HOPFIELD_TERMINATION_H_
#define NEUROLAP_HOPFIELD_TERMINATION_H_

#include <optional>
#include <string>

#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// Checks whether the sweep described by `stats` ends the solve, and returns
// the termination reason if so, and nullopt otherwise. Only
// `max_activation_delta`, `iteration_number` and `cumulative_time_sec` of
// `stats` are accessed. When several criteria hold at once, convergence takes
// precedence over the iteration limit, which takes precedence over the time
// limit.
std::optional<TerminationReason> CheckTerminationCriteria(
    const TerminationCriteria& criteria, const IterationStats& stats);

// Returns a one-line explanation of `reason` for `SolveLog.termination_string`.
std::string TerminationString(const TerminationCriteria& criteria,
                              TerminationReason reason,
                              const IterationStats& stats);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_TERMINATION_H_
