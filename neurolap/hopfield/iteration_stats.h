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

#ifndef NEUROLAP_HOPFIELD_ITERATION_STATS_H_
#define NEUROLAP_HOPFIELD_ITERATION_STATS_H_

#include "Eigen/Core"
#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// Returns max_ij |current_ij - previous_ij|. Both grids must have the same
// shape.
double MaxActivationDelta(const Eigen::ArrayXXd& current,
                          const Eigen::ArrayXXd& previous);

// Fills every field of `IterationStats` for the grid `activations` obtained
// by sweep number `iteration_number` from `previous_activations`. `costs` are
// the costs seen by the dynamics and `temperature` is the one the sweep used.
IterationStats ComputeIterationStats(
    int iteration_number, const Eigen::ArrayXXd& activations,
    const Eigen::ArrayXXd& previous_activations, const Eigen::ArrayXXd& costs,
    const HopfieldParams& params, double temperature,
    double cumulative_time_sec);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_ITERATION_STATS_H_
