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

#include "neurolap/hopfield/iteration_stats.h"

#include <cmath>

#include "Eigen/Core"
#include "absl/log/check.h"
#include "neurolap/hopfield/energy.h"
#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

double MaxActivationDelta(const Eigen::ArrayXXd& current,
                          const Eigen::ArrayXXd& previous) {
  DCHECK_EQ(current.rows(), previous.rows());
  DCHECK_EQ(current.cols(), previous.cols());
  if (current.size() == 0) return 0.0;
  return (current - previous).abs().maxCoeff();
}

IterationStats ComputeIterationStats(
    const int iteration_number, const Eigen::ArrayXXd& activations,
    const Eigen::ArrayXXd& previous_activations, const Eigen::ArrayXXd& costs,
    const HopfieldParams& params, const double temperature,
    const double cumulative_time_sec) {
  const double n = activations.rows();
  IterationStats stats;
  stats.set_iteration_number(iteration_number);
  stats.set_max_activation_delta(
      MaxActivationDelta(activations, previous_activations));
  stats.set_energy(ComputeEnergy(activations, costs, params));
  stats.set_temperature(temperature);
  stats.set_l_inf_row_residual(
      (activations.rowwise().sum() - 1.0).abs().maxCoeff());
  stats.set_l_inf_column_residual(
      (activations.colwise().sum() - 1.0).abs().maxCoeff());
  stats.set_count_residual(std::abs(activations.sum() - n));
  stats.set_cumulative_time_sec(cumulative_time_sec);
  return stats;
}

}  // namespace neurolap::hopfield
