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

#include <cstdint>

#include "Eigen/Core"
#include "absl/log/check.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

double EffectiveCountPenaltyWeight(const HopfieldParams& params,
                                   const int64_t n) {
  if (!params.scale_count_penalty() || n == 0) {
    return params.count_penalty_weight();
  }
  return params.count_penalty_weight() / n;
}

EnergyTerms ComputeEnergyTerms(const Eigen::ArrayXXd& activations,
                               const Eigen::ArrayXXd& costs,
                               const HopfieldParams& params) {
  DCHECK_EQ(activations.rows(), activations.cols());
  DCHECK_EQ(activations.rows(), costs.rows());
  DCHECK_EQ(activations.cols(), costs.cols());
  const double n = activations.rows();
  const double count_residual = activations.sum() - n;
  const double count_weight =
      EffectiveCountPenaltyWeight(params, activations.rows());
  EnergyTerms terms;
  terms.row_penalty = 0.5 * params.row_penalty_weight() *
                      (activations.rowwise().sum() - 1.0).square().sum();
  terms.column_penalty = 0.5 * params.column_penalty_weight() *
                         (activations.colwise().sum() - 1.0).square().sum();
  terms.count_penalty = 0.5 * count_weight * count_residual * count_residual;
  terms.cost = 0.5 * params.cost_weight() * (costs * activations).sum();
  return terms;
}

double ComputeEnergy(const Eigen::ArrayXXd& activations,
                     const Eigen::ArrayXXd& costs,
                     const HopfieldParams& params) {
  return ComputeEnergyTerms(activations, costs, params).Total();
}

Eigen::ArrayXXd ComputePotentialDrift(const Eigen::ArrayXXd& activations,
                                      const Eigen::ArrayXXd& costs,
                                      const HopfieldParams& params) {
  DCHECK_EQ(activations.rows(), activations.cols());
  DCHECK_EQ(activations.rows(), costs.rows());
  const int64_t n = activations.rows();
  const Eigen::ArrayXd row_residuals =
      params.row_penalty_weight() * (activations.rowwise().sum() - 1.0);
  const Eigen::ArrayXd column_residuals =
      params.column_penalty_weight() *
      (activations.colwise().sum().transpose() - 1.0);
  const double count_term =
      EffectiveCountPenaltyWeight(params, n) * (activations.sum() - n);

  Eigen::ArrayXXd drift = params.cost_weight() * costs + count_term;
  drift.colwise() += row_residuals;
  drift.rowwise() += column_residuals.transpose();
  return drift;
}

}  // namespace neurolap::hopfield
