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

// Energy of a Hopfield activation grid V for the assignment problem and the
// drift applied to the internal potentials by one synchronous sweep.
//
//   E(V) = (A/2) sum_i (r_i - 1)^2 + (B/2) sum_j (c_j - 1)^2
//        + (C/2) (s - n)^2 + (D/2) sum_ij cost_ij V_ij
//
// where r_i = sum_j V_ij, c_j = sum_i V_ij and s = sum_ij V_ij. The weights
// A, B, C and D are `HopfieldParams::row_penalty_weight`,
// `column_penalty_weight`, `count_penalty_weight` and `cost_weight`, with C
// divided by n when `scale_count_penalty` is set.

#ifndef NEUROLAP_HOPFIELD_ENERGY_H_
#define NEUROLAP_HOPFIELD_ENERGY_H_

#include <cstdint>

#include "Eigen/Core"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// The weighted terms of E(V). Each is non-negative when costs are.
struct EnergyTerms {
  double row_penalty = 0.0;
  double column_penalty = 0.0;
  double count_penalty = 0.0;
  double cost = 0.0;

  double Total() const {
    return row_penalty + column_penalty + count_penalty + cost;
  }
};

// The C of E(V) for an n x n grid.
double EffectiveCountPenaltyWeight(const HopfieldParams& params, int64_t n);

// `activations` and `costs` must both be n x n.
EnergyTerms ComputeEnergyTerms(const Eigen::ArrayXXd& activations,
                               const Eigen::ArrayXXd& costs,
                               const HopfieldParams& params);

double ComputeEnergy(const Eigen::ArrayXXd& activations,
                     const Eigen::ArrayXXd& costs,
                     const HopfieldParams& params);

// Returns the grid G with
//   G_ij = A (r_i - 1) + B (c_j - 1) + C (s - n) + D cost_ij,
// all sums taken over `activations`. A sweep moves the potentials by
// `-step_size * G`.
Eigen::ArrayXXd ComputePotentialDrift(const Eigen::ArrayXXd& activations,
                                      const Eigen::ArrayXXd& costs,
                                      const HopfieldParams& params);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_ENERGY_H_
