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

// Solves the linear assignment problem with a continuous Hopfield network.
//
// The network keeps one neuron per (task, resource) cell of an n x n cost
// matrix. Each neuron has an internal potential U_ij and an output
// V_ij = sigmoid_T(U_ij) in [0, 1], read as the belief that task i goes to
// resource j. Synchronous sweeps move every potential along
//   U_ij -= step_size * (A (r_i - 1) + B (c_j - 1) + C (s - n) + D cost_ij)
// (see energy.h, C is divided by n by default), while the temperature T is
// annealed geometrically. Once the grid stops moving, or a limit is hit, the
// grid is projected onto a permutation by `ExtractPermutation()`.
//
// The method is a heuristic: the returned assignment is always a valid
// permutation but need not be optimal.

#ifndef NEUROLAP_HOPFIELD_HOPFIELD_SOLVER_H_
#define NEUROLAP_HOPFIELD_HOPFIELD_SOLVER_H_

#include <functional>
#include <random>
#include <string>
#include <vector>

#include "Eigen/Core"
#include "absl/status/statusor.h"
#include "neurolap/hopfield/cost_matrix.h"
#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

struct AssignmentSolution {
  // assignment[i] is the resource assigned to task i; a permutation of
  // 0..n-1.
  std::vector<int> assignment;
  // sum_i cost(i, assignment[i]) on the input (not normalized) matrix.
  double total_cost = 0.0;
  // Number of sweeps run, in [1, iteration_limit].
  int iterations = 0;
  SolveLog solve_log;
};

using IterationStatsCallback = std::function<void(const IterationStats&)>;

// The state of one solve: potentials, activations and temperature. Owned by a
// single solve and not thread-safe.
class HopfieldNetwork {
 public:
  // Activations are kept in [kMinActivation, 1 - kMinActivation] when
  // converted back to potentials.
  static constexpr double kMinActivation = 1.0e-6;

  // `costs` are the n x n costs seen by the dynamics, after any
  // normalization. `params` must be valid.
  HopfieldNetwork(Eigen::ArrayXXd costs, const HopfieldParams& params);

  HopfieldNetwork(const HopfieldNetwork&) = delete;
  HopfieldNetwork& operator=(const HopfieldNetwork&) = delete;

  // Sets every activation to (1 + r) / n, r drawn uniformly from
  // [-initial_perturbation, initial_perturbation], and the potentials to
  // their inverse at the current temperature.
  void Initialize(std::mt19937& random);

  // Replaces the activations by `activations` (clamped) and the potentials by
  // their inverse at the current temperature.
  void SetActivations(const Eigen::ArrayXXd& activations);

  // One synchronous update of the whole grid at the current temperature,
  // followed by one annealing step of the temperature.
  void Sweep();

  int size() const { return static_cast<int>(costs_.rows()); }
  const Eigen::ArrayXXd& costs() const { return costs_; }
  const Eigen::ArrayXXd& potentials() const { return potentials_; }
  const Eigen::ArrayXXd& activations() const { return activations_; }
  // Activations before the last `Sweep()`.
  const Eigen::ArrayXXd& previous_activations() const {
    return previous_activations_;
  }
  // Temperature the next `Sweep()` will use.
  double temperature() const { return temperature_; }
  // Temperature used by the last `Sweep()`.
  double last_sweep_temperature() const { return last_sweep_temperature_; }

 private:
  const Eigen::ArrayXXd costs_;
  const HopfieldParams params_;
  double temperature_;
  double last_sweep_temperature_;
  Eigen::ArrayXXd potentials_;
  Eigen::ArrayXXd activations_;
  Eigen::ArrayXXd previous_activations_;
};

// Solves the assignment problem for `costs`.
//
// Returns `InvalidArgumentError` if `params` is invalid (see
// `ValidateHopfieldParams()`) or `costs` is not a valid cost matrix under
// `params.matrix_limits()`. No iteration is run in that case. Running out of
// iterations or time is not an error: a permutation is still returned, and
// `solve_log.termination_reason` tells how the loop ended.
//
// Logging is controlled by `params.verbosity_level()`. If `message_callback`
// is not nullptr, log lines are passed to it instead of being printed. If
// `iteration_stats_callback` is not nullptr, it is called after every sweep.
//
// The result only depends on `costs` and `params` (including
// `params.random_seed()`); concurrent calls are safe.
absl::StatusOr<AssignmentSolution> SolveAssignment(
    const CostMatrix& costs, const HopfieldParams& params,
    std::function<void(const std::string&)> message_callback = nullptr,
    IterationStatsCallback iteration_stats_callback = nullptr);

// Like above, with the matrix given as rows. Ragged rows are rejected.
absl::StatusOr<AssignmentSolution> SolveAssignment(
    const std::vector<std::vector<double>>& rows, const HopfieldParams& params);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_HOPFIELD_SOLVER_H_
