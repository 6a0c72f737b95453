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

#include "neurolap/hopfield/hopfield_solver.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "Eigen/Core"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/base/timer.h"
#include "neurolap/hopfield/activation.h"
#include "neurolap/hopfield/cost_matrix.h"
#include "neurolap/hopfield/energy.h"
#include "neurolap/hopfield/iteration_stats.h"
#include "neurolap/hopfield/permutation_extraction.h"
#include "neurolap/hopfield/solve_log.pb.h"
#include "neurolap/hopfield/solvers.pb.h"
#include "neurolap/hopfield/solvers_proto_validation.h"
#include "neurolap/hopfield/termination.h"
#include "neurolap/util/logging.h"

namespace neurolap::hopfield {

namespace {

void LogIterationStatsHeader(SolverLogger& logger) {
  SOLVER_LOG(&logger,
             absl::StrFormat("%6s %8s | %10s %12s %8s | %10s %10s %10s",
                             "iter#", "time", "max_delta", "energy", "temp",
                             "row_res", "col_res", "count_res"));
}

void LogIterationStats(const IterationStats& stats, SolverLogger& logger) {
  SOLVER_LOG(&logger,
             absl::StrFormat(
                 "%6d %8.3f | %10.3e %12.6g %8.4f | %10.3e %10.3e %10.3e",
                 stats.iteration_number(), stats.cumulative_time_sec(),
                 stats.max_activation_delta(), stats.energy(),
                 stats.temperature(), stats.l_inf_row_residual(),
                 stats.l_inf_column_residual(), stats.count_residual()));
}

// Divisor applied to the costs before the dynamics.
double CostScale(const CostMatrix& costs, const HopfieldParams& params) {
  if (!params.normalize_costs()) return 1.0;
  const double max_cost = costs.maxCoeff();
  return max_cost > 0.0 ? max_cost : 1.0;
}

}  // namespace

HopfieldNetwork::HopfieldNetwork(Eigen::ArrayXXd costs,
                                 const HopfieldParams& params)
    : costs_(std::move(costs)),
      params_(params),
      temperature_(params.initial_temperature()),
      last_sweep_temperature_(params.initial_temperature()) {
  CHECK_EQ(costs_.rows(), costs_.cols());
  CHECK_GT(costs_.rows(), 0);
  SetActivations(Eigen::ArrayXXd::Constant(costs_.rows(), costs_.cols(),
                                           1.0 / costs_.rows()));
}

void HopfieldNetwork::Initialize(std::mt19937& random) {
  const int n = size();
  Eigen::ArrayXXd activations(n, n);
  const double perturbation = params_.initial_perturbation();
  if (perturbation > 0.0) {
    std::uniform_real_distribution<double> distribution(-perturbation,
                                                        perturbation);
    // Row-major draw order, so that the grid does not depend on Eigen's
    // storage order.
    for (int i = 0; i < n; ++i) {
      for (int j = 0; j < n; ++j) {
        activations(i, j) = (1.0 + distribution(random)) / n;
      }
    }
  } else {
    activations.setConstant(1.0 / n);
  }
  SetActivations(activations);
}

void HopfieldNetwork::SetActivations(const Eigen::ArrayXXd& activations) {
  CHECK_EQ(activations.rows(), costs_.rows());
  CHECK_EQ(activations.cols(), costs_.cols());
  activations_ = activations.max(kMinActivation).min(1.0 - kMinActivation);
  potentials_ = InverseSigmoid(activations_, temperature_);
  previous_activations_ = activations_;
}

void HopfieldNetwork::Sweep() {
  // The drift is computed from the grid before the sweep, for all cells at
  // once.
  potentials_ -= params_.step_size() *
                 ComputePotentialDrift(activations_, costs_, params_);
  previous_activations_.swap(activations_);
  activations_ = Sigmoid(potentials_, temperature_);
  last_sweep_temperature_ = temperature_;
  temperature_ = std::max(temperature_ * params_.temperature_decay(),
                          params_.min_temperature());
}

absl::StatusOr<AssignmentSolution> SolveAssignment(
    const CostMatrix& costs, const HopfieldParams& params,
    std::function<void(const std::string&)> message_callback,
    IterationStatsCallback iteration_stats_callback) {
  RETURN_IF_ERROR(ValidateHopfieldParams(params));
  RETURN_IF_ERROR(ValidateCostMatrix(costs, params.matrix_limits()));

  SolverLogger logger;
  logger.EnableLogging(params.verbosity_level() >= 1);
  if (message_callback) {
    logger.AddInfoLoggingCallback(std::move(message_callback));
  } else {
    logger.SetLogToStdOut(params.log_to_stdout());
  }

  WallTimer timer;
  timer.Start();
  const int n = static_cast<int>(costs.rows());
  const double cost_scale = CostScale(costs, params);
  SOLVER_LOG(&logger, "Solving a ", n, "x", n,
             " assignment problem, cost scale ", cost_scale);
  SOLVER_LOG(&logger, "Parameters: ", params.ShortDebugString());
  VLOG(2) << "Cost matrix: " << CostMatrixToString(costs, 2000);

  HopfieldNetwork network(Eigen::ArrayXXd(costs.array() / cost_scale), params);
  std::mt19937 random(static_cast<uint32_t>(params.random_seed()));
  network.Initialize(random);

  SolveLog solve_log;
  solve_log.set_matrix_size(n);
  solve_log.set_cost_scale(cost_scale);
  *solve_log.mutable_params() = params;

  const bool log_progress = params.verbosity_level() >= 2;
  if (log_progress) LogIterationStatsHeader(logger);

  IterationStats stats;
  std::optional<TerminationReason> termination_reason;
  for (int iteration = 1; !termination_reason.has_value(); ++iteration) {
    network.Sweep();
    stats = ComputeIterationStats(
        iteration, network.activations(), network.previous_activations(),
        network.costs(), params, network.last_sweep_temperature(),
        timer.Get());
    if (params.record_iteration_stats()) {
      *solve_log.add_iteration_stats() = stats;
    }
    if (iteration_stats_callback) iteration_stats_callback(stats);
    termination_reason =
        CheckTerminationCriteria(params.termination_criteria(), stats);
    if (log_progress && (iteration == 1 ||
                         iteration % params.log_interval() == 0 ||
                         termination_reason.has_value())) {
      LogIterationStats(stats, logger);
    }
  }

  ExtractedPermutation extracted = ExtractPermutation(network.activations());
  CHECK(IsPermutation(extracted.assignment));

  AssignmentSolution solution;
  solution.iterations = stats.iteration_number();
  solution.total_cost = AssignmentCost(costs, extracted.assignment);
  solution.assignment = std::move(extracted.assignment);

  solve_log.set_termination_reason(*termination_reason);
  solve_log.set_termination_string(TerminationString(
      params.termination_criteria(), *termination_reason, stats));
  solve_log.set_iteration_count(stats.iteration_number());
  *solve_log.mutable_final_iteration_stats() = stats;
  solve_log.set_num_conflicting_rows(extracted.num_conflicting_rows);
  solve_log.set_repair_applied(extracted.repair_applied);
  timer.Stop();
  solve_log.set_solve_time_sec(timer.Get());

  SOLVER_LOG(&logger, "Termination: ",
             TerminationReason_Name(*termination_reason), " (",
             solve_log.termination_string(), ")");
  SOLVER_LOG(&logger, "Iterations: ", solution.iterations,
             ", total cost: ", solution.total_cost,
             ", conflicting rows: ", extracted.num_conflicting_rows,
             extracted.repair_applied ? ", repaired" : "",
             ", time: ", absl::StrFormat("%.3fs", timer.Get()));
  solution.solve_log = std::move(solve_log);
  return solution;
}

absl::StatusOr<AssignmentSolution> SolveAssignment(
    const std::vector<std::vector<double>>& rows,
    const HopfieldParams& params) {
  RETURN_IF_ERROR(ValidateHopfieldParams(params));
  ASSIGN_OR_RETURN(const CostMatrix costs,
                   CostMatrixFromRows(rows, params.matrix_limits()));
  return SolveAssignment(costs, params);
}

}  // namespace neurolap::hopfield
