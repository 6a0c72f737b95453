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

#include "Eigen/Core"
#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "benchmark/benchmark.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/assignment_io.h"
#include "neurolap/hopfield/batch_solver.h"
#include "neurolap/hopfield/cost_matrix.h"
#include "neurolap/hopfield/hopfield_solver.h"
#include "neurolap/hopfield/solvers.pb.h"
#include "neurolap/hopfield/test_util.h"

namespace neurolap::hopfield {
namespace {

static void BM_SolveAssignment(benchmark::State& state) {
  const int n = state.range(0);
  const CostMatrix costs = RandomCostMatrix(n, /*seed=*/n);
  const HopfieldParams params;
  for (auto _ : state) {
    absl::StatusOr<AssignmentSolution> solution =
        SolveAssignment(costs, params);
    CHECK_OK(solution.status());
    ::benchmark::DoNotOptimize(solution->total_cost);
  }
  state.SetItemsProcessed(state.iterations() * n * n);
}

BENCHMARK(BM_SolveAssignment)->Arg(2)->Arg(4)->Arg(10)->Arg(25)->Arg(50);

// A single sweep, isolated from setup and extraction.
static void BM_Sweep(benchmark::State& state) {
  const int n = state.range(0);
  const Eigen::ArrayXXd costs(RandomCostMatrix(n, /*seed=*/n).array() / 100.0);
  HopfieldNetwork network(costs, HopfieldParams());
  for (auto _ : state) {
    network.Sweep();
    ::benchmark::DoNotOptimize(network.activations().data());
  }
  state.SetItemsProcessed(state.iterations() * n * n);
}

BENCHMARK(BM_Sweep)->Arg(4)->Arg(10)->Arg(50);

static void BM_SolveBatch(benchmark::State& state) {
  const int num_threads = state.range(0);
  BatchRequest request;
  for (int i = 0; i < 32; ++i) {
    BatchProblem& problem = *request.add_problems();
    problem.set_id(absl::StrCat(i));
    *problem.mutable_cost_matrix() =
        CostMatrixToListValue(RandomCostMatrix(10, /*seed=*/i));
  }
  BatchOptions options;
  options.num_threads = num_threads;
  const HopfieldParams params;
  for (auto _ : state) {
    absl::StatusOr<BatchResponse> response =
        SolveBatch(request, params, options);
    CHECK_OK(response.status());
    ::benchmark::DoNotOptimize(response->summary().successful());
  }
}

BENCHMARK(BM_SolveBatch)->Arg(1)->Arg(4)->Arg(8)->UseRealTime();

}  // namespace
}  // namespace neurolap::hopfield
