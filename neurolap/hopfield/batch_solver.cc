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

#include "neurolap/hopfield/batch_solver.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/blocking_counter.h"
#include "neurolap/base/status_builder.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/base/threadpool.h"
#include "neurolap/base/timer.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/assignment_io.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"
#include "neurolap/hopfield/solvers_proto_validation.h"

namespace neurolap::hopfield {

namespace {

BatchItemResult SolveProblem(const BatchProblem& problem,
                             const HopfieldParams& params,
                             MetricsCollector* metrics) {
  BatchItemResult item;
  item.set_id(problem.id());
  absl::StatusOr<AssignmentResult> result =
      SolveCostMatrix(problem.cost_matrix(), params, metrics);
  if (result.ok()) {
    item.set_success(true);
    *item.mutable_result() = *std::move(result);
  } else {
    VLOG(1) << "Problem '" << problem.id() << "' failed: " << result.status();
    item.set_error(std::string(result.status().message()));
  }
  return item;
}

}  // namespace

absl::Status ValidateBatchOptions(const BatchOptions& options) {
  if (options.num_threads < 1) {
    return absl::InvalidArgumentError("num_threads must be at least 1");
  }
  if (options.max_batch_size < 1) {
    return absl::InvalidArgumentError("max_batch_size must be at least 1");
  }
  return absl::OkStatus();
}

absl::Status ValidateBatchRequest(const BatchRequest& request,
                                  const BatchOptions& options) {
  if (request.problems().empty()) {
    return absl::InvalidArgumentError("Problems list cannot be empty");
  }
  if (request.problems_size() > options.max_batch_size) {
    return InvalidArgumentErrorBuilder()
           << "Batch size of " << request.problems_size()
           << " exceeds maximum of " << options.max_batch_size
           << " problems. Please split into smaller batches.";
  }
  for (int i = 0; i < request.problems_size(); ++i) {
    const BatchProblem& problem = request.problems(i);
    if (problem.id().empty()) {
      return InvalidArgumentErrorBuilder()
             << "Problem " << i << " is missing required field 'id'";
    }
    if (!problem.has_cost_matrix()) {
      return InvalidArgumentErrorBuilder()
             << "Problem " << i << " (id: " << problem.id()
             << ") is missing required field 'cost_matrix'";
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<BatchResponse> SolveBatch(const BatchRequest& request,
                                         const HopfieldParams& params,
                                         const BatchOptions& options,
                                         MetricsCollector* metrics) {
  RETURN_IF_ERROR(ValidateHopfieldParams(params));
  RETURN_IF_ERROR(ValidateBatchOptions(options));
  RETURN_IF_ERROR(ValidateBatchRequest(request, options));

  const int num_problems = request.problems_size();
  if (metrics != nullptr) metrics->RecordBatch(num_problems);
  LOG(INFO) << "Processing batch of " << num_problems << " problems";

  std::vector<BatchItemResult> results(num_problems);
  const int num_threads = std::min(options.num_threads, num_problems);
  if (num_threads <= 1) {
    for (int i = 0; i < num_problems; ++i) {
      results[i] = SolveProblem(request.problems(i), params, metrics);
    }
  } else {
    ThreadPool pool("batch", num_threads);
    pool.StartWorkers();
    absl::BlockingCounter counter(num_problems);
    for (int i = 0; i < num_problems; ++i) {
      pool.Schedule([&, i]() {
        results[i] = SolveProblem(request.problems(i), params, metrics);
        counter.DecrementCount();
      });
    }
    counter.Wait();
  }

  BatchResponse response;
  response.set_success(true);
  int num_successful = 0;
  for (BatchItemResult& result : results) {
    if (result.success()) ++num_successful;
    *response.add_results() = std::move(result);
  }
  BatchSummary& summary = *response.mutable_summary();
  summary.set_total(num_problems);
  summary.set_successful(num_successful);
  summary.set_failed(num_problems - num_successful);
  LOG(INFO) << "Batch processing complete: " << num_successful << "/"
            << num_problems << " successful";
  return response;
}

BatchResponse SolveBatchRequest(const BatchRequest& request,
                                const HopfieldParams& params,
                                const BatchOptions& options,
                                MetricsCollector* metrics) {
  WallTimer timer;
  timer.Start();
  absl::StatusOr<BatchResponse> response =
      SolveBatch(request, params, options, metrics);
  if (!response.ok()) {
    LOG(WARNING) << "Rejected batch request: " << response.status();
    BatchResponse error;
    error.set_error(std::string(response.status().message()));
    response = std::move(error);
  }
  if (metrics != nullptr) {
    metrics->RecordRequest(timer.GetDuration(), !response->success());
  }
  return *std::move(response);
}

}  // namespace neurolap::hopfield
