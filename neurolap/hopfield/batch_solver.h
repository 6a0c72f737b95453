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

// Solves many independent assignment problems, optionally in parallel.

#ifndef NEUROLAP_HOPFIELD_BATCH_SOLVER_H_
#define NEUROLAP_HOPFIELD_BATCH_SOLVER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

struct BatchOptions {
  // Number of problems solved concurrently. Each single solve stays
  // sequential.
  int num_threads = 1;
  int max_batch_size = 100;
};

// Returns `InvalidArgumentError` if `options` is invalid.
absl::Status ValidateBatchOptions(const BatchOptions& options);

// Returns `InvalidArgumentError` if `request` cannot be processed as a whole:
// it has no problem, more than `options.max_batch_size` problems, or a problem
// without an id or a cost matrix. Problems are not validated further.
absl::Status ValidateBatchRequest(const BatchRequest& request,
                                  const BatchOptions& options);

// Solves every problem of `request` independently. A problem whose matrix is
// invalid gets an error in its `BatchItemResult` and does not affect the
// others; results are in the order of `request.problems`.
//
// Returns `InvalidArgumentError` if `params`, `options` or the batch as a
// whole is invalid. Solves and the batch are recorded in `metrics` when it is
// not nullptr.
absl::StatusOr<BatchResponse> SolveBatch(const BatchRequest& request,
                                         const HopfieldParams& params,
                                         const BatchOptions& options,
                                         MetricsCollector* metrics = nullptr);

// Serves a batch request: like `SolveBatch()`, but a rejected batch is
// reported in the response. The request is recorded in `metrics` when it is
// not nullptr.
BatchResponse SolveBatchRequest(const BatchRequest& request,
                                const HopfieldParams& params,
                                const BatchOptions& options,
                                MetricsCollector* metrics = nullptr);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_BATCH_SOLVER_H_
