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

// In-process counters of the requests served by the assignment solver.

#ifndef NEUROLAP_HOPFIELD_METRICS_H_
#define NEUROLAP_HOPFIELD_METRICS_H_

#include <cstdint>
#include <optional>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "neurolap/hopfield/metrics.pb.h"

namespace neurolap::hopfield {

// Aggregates request, solve and batch statistics. Thread-safe; one instance is
// typically shared by every worker serving requests.
class MetricsCollector {
 public:
  MetricsCollector() = default;

  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Records a served request. `matrix_size`, when known, counts towards the
  // average matrix size.
  void RecordRequest(absl::Duration duration, bool error,
                     std::optional<int> matrix_size = std::nullopt);

  // Records a successful solve.
  void RecordSolve(int iterations, int matrix_size, absl::Duration duration);

  // Records a batch request with `batch_size` problems.
  void RecordBatch(int batch_size);

  MetricsSnapshot GetSnapshot() const;

  // Forgets everything recorded so far.
  void Reset();

 private:
  mutable absl::Mutex mutex_;
  int64_t num_requests_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t num_errors_ ABSL_GUARDED_BY(mutex_) = 0;
  absl::Duration total_request_duration_ ABSL_GUARDED_BY(mutex_);
  absl::Duration min_request_duration_ ABSL_GUARDED_BY(mutex_) =
      absl::InfiniteDuration();
  absl::Duration max_request_duration_ ABSL_GUARDED_BY(mutex_);
  int64_t num_solves_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t total_iterations_ ABSL_GUARDED_BY(mutex_) = 0;
  absl::Duration total_solve_duration_ ABSL_GUARDED_BY(mutex_);
  int64_t num_matrix_sizes_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t total_matrix_size_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t num_batches_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t total_batch_size_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_METRICS_H_
