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

#include "neurolap/hopfield/metrics.h"

#include <algorithm>
#include <cstdint>
#include <optional>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "neurolap/hopfield/metrics.pb.h"

namespace neurolap::hopfield {

namespace {

double Average(const double total, const int64_t count) {
  return count > 0 ? total / count : 0.0;
}

}  // namespace

void MetricsCollector::RecordRequest(const absl::Duration duration,
                                     const bool error,
                                     const std::optional<int> matrix_size) {
  absl::MutexLock lock(&mutex_);
  ++num_requests_;
  if (error) ++num_errors_;
  total_request_duration_ += duration;
  min_request_duration_ = std::min(min_request_duration_, duration);
  max_request_duration_ = std::max(max_request_duration_, duration);
  if (matrix_size.has_value()) {
    ++num_matrix_sizes_;
    total_matrix_size_ += *matrix_size;
  }
}

void MetricsCollector::RecordSolve(const int iterations, const int matrix_size,
                                   const absl::Duration duration) {
  absl::MutexLock lock(&mutex_);
  ++num_solves_;
  total_iterations_ += iterations;
  total_solve_duration_ += duration;
  ++num_matrix_sizes_;
  total_matrix_size_ += matrix_size;
}

void MetricsCollector::RecordBatch(const int batch_size) {
  absl::MutexLock lock(&mutex_);
  ++num_batches_;
  total_batch_size_ += batch_size;
}

MetricsSnapshot MetricsCollector::GetSnapshot() const {
  absl::MutexLock lock(&mutex_);
  MetricsSnapshot snapshot;

  MetricsSnapshot::Requests& requests = *snapshot.mutable_requests();
  requests.set_total(num_requests_);
  requests.set_errors(num_errors_);
  requests.set_success_rate(
      Average(100.0 * (num_requests_ - num_errors_), num_requests_));

  MetricsSnapshot::Performance& performance = *snapshot.mutable_performance();
  performance.set_avg_duration_ms(Average(
      absl::ToDoubleMilliseconds(total_request_duration_), num_requests_));
  if (num_requests_ > 0) {
    performance.set_min_duration_ms(
        absl::ToDoubleMilliseconds(min_request_duration_));
    performance.set_max_duration_ms(
        absl::ToDoubleMilliseconds(max_request_duration_));
  }

  MetricsSnapshot::Algorithm& algorithm = *snapshot.mutable_algorithm();
  algorithm.set_avg_iterations(Average(total_iterations_, num_solves_));
  algorithm.set_avg_matrix_size(Average(total_matrix_size_, num_matrix_sizes_));
  algorithm.set_avg_solve_duration_ms(Average(
      absl::ToDoubleMilliseconds(total_solve_duration_), num_solves_));

  MetricsSnapshot::Batch& batch = *snapshot.mutable_batch();
  batch.set_avg_batch_size(Average(total_batch_size_, num_batches_));
  batch.set_total_batches(num_batches_);
  return snapshot;
}

void MetricsCollector::Reset() {
  absl::MutexLock lock(&mutex_);
  num_requests_ = 0;
  num_errors_ = 0;
  total_request_duration_ = absl::ZeroDuration();
  min_request_duration_ = absl::InfiniteDuration();
  max_request_duration_ = absl::ZeroDuration();
  num_solves_ = 0;
  total_iterations_ = 0;
  total_solve_duration_ = absl::ZeroDuration();
  num_matrix_sizes_ = 0;
  total_matrix_size_ = 0;
  num_batches_ = 0;
  total_batch_size_ = 0;
}

}  // namespace neurolap::hopfield
