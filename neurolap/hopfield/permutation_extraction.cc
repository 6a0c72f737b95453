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

#include "neurolap/hopfield/permutation_extraction.h"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

#include "Eigen/Core"
#include "absl/log/check.h"
#include "absl/types/span.h"
#include "neurolap/hopfield/cost_matrix.h"

namespace neurolap::hopfield {

namespace {

// Indices 0..size-1 sorted by decreasing `values`, ties in increasing index.
template <typename Vector>
std::vector<int> DecreasingOrder(const Vector& values, const int size) {
  std::vector<int> order(size);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&values](int a, int b) {
    return values(a) > values(b);
  });
  return order;
}

}  // namespace

std::vector<int> RowWinners(const Eigen::ArrayXXd& activations) {
  std::vector<int> winners(activations.rows());
  for (int i = 0; i < activations.rows(); ++i) {
    // maxCoeff() reports the first maximal coefficient.
    Eigen::Index column;
    activations.row(i).maxCoeff(&column);
    winners[i] = static_cast<int>(column);
  }
  return winners;
}

int CountConflictingRows(absl::Span<const int> columns) {
  if (columns.empty()) return 0;
  std::vector<int> counts(*std::max_element(columns.begin(), columns.end()) + 1,
                          0);
  for (const int column : columns) ++counts[column];
  int num_conflicting = 0;
  for (const int column : columns) {
    if (counts[column] > 1) ++num_conflicting;
  }
  return num_conflicting;
}

ExtractedPermutation ExtractPermutation(const Eigen::ArrayXXd& activations) {
  CHECK_EQ(activations.rows(), activations.cols());
  const int n = static_cast<int>(activations.rows());
  const std::vector<int> winners = RowWinners(activations);

  ExtractedPermutation result;
  result.num_conflicting_rows = CountConflictingRows(winners);
  result.assignment.assign(n, -1);

  const Eigen::ArrayXd confidence = activations.rowwise().maxCoeff();
  std::vector<bool> claimed(n, false);
  for (const int row : DecreasingOrder(confidence, n)) {
    const Eigen::ArrayXd row_activations = activations.row(row).transpose();
    for (const int column : DecreasingOrder(row_activations, n)) {
      if (!claimed[column]) {
        claimed[column] = true;
        result.assignment[row] = column;
        break;
      }
    }
    if (result.assignment[row] != winners[row]) result.repair_applied = true;
  }
  DCHECK(IsPermutation(result.assignment));
  return result;
}

bool IsPermutation(absl::Span<const int> assignment) {
  const int n = static_cast<int>(assignment.size());
  std::vector<bool> seen(n, false);
  for (const int column : assignment) {
    if (column < 0 || column >= n || seen[column]) return false;
    seen[column] = true;
  }
  return true;
}

double AssignmentCost(const CostMatrix& costs,
                      absl::Span<const int> assignment) {
  DCHECK_EQ(costs.rows(), static_cast<int64_t>(assignment.size()));
  double total = 0.0;
  for (int i = 0; i < static_cast<int>(assignment.size()); ++i) {
    total += costs(i, assignment[i]);
  }
  return total;
}

}  // namespace neurolap::hopfield
