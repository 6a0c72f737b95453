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

// Projection of a relaxed Hopfield activation grid onto an assignment.

#ifndef NEUROLAP_HOPFIELD_PERMUTATION_EXTRACTION_H_
#define NEUROLAP_HOPFIELD_PERMUTATION_EXTRACTION_H_

#include <vector>

#include "Eigen/Core"
#include "absl/types/span.h"
#include "neurolap/hopfield/cost_matrix.h"

namespace neurolap::hopfield {

struct ExtractedPermutation {
  // assignment[i] is the column assigned to row i. Always a permutation of
  // 0..n-1.
  std::vector<int> assignment;

  // Number of rows whose winner-take-all column is shared with another row.
  int num_conflicting_rows = 0;

  // True iff some row was given a column other than its own winner.
  bool repair_applied = false;
};

// Winner-take-all: for each row, the column of its largest activation, ties
// going to the lowest column index.
std::vector<int> RowWinners(const Eigen::ArrayXXd& activations);

// Returns the number of entries of `columns` whose value appears more than
// once.
int CountConflictingRows(absl::Span<const int> columns);

// Turns the n x n grid `activations` into a permutation.
//
// Rows are visited by decreasing confidence, the confidence of a row being its
// largest activation (ties: lower row first). Each row takes its best column,
// by activation with ties to the lower index, among those not taken by an
// earlier row. When the winner-take-all columns already form a permutation,
// this reproduces them exactly.
ExtractedPermutation ExtractPermutation(const Eigen::ArrayXXd& activations);

// Returns true iff `assignment` is a permutation of 0..assignment.size()-1.
bool IsPermutation(absl::Span<const int> assignment);

// Returns sum_i costs(i, assignment[i]). `assignment` must have one entry per
// row of `costs`, each a valid column index.
double AssignmentCost(const CostMatrix& costs,
                      absl::Span<const int> assignment);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_PERMUTATION_EXTRACTION_H_
