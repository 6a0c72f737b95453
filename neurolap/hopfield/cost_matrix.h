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

#ifndef NEUROLAP_HOPFIELD_COST_MATRIX_H_
#define NEUROLAP_HOPFIELD_COST_MATRIX_H_

#include <cstdint>
#include <string>
#include <vector>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// Costs of an n x n assignment problem: entry (i, j) is the cost of assigning
// task i to resource j. A valid cost matrix is square, has n >= 1, and only
// finite non-negative entries no larger than `MatrixLimits::max_cost_value`. Matrices reaching the solver are expected to
// have gone through `ValidateCostMatrix()` (or one of the factories below) and
// are never modified afterwards.
using CostMatrix = Eigen::MatrixXd;

// Returns `InvalidArgumentError` if a `num_rows` x `num_cols` matrix cannot be
// an assignment problem under `limits`: it is empty, not square, or larger
// than `limits.max_size()`.
absl::Status ValidateCostMatrixDimensions(int64_t num_rows, int64_t num_cols,
                                          const MatrixLimits& limits);

// Returns `InvalidArgumentError` naming the first offending dimension or cell
// if `costs` is not a valid cost matrix under `limits`. Returns `OkStatus`
// otherwise.
absl::Status ValidateCostMatrix(const CostMatrix& costs,
                                const MatrixLimits& limits);

// Builds a cost matrix from row-major nested vectors, where `rows[i][j]` is
// the cost of task i on resource j. Ragged input is reported as a non-square
// matrix, naming the first row with the wrong length.
absl::StatusOr<CostMatrix> CostMatrixFromRows(
    const std::vector<std::vector<double>>& rows, const MatrixLimits& limits);

// Inverse of `CostMatrixFromRows()`.
std::vector<std::vector<double>> CostMatrixToRows(const CostMatrix& costs);

// Returns a one-line description such as "[[1, 2], [3, 4]]", truncated after
// roughly `max_size` characters.
std::string CostMatrixToString(const CostMatrix& costs,
                               int64_t max_size = 1000000);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_COST_MATRIX_H_
