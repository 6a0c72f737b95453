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

#include "neurolap/hopfield/cost_matrix.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "neurolap/base/status_builder.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

namespace {

absl::Status CheckCostEntry(const double cost, const int64_t row,
                            const int64_t col, const MatrixLimits& limits) {
  if (std::isnan(cost)) {
    return InvalidArgumentErrorBuilder()
           << "Cost at position [" << row << "][" << col
           << "] is NaN. All costs must be valid numbers.";
  }
  if (std::isinf(cost)) {
    return InvalidArgumentErrorBuilder()
           << "Cost at position [" << row << "][" << col
           << "] is infinite. All costs must be finite numbers.";
  }
  if (cost < 0.0) {
    return InvalidArgumentErrorBuilder()
           << "Cost at position [" << row << "][" << col << "] is " << cost
           << ", which is negative. All costs must be non-negative.";
  }
  if (cost > limits.max_cost_value()) {
    return InvalidArgumentErrorBuilder()
           << "Cost at position [" << row << "][" << col << "] is " << cost
           << ", which exceeds maximum allowed value of "
           << limits.max_cost_value() << ". Please scale your costs down.";
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateCostMatrixDimensions(const int64_t num_rows,
                                          const int64_t num_cols,
                                          const MatrixLimits& limits) {
  if (num_rows == 0 || num_cols == 0) {
    return absl::InvalidArgumentError("Cost matrix cannot be empty");
  }
  if (num_rows > limits.max_size() || num_cols > limits.max_size()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Matrix size ", num_rows, "x", num_cols,
        " exceeds maximum allowed size of ", limits.max_size(), "x",
        limits.max_size()));
  }
  if (num_rows != num_cols) {
    return absl::InvalidArgumentError(
        absl::StrCat("Matrix must be square, got ", num_rows, "x", num_cols));
  }
  return absl::OkStatus();
}

absl::Status ValidateCostMatrix(const CostMatrix& costs,
                                const MatrixLimits& limits) {
  RETURN_IF_ERROR(
      ValidateCostMatrixDimensions(costs.rows(), costs.cols(), limits));
  for (int64_t i = 0; i < costs.rows(); ++i) {
    for (int64_t j = 0; j < costs.cols(); ++j) {
      RETURN_IF_ERROR(CheckCostEntry(costs(i, j), i, j, limits));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<CostMatrix> CostMatrixFromRows(
    const std::vector<std::vector<double>>& rows, const MatrixLimits& limits) {
  const int64_t n = rows.size();
  if (n == 0) {
    return absl::InvalidArgumentError("Cost matrix cannot be empty");
  }
  for (int64_t i = 0; i < n; ++i) {
    if (static_cast<int64_t>(rows[i].size()) != n) {
      return InvalidArgumentErrorBuilder()
             << "Matrix must be square. Row " << i << " has " << rows[i].size()
             << " elements, expected " << n << ".";
    }
  }
  RETURN_IF_ERROR(ValidateCostMatrixDimensions(n, n, limits));
  CostMatrix costs(n, n);
  for (int64_t i = 0; i < n; ++i) {
    for (int64_t j = 0; j < n; ++j) {
      RETURN_IF_ERROR(CheckCostEntry(rows[i][j], i, j, limits));
      costs(i, j) = rows[i][j];
    }
  }
  return costs;
}

std::vector<std::vector<double>> CostMatrixToRows(const CostMatrix& costs) {
  std::vector<std::vector<double>> rows(costs.rows());
  for (int64_t i = 0; i < costs.rows(); ++i) {
    rows[i].reserve(costs.cols());
    for (int64_t j = 0; j < costs.cols(); ++j) {
      rows[i].push_back(costs(i, j));
    }
  }
  return rows;
}

std::string CostMatrixToString(const CostMatrix& costs,
                               const int64_t max_size) {
  std::string result = "[";
  for (int64_t i = 0; i < costs.rows(); ++i) {
    absl::StrAppend(&result, i == 0 ? "[" : ", [");
    for (int64_t j = 0; j < costs.cols(); ++j) {
      absl::StrAppend(&result, j == 0 ? "" : ", ", costs(i, j));
    }
    result.append("]");
    if (static_cast<int64_t>(result.size()) >= max_size) {
      result.append(", ...");
      break;
    }
  }
  result.append("]");
  return result;
}

}  // namespace neurolap::hopfield
