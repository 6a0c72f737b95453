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

#include <limits>
#include <vector>

#include "Eigen/Core"
#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "neurolap/base/gmock.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::status::StatusIs;

TEST(CostMatrixFromRowsTest, BuildsSquareMatrix) {
  ASSERT_OK_AND_ASSIGN(const CostMatrix costs,
                       CostMatrixFromRows({{1, 2}, {3, 4}}, MatrixLimits()));
  ASSERT_EQ(costs.rows(), 2);
  ASSERT_EQ(costs.cols(), 2);
  EXPECT_EQ(costs(0, 1), 2);
  EXPECT_EQ(costs(1, 0), 3);
}

TEST(CostMatrixFromRowsTest, RejectsEmpty) {
  EXPECT_THAT(CostMatrixFromRows({}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("cannot be empty")));
}

TEST(CostMatrixFromRowsTest, RejectsEmptyRows) {
  EXPECT_THAT(CostMatrixFromRows({{}}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Row 0 has 0 elements, expected 1")));
}

TEST(CostMatrixFromRowsTest, RejectsNonSquare) {
  EXPECT_THAT(CostMatrixFromRows({{1, 2, 3}, {4, 5, 6}}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Row 0 has 3 elements, expected 2")));
}

TEST(CostMatrixFromRowsTest, RejectsRaggedRows) {
  EXPECT_THAT(CostMatrixFromRows({{1, 2}, {3}}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Row 1 has 1 elements, expected 2")));
}

TEST(CostMatrixFromRowsTest, RejectsNan) {
  EXPECT_THAT(
      CostMatrixFromRows(
          {{1, 2}, {3, std::numeric_limits<double>::quiet_NaN()}},
          MatrixLimits()),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("Cost at position [1][1] is NaN")));
}

TEST(CostMatrixFromRowsTest, RejectsInfinity) {
  EXPECT_THAT(
      CostMatrixFromRows({{std::numeric_limits<double>::infinity(), 2}, {3, 4}},
                         MatrixLimits()),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("Cost at position [0][0] is infinite")));
}

TEST(CostMatrixFromRowsTest, RejectsNegative) {
  EXPECT_THAT(CostMatrixFromRows({{1, -2}, {3, 4}}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Cost at position [0][1] is -2, which is "
                                 "negative")));
}

TEST(CostMatrixFromRowsTest, RejectsCostAboveLimit) {
  EXPECT_THAT(CostMatrixFromRows({{1e10, 2}, {3, 4}}, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       AllOf(HasSubstr("Cost at position [0][0] is 1e+10, "
                                       "which exceeds maximum allowed value "
                                       "of 1e+09"),
                             HasSubstr("Please scale your costs down"))));
  EXPECT_OK(CostMatrixFromRows({{1e9, 2}, {3, 4}}, MatrixLimits()));
}

TEST(ValidateCostMatrixTest, HonorsCustomCostLimit) {
  MatrixLimits limits;
  limits.set_max_cost_value(10.0);
  CostMatrix costs = CostMatrix::Constant(2, 2, 10.0);
  EXPECT_OK(ValidateCostMatrix(costs, limits));
  costs(1, 0) = 10.5;
  EXPECT_THAT(ValidateCostMatrix(costs, limits),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("[1][0] is 10.5, which exceeds maximum "
                                 "allowed value of 10")));
}

TEST(CostMatrixFromRowsTest, RejectsOversizedMatrix) {
  const std::vector<std::vector<double>> rows(51, std::vector<double>(51, 1.0));
  EXPECT_THAT(CostMatrixFromRows(rows, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Matrix size 51x51 exceeds maximum allowed "
                                 "size of 50x50")));
}

TEST(CostMatrixFromRowsTest, HonorsCustomLimit) {
  MatrixLimits limits;
  limits.set_max_size(2);
  EXPECT_OK(CostMatrixFromRows({{1, 2}, {3, 4}}, limits));
  EXPECT_THAT(CostMatrixFromRows({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}}, limits),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("exceeds maximum allowed size of 2x2")));
}

TEST(ValidateCostMatrixTest, AcceptsZeroMatrix) {
  EXPECT_OK(ValidateCostMatrix(CostMatrix::Zero(3, 3), MatrixLimits()));
}

TEST(ValidateCostMatrixTest, RejectsNonSquare) {
  EXPECT_THAT(ValidateCostMatrix(CostMatrix::Ones(2, 3), MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Matrix must be square, got 2x3")));
}

TEST(ValidateCostMatrixTest, RejectsEmpty) {
  EXPECT_THAT(ValidateCostMatrix(CostMatrix(0, 0), MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("cannot be empty")));
}

TEST(ValidateCostMatrixTest, ReportsFirstBadCellInRowMajorOrder) {
  CostMatrix costs = CostMatrix::Ones(3, 3);
  costs(2, 0) = -1.0;
  costs(1, 2) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THAT(ValidateCostMatrix(costs, MatrixLimits()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("[1][2] is NaN")));
}

TEST(CostMatrixToRowsTest, InvertsCostMatrixFromRows) {
  CostMatrix costs(2, 2);
  costs << 1.5, 2, 0, 4;
  EXPECT_THAT(CostMatrixToRows(costs),
              ElementsAre(ElementsAre(1.5, 2), ElementsAre(0, 4)));
}

TEST(CostMatrixToStringTest, FormatsRows) {
  CostMatrix costs(2, 2);
  costs << 1, 2, 3, 4.5;
  EXPECT_EQ(CostMatrixToString(costs), "[[1, 2], [3, 4.5]]");
}

TEST(CostMatrixToStringTest, Truncates) {
  EXPECT_EQ(CostMatrixToString(CostMatrix::Zero(3, 3), 5), "[[0, 0, 0], ...]");
}

}  // namespace
}  // namespace neurolap::hopfield
