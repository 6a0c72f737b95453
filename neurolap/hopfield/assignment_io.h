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

// Conversions between the request/response messages of assignment.proto and
// the solver types, and reading/writing those messages as JSON or text.

#ifndef NEUROLAP_HOPFIELD_ASSIGNMENT_IO_H_
#define NEUROLAP_HOPFIELD_ASSIGNMENT_IO_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/cost_matrix.h"
#include "neurolap/hopfield/hopfield_solver.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// Builds a cost matrix from a JSON-style list of rows. Besides the checks of
// `CostMatrixFromRows()`, rejects rows that are not lists and entries that are
// not numbers, naming the offending position.
absl::StatusOr<CostMatrix> CostMatrixFromListValue(
    const google::protobuf::ListValue& rows, const MatrixLimits& limits);

google::protobuf::ListValue CostMatrixToListValue(const CostMatrix& costs);

// Like the other `SolveAssignment()` overloads, for a JSON-style matrix.
absl::StatusOr<AssignmentSolution> SolveAssignment(
    const google::protobuf::ListValue& rows, const HopfieldParams& params);

// `costs` must be the matrix `solution` was computed for.
AssignmentResult SolutionToResult(const AssignmentSolution& solution,
                                  const CostMatrix& costs);

// Validates and solves `rows`. Successful solves are recorded in `metrics`
// when it is not nullptr.
absl::StatusOr<AssignmentResult> SolveCostMatrix(
    const google::protobuf::ListValue& rows, const HopfieldParams& params,
    MetricsCollector* metrics = nullptr);

// Serves one request: never fails, errors are reported in the response. The
// request itself is recorded in `metrics` when it is not nullptr.
AssignmentResponse SolveAssignmentRequest(const AssignmentRequest& request,
                                          const HopfieldParams& params,
                                          MetricsCollector* metrics = nullptr);

// The limits enforced on requests under `params`.
ValidationLimits GetValidationLimits(const HopfieldParams& params,
                                     int max_batch_size);

// Parses `json` into `message`. Field names may be given in their original
// snake_case or in lowerCamelCase.
absl::Status ParseJsonMessage(absl::string_view json,
                              google::protobuf::Message* message);

// Prints `message` as JSON with the original field names, including fields
// holding default values.
absl::StatusOr<std::string> MessageToJson(
    const google::protobuf::Message& message);

// Reads a request from `path`: JSON if the name ends in ".json", protobuf text
// format otherwise.
absl::StatusOr<AssignmentRequest> ReadAssignmentRequest(absl::string_view path);
absl::StatusOr<BatchRequest> ReadBatchRequest(absl::string_view path);

// Writes `message` as JSON, followed by a newline, to `path`.
absl::Status WriteJsonMessage(const google::protobuf::Message& message,
                              absl::string_view path);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_ASSIGNMENT_IO_H_
