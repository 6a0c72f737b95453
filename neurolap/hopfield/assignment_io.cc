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

#include "neurolap/hopfield/assignment_io.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "neurolap/base/file.h"
#include "neurolap/base/status_builder.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/base/timer.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/cost_matrix.h"
#include "neurolap/hopfield/hopfield_solver.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

using ::google::protobuf::ListValue;
using ::google::protobuf::Value;

namespace {

template <typename Request>
absl::StatusOr<Request> ReadRequest(const absl::string_view path) {
  if (absl::EndsWith(path, ".json")) {
    ASSIGN_OR_RETURN(const std::string contents, file::GetContents(path));
    Request request;
    RETURN_IF_ERROR(ParseJsonMessage(contents, &request))
        << "while reading '" << path << "'";
    return request;
  }
  return file::GetTextProto<Request>(path);
}

}  // namespace

absl::StatusOr<CostMatrix> CostMatrixFromListValue(const ListValue& rows,
                                                   const MatrixLimits& limits) {
  std::vector<std::vector<double>> values(rows.values_size());
  for (int i = 0; i < rows.values_size(); ++i) {
    const Value& row = rows.values(i);
    if (row.kind_case() != Value::kListValue) {
      return InvalidArgumentErrorBuilder()
             << "Row " << i << " must be a list of numbers.";
    }
    values[i].reserve(row.list_value().values_size());
    for (int j = 0; j < row.list_value().values_size(); ++j) {
      const Value& entry = row.list_value().values(j);
      if (entry.kind_case() != Value::kNumberValue) {
        return InvalidArgumentErrorBuilder()
               << "Cost at position [" << i << "][" << j
               << "] must be a number.";
      }
      values[i].push_back(entry.number_value());
    }
  }
  return CostMatrixFromRows(values, limits);
}

ListValue CostMatrixToListValue(const CostMatrix& costs) {
  ListValue rows;
  for (int64_t i = 0; i < costs.rows(); ++i) {
    ListValue* row = rows.add_values()->mutable_list_value();
    for (int64_t j = 0; j < costs.cols(); ++j) {
      row->add_values()->set_number_value(costs(i, j));
    }
  }
  return rows;
}

absl::StatusOr<AssignmentSolution> SolveAssignment(
    const ListValue& rows, const HopfieldParams& params) {
  ASSIGN_OR_RETURN(const CostMatrix costs,
                   CostMatrixFromListValue(rows, params.matrix_limits()));
  return SolveAssignment(costs, params);
}

AssignmentResult SolutionToResult(const AssignmentSolution& solution,
                                  const CostMatrix& costs) {
  AssignmentResult result;
  result.mutable_assignments()->Add(solution.assignment.begin(),
                                    solution.assignment.end());
  result.set_total_cost(solution.total_cost);
  result.set_iterations(solution.iterations);
  *result.mutable_cost_matrix() = CostMatrixToListValue(costs);
  return result;
}

absl::StatusOr<AssignmentResult> SolveCostMatrix(const ListValue& rows,
                                                 const HopfieldParams& params,
                                                 MetricsCollector* metrics) {
  ASSIGN_OR_RETURN(const CostMatrix costs,
                   CostMatrixFromListValue(rows, params.matrix_limits()));
  ASSIGN_OR_RETURN(const AssignmentSolution solution,
                   SolveAssignment(costs, params));
  if (metrics != nullptr) {
    metrics->RecordSolve(solution.iterations, static_cast<int>(costs.rows()),
                         absl::Seconds(solution.solve_log.solve_time_sec()));
  }
  return SolutionToResult(solution, costs);
}

AssignmentResponse SolveAssignmentRequest(const AssignmentRequest& request,
                                          const HopfieldParams& params,
                                          MetricsCollector* metrics) {
  WallTimer timer;
  timer.Start();
  AssignmentResponse response;
  std::optional<int> matrix_size;
  if (!request.has_cost_matrix()) {
    response.set_error("Field 'cost_matrix' is required");
  } else {
    absl::StatusOr<AssignmentResult> result =
        SolveCostMatrix(request.cost_matrix(), params, metrics);
    if (result.ok()) {
      response.set_success(true);
      matrix_size = result->assignments_size();
      *response.mutable_result() = *std::move(result);
    } else {
      LOG(WARNING) << "Rejected assignment request: " << result.status();
      response.set_error(std::string(result.status().message()));
    }
  }
  if (metrics != nullptr) {
    metrics->RecordRequest(timer.GetDuration(), !response.success(),
                           matrix_size);
  }
  return response;
}

ValidationLimits GetValidationLimits(const HopfieldParams& params,
                                     const int max_batch_size) {
  ValidationLimits limits;
  limits.set_min_matrix_size(1);
  limits.set_max_matrix_size(params.matrix_limits().max_size());
  limits.set_min_cost_value(0.0);
  limits.set_max_cost_value(params.matrix_limits().max_cost_value());
  limits.set_max_batch_size(max_batch_size);
  return limits;
}

absl::Status ParseJsonMessage(const absl::string_view json,
                              google::protobuf::Message* message) {
  const auto status = google::protobuf::util::JsonStringToMessage(
      std::string(json), message, google::protobuf::util::JsonParseOptions());
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid JSON for ", message->GetTypeName(), ": ", status.ToString()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> MessageToJson(
    const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_fields_with_no_presence = true;
  std::string json;
  const auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat("Could not print ",
                                            message.GetTypeName(),
                                            " as JSON: ", status.ToString()));
  }
  return json;
}

absl::StatusOr<AssignmentRequest> ReadAssignmentRequest(
    const absl::string_view path) {
  return ReadRequest<AssignmentRequest>(path);
}

absl::StatusOr<BatchRequest> ReadBatchRequest(const absl::string_view path) {
  return ReadRequest<BatchRequest>(path);
}

absl::Status WriteJsonMessage(const google::protobuf::Message& message,
                              const absl::string_view path) {
  ASSIGN_OR_RETURN(const std::string json, MessageToJson(message));
  return file::SetContents(path, absl::StrCat(json, "\n"));
}

}  // namespace neurolap::hopfield
