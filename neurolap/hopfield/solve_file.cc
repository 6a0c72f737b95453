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

#include "neurolap/hopfield/solve_file.h"

#include <cstdlib>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "neurolap/base/file.h"
#include "neurolap/base/status_macros.h"
#include "neurolap/hopfield/assignment.pb.h"
#include "neurolap/hopfield/assignment_io.h"
#include "neurolap/hopfield/batch_solver.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"
#include "neurolap/hopfield/solvers_proto_validation.h"

namespace neurolap::hopfield {

absl::StatusOr<HopfieldParams> ParseHopfieldParams(
    const absl::string_view text) {
  HopfieldParams params;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text),
                                                     &params)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse HopfieldParams from '", text, "'"));
  }
  RETURN_IF_ERROR(ValidateHopfieldParams(params));
  return params;
}

absl::Status WriteResponse(const google::protobuf::Message& message,
                           const absl::string_view path) {
  if (path.empty()) {
    ASSIGN_OR_RETURN(const std::string json, MessageToJson(message));
    absl::PrintF("%s\n", json);
    return absl::OkStatus();
  }
  if (absl::EndsWith(path, ".textproto") || absl::EndsWith(path, ".txtpb")) {
    return file::SetTextProto(path, message);
  }
  return WriteJsonMessage(message, path);
}

int SolveRequestFile(const absl::string_view input_path,
                     const HopfieldParams& params,
                     const absl::string_view output_path,
                     MetricsCollector* metrics) {
  const absl::StatusOr<AssignmentRequest> request =
      ReadAssignmentRequest(input_path);
  if (!request.ok()) {
    LOG(ERROR) << request.status();
    return EXIT_FAILURE;
  }
  const AssignmentResponse response =
      SolveAssignmentRequest(*request, params, metrics);
  if (const absl::Status status = WriteResponse(response, output_path);
      !status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return response.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int SolveBatchFile(const absl::string_view input_path,
                   const HopfieldParams& params,
                   const BatchOptions& batch_options,
                   const absl::string_view output_path,
                   MetricsCollector* metrics) {
  if (const absl::Status status = ValidateBatchOptions(batch_options);
      !status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  const absl::StatusOr<BatchRequest> request = ReadBatchRequest(input_path);
  if (!request.ok()) {
    LOG(ERROR) << request.status();
    return EXIT_FAILURE;
  }
  const BatchResponse response =
      SolveBatchRequest(*request, params, batch_options, metrics);
  if (const absl::Status status = WriteResponse(response, output_path);
      !status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return response.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int SolveFile(const SolveFileOptions& options, MetricsCollector* metrics) {
  if (options.input_path.empty()) {
    LOG(ERROR) << "No input file given";
    return EXIT_FAILURE;
  }
  const absl::StatusOr<HopfieldParams> params =
      ParseHopfieldParams(options.params_text);
  if (!params.ok()) {
    LOG(ERROR) << "Invalid parameters: " << params.status();
    return EXIT_FAILURE;
  }
  if (options.batch) {
    return SolveBatchFile(options.input_path, *params, options.batch_options,
                          options.output_path, metrics);
  }
  return SolveRequestFile(options.input_path, *params, options.output_path,
                          metrics);
}

int WriteValidationLimits(const SolveFileOptions& options) {
  const absl::StatusOr<HopfieldParams> params =
      ParseHopfieldParams(options.params_text);
  if (!params.ok()) {
    LOG(ERROR) << "Invalid parameters: " << params.status();
    return EXIT_FAILURE;
  }
  const absl::Status status = WriteResponse(
      GetValidationLimits(*params, options.batch_options.max_batch_size),
      options.output_path);
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

}  // namespace neurolap::hopfield
