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

// File-level entry points of the solve_assignment tool: read a request, serve
// it, write the response, and map the outcome to a process exit code.

#ifndef NEUROLAP_HOPFIELD_SOLVE_FILE_H_
#define NEUROLAP_HOPFIELD_SOLVE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "neurolap/hopfield/batch_solver.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

struct SolveFileOptions {
  // An AssignmentRequest, or a BatchRequest when `batch` is true. JSON if the
  // name ends in ".json", protobuf text format otherwise.
  std::string input_path;
  bool batch = false;

  // Where the response goes; stdout when empty. See `WriteResponse()`.
  std::string output_path;

  // HopfieldParams in protobuf text format. Empty means all defaults.
  std::string params_text;

  BatchOptions batch_options;
};

// Parses `text` as a HopfieldParams text proto and validates the result.
absl::StatusOr<HopfieldParams> ParseHopfieldParams(absl::string_view text);

// Writes `message` to `path` in protobuf text format if the name ends in
// ".textproto" or ".txtpb", as JSON otherwise. An empty `path` prints JSON on
// stdout.
absl::Status WriteResponse(const google::protobuf::Message& message,
                           absl::string_view path);

// Serves the AssignmentRequest stored in `input_path`. Returns EXIT_SUCCESS
// iff the request was solved; a rejected request still gets its response
// written. The input failing to load, or the response failing to be written,
// gives EXIT_FAILURE with nothing written.
int SolveRequestFile(absl::string_view input_path,
                     const HopfieldParams& params,
                     absl::string_view output_path, MetricsCollector* metrics);

// Serves the BatchRequest stored in `input_path`. Returns EXIT_SUCCESS iff the
// batch as a whole was accepted, even when some of its problems fail.
int SolveBatchFile(absl::string_view input_path, const HopfieldParams& params,
                   const BatchOptions& batch_options,
                   absl::string_view output_path, MetricsCollector* metrics);

// Parses `options.params_text` and dispatches to `SolveBatchFile()` or
// `SolveRequestFile()`. Missing input and invalid parameters give
// EXIT_FAILURE before anything is read. `metrics` may be nullptr.
int SolveFile(const SolveFileOptions& options, MetricsCollector* metrics);

// Writes the `ValidationLimits` in force under `options` to
// `options.output_path`. `options.input_path` is ignored.
int WriteValidationLimits(const SolveFileOptions& options);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_SOLVE_FILE_H_
