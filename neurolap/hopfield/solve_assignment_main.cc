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

// Solves an assignment request, or a batch of them, read from a file and
// prints the JSON response.
//
//   solve_assignment --input=problem.json
//   solve_assignment --batch --input=problems.textproto --num_threads=4 \
//     --params="termination_criteria { iteration_limit: 500 }"
//   solve_assignment --print_validation_limits --max_batch_size=20
//
// The exit code is 0 when the request, or the batch as a whole, was served.

#include <cstdio>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "neurolap/base/logging.h"
#include "neurolap/hopfield/assignment_io.h"
#include "neurolap/hopfield/metrics.h"
#include "neurolap/hopfield/solve_file.h"

ABSL_FLAG(std::string, input, "",
          "Request to solve, as JSON (*.json) or protobuf text format.");
ABSL_FLAG(bool, batch, false,
          "Whether --input holds a BatchRequest rather than an "
          "AssignmentRequest.");
ABSL_FLAG(std::string, params, "",
          "HopfieldParams in protobuf text format.");
ABSL_FLAG(int, num_threads, 1, "Number of batch problems solved in parallel.");
ABSL_FLAG(int, max_batch_size, 100, "Largest accepted batch.");
ABSL_FLAG(std::string, output, "",
          "Where to write the response: protobuf text format for "
          "*.textproto and *.txtpb, JSON otherwise. Defaults to stdout.");
ABSL_FLAG(bool, print_validation_limits, false,
          "Print the limits enforced on requests under --params and "
          "--max_batch_size instead of solving anything.");
ABSL_FLAG(bool, print_metrics, false,
          "Whether to print a JSON metrics snapshot to stderr at exit.");
ABSL_FLAG(bool, log_to_stderr, false, "Whether to log INFO messages.");

namespace neurolap::hopfield {
namespace {

void PrintMetrics(const MetricsCollector& metrics) {
  absl::StatusOr<std::string> json = MessageToJson(metrics.GetSnapshot());
  if (json.ok()) {
    absl::FPrintF(stderr, "%s\n", *json);
  } else {
    LOG(ERROR) << "Could not print metrics: " << json.status();
  }
}

int Run() {
  SolveFileOptions options;
  options.input_path = absl::GetFlag(FLAGS_input);
  options.batch = absl::GetFlag(FLAGS_batch);
  options.output_path = absl::GetFlag(FLAGS_output);
  options.params_text = absl::GetFlag(FLAGS_params);
  options.batch_options.num_threads = absl::GetFlag(FLAGS_num_threads);
  options.batch_options.max_batch_size = absl::GetFlag(FLAGS_max_batch_size);
  if (absl::GetFlag(FLAGS_print_validation_limits)) {
    return WriteValidationLimits(options);
  }

  MetricsCollector metrics;
  const int exit_code = SolveFile(options, &metrics);
  if (absl::GetFlag(FLAGS_print_metrics)) PrintMetrics(metrics);
  return exit_code;
}

}  // namespace
}  // namespace neurolap::hopfield

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      "Solves linear assignment problems with a Hopfield network.\n"
      "usage: solve_assignment --input=<file> [--batch] [--params=<text>]");
  absl::ParseCommandLine(argc, argv);
  neurolap::InitLogging(absl::GetFlag(FLAGS_log_to_stderr));
  return neurolap::hopfield::Run();
}
