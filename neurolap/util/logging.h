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

#ifndef NEUROLAP_UTIL_LOGGING_H_
#define NEUROLAP_UTIL_LOGGING_H_

#include <functional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"  // IWYU pragma: export

namespace neurolap {

// Custom logger for solver progress. Unlike the process-wide absl logging, a
// `SolverLogger` belongs to one solve: it can be switched on and off per solve,
// echo to stdout, and forward every line to user callbacks.
//
// Not thread safe; use one logger per solve.
class SolverLogger {
 public:
  // Enables SOLVER_LOG output. Direct calls to LogInfo() are not affected.
  void EnableLogging(bool enable) { is_enabled_ = enable; }

  // Returns true iff logging is enabled.
  bool LoggingIsEnabled() const { return is_enabled_; }

  // Prints messages on stdout. Otherwise messages go to LOG(INFO) unless a
  // callback is registered.
  void SetLogToStdOut(bool enable) { log_to_stdout_ = enable; }

  // Adds a callback receiving every message, run synchronously by LogInfo().
  void AddInfoLoggingCallback(
      std::function<void(const std::string& message)> callback);

  void LogInfo(const char* source_filename, int source_line,
               const std::string& message);

 private:
  bool is_enabled_ = false;
  bool log_to_stdout_ = false;
  std::vector<std::function<void(const std::string& message)>>
      info_callbacks_;
};

#define SOLVER_LOG(logger, ...)     \
  if ((logger)->LoggingIsEnabled()) \
  (logger)->LogInfo(__FILE__, __LINE__, absl::StrCat(__VA_ARGS__))

}  // namespace neurolap

#endif  // NEUROLAP_UTIL_LOGGING_H_
