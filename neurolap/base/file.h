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

#ifndef NEUROLAP_BASE_FILE_H_
#define NEUROLAP_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "neurolap/base/status_macros.h"

namespace file {

// ---- Content API ----

// Returns `NotFoundError` if `path` cannot be opened for reading.
absl::StatusOr<std::string> GetContents(absl::string_view path);

// Creates or truncates `path`.
absl::Status SetContents(absl::string_view path, absl::string_view contents);

// ---- Protobuf API ----

absl::Status GetTextProto(absl::string_view path,
                          google::protobuf::Message* proto);

template <typename T>
absl::StatusOr<T> GetTextProto(absl::string_view path) {
  T proto;
  RETURN_IF_ERROR(GetTextProto(path, &proto));
  return proto;
}

absl::Status SetTextProto(absl::string_view path,
                          const google::protobuf::Message& proto);

}  // namespace file

#endif  // NEUROLAP_BASE_FILE_H_
