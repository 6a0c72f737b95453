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

#include "neurolap/base/file.h"

#include <cstdio>
#include <memory>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "neurolap/base/status_macros.h"

namespace file {

namespace {

struct FileCloser {
  void operator()(std::FILE* f) const { std::fclose(f); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

class RecordingErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void RecordError(int line, int column, absl::string_view message) override {
    if (first_error_.empty()) {
      first_error_ = absl::StrCat(line + 1, ":", column + 1, ": ", message);
    }
  }

  const std::string& first_error() const { return first_error_; }

 private:
  std::string first_error_;
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  const std::string null_terminated_path(path);
  FilePtr f(std::fopen(null_terminated_path.c_str(), "rb"));
  if (f == nullptr) {
    return absl::NotFoundError(absl::StrCat("Could not open '", path, "'."));
  }
  std::string contents;
  char buffer[4096];
  size_t num_read;
  while ((num_read = std::fread(buffer, 1, sizeof(buffer), f.get())) > 0) {
    contents.append(buffer, num_read);
  }
  if (std::ferror(f.get())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", path, "'."));
  }
  return contents;
}

absl::Status SetContents(absl::string_view path, absl::string_view contents) {
  const std::string null_terminated_path(path);
  FilePtr f(std::fopen(null_terminated_path.c_str(), "wb"));
  if (f == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Could not open '", path, "' for writing."));
  }
  if (std::fwrite(contents.data(), 1, contents.size(), f.get()) !=
          contents.size() ||
      std::fflush(f.get()) != 0) {
    return absl::InternalError(absl::StrCat("Could not write ",
                                            contents.size(), " bytes to '",
                                            path, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view path,
                          google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(path));
  RecordingErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (!parser.ParseFromString(contents, proto)) {
    VLOG(1) << "Could not parse contents of '" << path << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse ", proto->GetTypeName(), " from '",
                     path, "': ", error_collector.first_error()));
  }
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view path,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InternalError(
        absl::StrCat("Could not print ", proto.GetTypeName(), "."));
  }
  return SetContents(path, proto_string);
}

}  // namespace file
