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

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "neurolap/base/gmock.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace file {
namespace {

using ::testing::HasSubstr;
using ::testing::status::StatusIs;

std::string TempPath(const std::string& name) {
  return absl::StrCat(::testing::TempDir(), "/", name);
}

TEST(FileTest, ContentsRoundTrip) {
  const std::string path = TempPath("contents.txt");
  ASSERT_OK(SetContents(path, "hello\nworld"));
  ASSERT_OK_AND_ASSIGN(const std::string contents, GetContents(path));
  EXPECT_EQ(contents, "hello\nworld");
}

TEST(FileTest, MissingFileIsNotFound) {
  EXPECT_THAT(GetContents(TempPath("does_not_exist.txt")),
              StatusIs(absl::StatusCode::kNotFound,
                       HasSubstr("does_not_exist.txt")));
}

TEST(FileTest, TextProto) {
  const std::string path = TempPath("params.textproto");
  ASSERT_OK(SetContents(path, "step_size: 0.5 random_seed: 3"));
  ASSERT_OK_AND_ASSIGN(
      const neurolap::hopfield::HopfieldParams params,
      GetTextProto<neurolap::hopfield::HopfieldParams>(path));
  EXPECT_EQ(params.step_size(), 0.5);
  EXPECT_EQ(params.random_seed(), 3);

  ASSERT_OK(SetTextProto(path, params));
  ASSERT_OK_AND_ASSIGN(
      const neurolap::hopfield::HopfieldParams reread,
      GetTextProto<neurolap::hopfield::HopfieldParams>(path));
  EXPECT_EQ(reread.step_size(), 0.5);
}

TEST(FileTest, BadTextProto) {
  const std::string path = TempPath("bad.textproto");
  ASSERT_OK(SetContents(path, "no_such_field: 1"));
  EXPECT_THAT(GetTextProto<neurolap::hopfield::HopfieldParams>(path),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("no_such_field")));
}

TEST(FileTest, BadTextProtoReportsOneBasedLine) {
  const std::string path = TempPath("bad_second_line.textproto");
  ASSERT_OK(SetContents(path, "step_size: 0.5\nstep_size: fast\n"));
  EXPECT_THAT(GetTextProto<neurolap::hopfield::HopfieldParams>(path),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("': 2:")));
}

}  // namespace
}  // namespace file
