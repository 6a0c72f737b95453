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

// Validation utilities for solvers.proto.

#ifndef NEUROLAP_HOPFIELD_SOLVERS_PROTO_VALIDATION_H_
#define NEUROLAP_HOPFIELD_SOLVERS_PROTO_VALIDATION_H_

#include "absl/status/status.h"
#include "neurolap/hopfield/solvers.pb.h"

namespace neurolap::hopfield {

// Returns `InvalidArgumentError` if `criteria` contains any invalid values.
// Returns `OkStatus` otherwise.
absl::Status ValidateTerminationCriteria(const TerminationCriteria& criteria);

// Returns `InvalidArgumentError` if `limits` contains any invalid values.
// Returns `OkStatus` otherwise.
absl::Status ValidateMatrixLimits(const MatrixLimits& limits);

// Returns `InvalidArgumentError` if `params` contains any invalid values,
// including in its nested messages. Returns `OkStatus` otherwise.
absl::Status ValidateHopfieldParams(const HopfieldParams& params);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_SOLVERS_PROTO_VALIDATION_H_
