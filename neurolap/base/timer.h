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

#ifndef NEUROLAP_BASE_TIMER_H_
#define NEUROLAP_BASE_TIMER_H_

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace neurolap {

// Wall-clock stopwatch. Time accumulates over Start()/Stop() pairs; reading a
// running timer includes the current lap.
class WallTimer {
 public:
  void Start() {
    running_ = true;
    lap_start_ = absl::Now();
  }
  void Stop() {
    if (!running_) return;
    elapsed_ += absl::Now() - lap_start_;
    running_ = false;
  }
  bool IsRunning() const { return running_; }

  absl::Duration GetDuration() const {
    return running_ ? elapsed_ + (absl::Now() - lap_start_) : elapsed_;
  }
  // Seconds.
  double Get() const { return absl::ToDoubleSeconds(GetDuration()); }

 private:
  bool running_ = false;
  absl::Time lap_start_;
  absl::Duration elapsed_ = absl::ZeroDuration();
};

}  // namespace neurolap

#endif  // NEUROLAP_BASE_TIMER_H_
