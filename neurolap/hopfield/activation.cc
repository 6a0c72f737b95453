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

#include "neurolap/hopfield/activation.h"

#include "Eigen/Core"
#include "absl/log/check.h"

namespace neurolap::hopfield {

double Sigmoid(const double potential, const double temperature) {
  DCHECK_GT(temperature, 0.0);
  return SigmoidFunctor(temperature)(potential);
}

Eigen::ArrayXXd Sigmoid(const Eigen::ArrayXXd& potentials,
                        const double temperature) {
  DCHECK_GT(temperature, 0.0);
  return potentials.unaryExpr(SigmoidFunctor(temperature));
}

double InverseSigmoid(const double activation, const double temperature) {
  DCHECK_GT(temperature, 0.0);
  DCHECK(activation > 0.0 && activation < 1.0) << activation;
  return InverseSigmoidFunctor(temperature)(activation);
}

Eigen::ArrayXXd InverseSigmoid(const Eigen::ArrayXXd& activations,
                               const double temperature) {
  DCHECK_GT(temperature, 0.0);
  DCHECK((activations > 0.0).all() && (activations < 1.0).all());
  return activations.unaryExpr(InverseSigmoidFunctor(temperature));
}

}  // namespace neurolap::hopfield
