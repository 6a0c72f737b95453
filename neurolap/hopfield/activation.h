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

// Neuron activation of the Hopfield network: the logistic sigmoid with a
// temperature, mapping an internal potential u to an output in [0, 1]:
//   sigmoid_T(u) = 1 / (1 + exp(-u / T)).
//
// Every entry point evaluates the same functor, so the scalar and grid
// overloads return bit-for-bit identical values for identical inputs.

#ifndef NEUROLAP_HOPFIELD_ACTIVATION_H_
#define NEUROLAP_HOPFIELD_ACTIVATION_H_

#include <cmath>

#include "Eigen/Core"

namespace neurolap::hopfield {

struct SigmoidFunctor {
  explicit SigmoidFunctor(double temperature) : temperature(temperature) {}

  // Evaluated as exp(z) / (1 + exp(z)) for negative z so that exp() never
  // overflows.
  double operator()(double u) const {
    const double z = u / temperature;
    if (z >= 0.0) {
      return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
  }

  double temperature;
};

// Inverse of `SigmoidFunctor`: T * log(v / (1 - v)). `v` must be in (0, 1).
struct InverseSigmoidFunctor {
  explicit InverseSigmoidFunctor(double temperature)
      : temperature(temperature) {}

  double operator()(double v) const {
    return temperature * std::log(v / (1.0 - v));
  }

  double temperature;
};

// Requires `temperature > 0`.
double Sigmoid(double potential, double temperature);

// Elementwise `Sigmoid()` of a grid of potentials.
Eigen::ArrayXXd Sigmoid(const Eigen::ArrayXXd& potentials, double temperature);

// Requires `temperature > 0` and `activation` in (0, 1).
double InverseSigmoid(double activation, double temperature);

// Elementwise `InverseSigmoid()` of a grid of activations.
Eigen::ArrayXXd InverseSigmoid(const Eigen::ArrayXXd& activations,
                               double temperature);

}  // namespace neurolap::hopfield

#endif  // NEUROLAP_HOPFIELD_ACTIVATION_H_
