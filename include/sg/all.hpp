#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sg/core/config.hpp"
#include "sg/core/errors.hpp"
#include "sg/core/rng.hpp"
#include "sg/core/value.hpp"

// Ops
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"

// NN
#include "sg/nn/module.hpp"
#include "sg/nn/neuron.hpp"
#include "sg/nn/layer.hpp"
#include "sg/nn/mlp.hpp"

// End of umbrella
