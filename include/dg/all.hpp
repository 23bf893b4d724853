#pragma once
// Umbrella header for bindings and tests.

// Core
#include "dg/core/config.hpp"
#include "dg/core/function.hpp"
#include "dg/core/log.hpp"
#include "dg/core/tensor.hpp"
#include "dg/core/variable.hpp"

// Ops
#include "dg/ops/activations.hpp"
#include "dg/ops/conv.hpp"
#include "dg/ops/dropout.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/linalg.hpp"
#include "dg/ops/loss.hpp"
#include "dg/ops/numeric.hpp"
#include "dg/ops/reduce.hpp"
#include "dg/ops/shape.hpp"
#include "dg/ops/slice.hpp"

// NN
#include "dg/nn/module.hpp"
