#pragma once
// Umbrella header for bindings and examples.

#include "nj/core/types.hpp"
#include "nj/core/errors.hpp"
#include "nj/core/config.hpp"
#include "nj/core/dtype.hpp"
#include "nj/core/shape.hpp"
#include "nj/core/layout.hpp"
#include "nj/core/value.hpp"
