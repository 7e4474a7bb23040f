#pragma once

#include "dense_core/compare.hpp"
#include "dense_core/config.hpp"
#include "dense_core/error.hpp"
#include "dense_core/matrix.hpp"
#include "dense_core/matrix_view.hpp"
#include "dense_core/ops.hpp"
#include "dense_core/rational.hpp"
#include "dense_core/row_ops.hpp"
#include "dense_core/row_reduction.hpp"
#include "dense_core/scalar.hpp"
