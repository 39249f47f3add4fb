#pragma once

#include "rref_core/config.hpp"
#include "rref_core/error.hpp"
#include "rref_core/latex.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/parse.hpp"
#include "rref_core/row_ops.hpp"
#include "rref_core/step_engine.hpp"
