#pragma once

#include "rref_shell/config.hpp"

#include "rref_core/matrix.hpp"

#if RREF_SHELL_ENABLE_DEBUG
#include <cstdio>
#define SHELL_DBG(...) std::fprintf(stderr, __VA_ARGS__)
#else
#define SHELL_DBG(...) \
		do {            \
		} while (0)
#endif

namespace rref_shell::detail {

// one line per row, entries as format_cell() prints them; no-op unless
// RREF_SHELL_ENABLE_DEBUG
void dbg_print_matrix(const char* tag, rref_core::MatrixView m) noexcept;

} // namespace rref_shell::detail
