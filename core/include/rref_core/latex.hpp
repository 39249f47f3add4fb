#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"

namespace rref_core::latex {
struct Buffer {
		char* data = nullptr;
		std::size_t cap = 0;
};

// entries go through display_value() and are written with two decimals

ErrorCode write_matrix(In MatrixView m, Out Buffer out) noexcept;
ErrorCode write_matrix_display(In MatrixView m, Out Buffer out) noexcept;

// writes m as an augmented matrix, bar before the last column
//
// example:
//   \left[\begin{array}{rr|r} 1.00 & 2.00 & 5.00 \\ 0.00 & 0.00 & 3.00 \end{array}\right]
//
// single column matrices fall back to write_matrix()
ErrorCode write_augmented_matrix(In MatrixView m, Out Buffer out) noexcept;
ErrorCode write_augmented_matrix_display(In MatrixView m, Out Buffer out) noexcept;
} // namespace rref_core::latex
