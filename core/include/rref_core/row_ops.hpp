#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"

namespace rref_core {
enum class RowOpKind : std::uint8_t {
		Swap,
		AddMul, // R_i <- R_i + k R_j
		Scale,  // R_i <- k R_i
};

struct RowOp {
		RowOpKind kind = RowOpKind::Swap;
		std::uint8_t target_row = 0;
		std::uint8_t source_row = 0;
		double scalar = 0.0;
};

// applies op to m in place
ErrorCode row_op_apply(InOut Matrix& m, In const RowOp& op) noexcept;

// LaTeX caption for a RowOp (1 based row indices), e.g. $R_{2} \leftarrow R_{2} + (-2.00) R_{1}$
ErrorCode row_op_caption(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

} // namespace rref_core
