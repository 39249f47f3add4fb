#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"

namespace rref_shell {

class Session;

enum class CellRole : std::uint8_t {
		Plain,
		Pivot,     // cell under the pivot cursor (run active)
		PivotLine, // rest of the cursor row and column (run active)
		PivotOne,  // coefficient cell equal to 1 (after completion)
		Constant,  // last column of an augmented matrix (after completion)
};

// highlight for cell (r, c) of the session matrix. Plain when idle or out of range
CellRole cell_role(In const Session& s, In std::uint8_t r, In std::uint8_t c) noexcept;

// two decimal text of display_value(v), e.g. "-3.00", "0.00"
rref_core::ErrorCode format_cell(In double v, Out char* out, In std::size_t cap) noexcept;

// m as rows of right aligned cells, a '|' before the last column when
// augmented, rows separated by '\n'
rref_core::ErrorCode format_grid(In rref_core::MatrixView m, Out char* out, In std::size_t cap) noexcept;

} // namespace rref_shell
