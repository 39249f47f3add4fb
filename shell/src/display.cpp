#include "rref_shell/display.hpp"

#include "rref_shell/session.hpp"

#include "rref_core/writer.hpp"

#include <cstring>

namespace rref_shell {
namespace {
constexpr std::size_t kCellWidth = 8;
} // namespace

CellRole cell_role(const Session& s, std::uint8_t r, std::uint8_t c) noexcept {
		if (!s.has_matrix())
				return CellRole::Plain;
		const rref_core::MatrixView m = s.matrix();
		if (r >= m.rows || c >= m.cols)
				return CellRole::Plain;

		if (s.run_active()) {
				const rref_core::PivotCursor cur = s.cursor();
				if (r == cur.row && c == cur.col)
						return CellRole::Pivot;
				if (r == cur.row || c == cur.col)
						return CellRole::PivotLine;
				return CellRole::Plain;
		}

		const std::uint8_t last = static_cast<std::uint8_t>(m.cols - 1u);
		if (c < last && rref_core::near_one(rref_core::display_value(m.at(r, c))))
				return CellRole::PivotOne;
		if (m.cols > 1 && c == last)
				return CellRole::Constant;
		return CellRole::Plain;
}

rref_core::ErrorCode format_cell(double v, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return rref_core::ErrorCode::BufferTooSmall;
		out[0] = '\0';
		rref_core::Writer w{out, cap, 0};
		return w.append_f64(rref_core::display_value(v));
}

rref_core::ErrorCode format_grid(rref_core::MatrixView m, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return rref_core::ErrorCode::BufferTooSmall;
		out[0] = '\0';
		if (!m.data)
				return rref_core::ErrorCode::Internal;

		rref_core::Writer w{out, cap, 0};
		char cell[48];
		for (std::uint8_t row = 0; row < m.rows; row++) {
				for (std::uint8_t col = 0; col < m.cols; col++) {
						if (m.cols > 1 && col + 1 == m.cols) {
								rref_core::ErrorCode ec = w.append(" |");
								if (!rref_core::is_ok(ec))
										return ec;
						}

						rref_core::ErrorCode ec = format_cell(m.at(row, col), cell, sizeof(cell));
						if (!rref_core::is_ok(ec))
								return ec;
						for (std::size_t pad = std::strlen(cell); pad < kCellWidth; pad++) {
								ec = w.put(' ');
								if (!rref_core::is_ok(ec))
										return ec;
						}
						ec = w.append(cell);
						if (!rref_core::is_ok(ec))
								return ec;
				}

				if (row + 1 < m.rows) {
						rref_core::ErrorCode ec = w.put('\n');
						if (!rref_core::is_ok(ec))
								return ec;
				}
		}
		return rref_core::ErrorCode::Ok;
}

} // namespace rref_shell
