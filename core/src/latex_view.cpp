#include "rref_core/latex.hpp"
#include "rref_core/writer.hpp"

#include <cstdint>

namespace rref_core::latex {
namespace {

ErrorCode write_entry(double v, Writer& w) noexcept {
		return w.append_f64(display_value(v));
}

ErrorCode write_rows(MatrixView m, Writer& w) noexcept {
		for (std::uint8_t row = 0; row < m.rows; row++) {
				for (std::uint8_t col = 0; col < m.cols; col++) {
						if (col != 0) {
								ErrorCode ec = w.append(" & ");
								if (!is_ok(ec))
										return ec;
						}

						ErrorCode ec = write_entry(m.at(row, col), w);
						if (!is_ok(ec))
								return ec;
				}

				if (row + 1 < m.rows) {
						ErrorCode ec = w.append(" \\\\ ");
						if (!is_ok(ec))
								return ec;
				}
		}
		return ErrorCode::Ok;
}

ErrorCode write_matrix_inner(MatrixView m, Writer& w) noexcept {
		if (!m.data)
				return ErrorCode::Internal;

		ErrorCode ec = w.append("\\begin{bmatrix}");
		if (!is_ok(ec))
				return ec;
		ec = write_rows(m, w);
		if (!is_ok(ec))
				return ec;
		return w.append("\\end{bmatrix}");
}

ErrorCode write_augmented_matrix_inner(MatrixView m, Writer& w) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		if (m.cols < 2)
				return write_matrix_inner(m, w);

		ErrorCode ec = w.append("\\left[\\begin{array}{");
		if (!is_ok(ec))
				return ec;
		for (std::uint8_t i = 0; i + 1 < m.cols; i++) {
				ec = w.put('r');
				if (!is_ok(ec))
						return ec;
		}
		ec = w.append("|r}");
		if (!is_ok(ec))
				return ec;

		ec = write_rows(m, w);
		if (!is_ok(ec))
				return ec;

		return w.append("\\end{array}\\right]");
}

ErrorCode wrap_display(ErrorCode (*inner)(MatrixView, Writer&), MatrixView m, Writer& w) noexcept {
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = inner(m, w);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

Writer begin(Buffer out) noexcept {
		Writer w{out.data, out.cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';
		return w;
}

} // namespace

ErrorCode write_matrix(MatrixView m, Buffer out) noexcept {
		Writer w = begin(out);
		return write_matrix_inner(m, w);
}

ErrorCode write_matrix_display(MatrixView m, Buffer out) noexcept {
		Writer w = begin(out);
		return wrap_display(&write_matrix_inner, m, w);
}

ErrorCode write_augmented_matrix(MatrixView m, Buffer out) noexcept {
		Writer w = begin(out);
		return write_augmented_matrix_inner(m, w);
}

ErrorCode write_augmented_matrix_display(MatrixView m, Buffer out) noexcept {
		Writer w = begin(out);
		return wrap_display(&write_augmented_matrix_inner, m, w);
}

} // namespace rref_core::latex
