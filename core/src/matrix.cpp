#include "rref_core/matrix.hpp"

#include <utility>

namespace rref_core {

ErrorCode Matrix::create(std::size_t rows, std::size_t cols, const double* values, std::size_t count, Matrix* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (rows < 1 || cols < 1)
				return ErrorCode::DimensionMismatch;
		if (count != rows * cols)
				return ErrorCode::DimensionMismatch;
		if (rows > kMaxRows || cols > kMaxCols)
				return ErrorCode::InvalidDimension;
		if (!values)
				return ErrorCode::Internal;

		out->rows_ = static_cast<std::uint8_t>(rows);
		out->cols_ = static_cast<std::uint8_t>(cols);
		for (std::size_t i = 0; i < count; i++)
				out->data_[i] = values[i];
		for (std::size_t i = count; i < kMaxEntries; i++)
				out->data_[i] = 0.0;
		return ErrorCode::Ok;
}

ErrorCode Matrix::get(std::uint8_t r, std::uint8_t c, double* out) const noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (r >= rows_ || c >= cols_)
				return ErrorCode::IndexOutOfRange;
		*out = data_[index(r, c)];
		return ErrorCode::Ok;
}

ErrorCode Matrix::set(std::uint8_t r, std::uint8_t c, double v) noexcept {
		if (r >= rows_ || c >= cols_)
				return ErrorCode::IndexOutOfRange;
		data_[index(r, c)] = v;
		return ErrorCode::Ok;
}

ErrorCode Matrix::swap_rows(std::uint8_t r1, std::uint8_t r2) noexcept {
		if (!valid_row(r1) || !valid_row(r2))
				return ErrorCode::IndexOutOfRange;
		if (r1 == r2)
				return ErrorCode::Ok;
		for (std::uint8_t col = 0; col < cols_; col++)
				std::swap(data_[index(r1, col)], data_[index(r2, col)]);
		return ErrorCode::Ok;
}

ErrorCode Matrix::scale_row(std::uint8_t r, double k) noexcept {
		if (!valid_row(r))
				return ErrorCode::IndexOutOfRange;
		for (std::uint8_t col = 0; col < cols_; col++)
				data_[index(r, col)] *= k;
		return ErrorCode::Ok;
}

ErrorCode Matrix::add_scaled_row(std::uint8_t dst, std::uint8_t src, double k) noexcept {
		if (!valid_row(dst) || !valid_row(src))
				return ErrorCode::IndexOutOfRange;
		for (std::uint8_t col = 0; col < cols_; col++)
				data_[index(dst, col)] += k * data_[index(src, col)];
		return ErrorCode::Ok;
}

} // namespace rref_core
