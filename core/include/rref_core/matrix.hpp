#pragma once

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "rref_core/config.hpp"
#include "rref_core/error.hpp"

namespace rref_core {
// written as "beyond epsilon" so NaN never counts as a pivot, an entry to
// eliminate or a nonzero constant
inline bool exceeds_epsilon(double v) noexcept {
		return std::fabs(v) > kEpsilon;
}
inline bool differs_from_one(double v) noexcept {
		return std::fabs(v - 1.0) > kEpsilon;
}
// strictly within kEpsilon of 1; used for highlighting only
inline bool near_one(double v) noexcept {
		return std::fabs(v - 1.0) < kEpsilon;
}

// value as shown to the user: rounding residue below kEpsilon prints as 0.
// stored entries are never rewritten.
inline double display_value(double v) noexcept {
		return (std::fabs(v) < kEpsilon) ? 0.0 : v;
}

// read only window over matrix storage, valid while the owning Matrix lives
struct MatrixView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0;
		const double* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		double at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}
};

// rows x cols grid of doubles with inline storage (no heap)
//
// a default constructed Matrix is empty (0x0) and only useful as an output
// slot for create() / parse_matrix()
class Matrix {
	  public:
		Matrix() noexcept = default;

		// values is row major and must hold exactly rows*cols entries
		static ErrorCode create(In std::size_t rows,
				In std::size_t cols,
				In const double* values,
				In std::size_t count,
				Out Matrix* out) noexcept;

		std::uint8_t rows() const noexcept { return rows_; }
		std::uint8_t cols() const noexcept { return cols_; }
		constexpr Dim dim() const noexcept { return {rows_, cols_}; }
		bool empty() const noexcept { return rows_ == 0 || cols_ == 0; }

		MatrixView view() const noexcept { return {rows_, cols_, cols_, data_}; }

		ErrorCode get(In std::uint8_t r, In std::uint8_t c, Out double* out) const noexcept;
		ErrorCode set(In std::uint8_t r, In std::uint8_t c, In double v) noexcept;

		// unchecked read for callers that already validated the indices
		double at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(r < rows_);
				assert(c < cols_);
				return data_[index(r, c)];
		}

		// R_r1 <-> R_r2, r1 == r2 is a no-op
		ErrorCode swap_rows(In std::uint8_t r1, In std::uint8_t r2) noexcept;

		// R_r <- k * R_r, k == 0 is allowed
		ErrorCode scale_row(In std::uint8_t r, In double k) noexcept;

		// R_dst <- R_dst + k * R_src
		ErrorCode add_scaled_row(In std::uint8_t dst, In std::uint8_t src, In double k) noexcept;

	  private:
		std::uint8_t rows_ = 0;
		std::uint8_t cols_ = 0;
		double data_[kMaxEntries]{};

		std::size_t index(std::uint8_t r, std::uint8_t c) const noexcept {
				return static_cast<std::size_t>(r) * cols_ + static_cast<std::size_t>(c);
		}
		bool valid_row(std::uint8_t r) const noexcept { return r < rows_; }
};

} // namespace rref_core
