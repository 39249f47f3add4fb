#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/config.hpp"
#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"

namespace rref_core {

// validation failure from parse_matrix(); row/col are 0 based
//
// code is one of:
//   EmptyInput       no rows (rows == 0) or a first row without values (rows > 0)
//   RaggedRow        row `row` has `actual` values, `expected` wanted
//   InvalidNumber    token at (row, col) is not a finite number
//   InvalidDimension `rows` x `expected` exceeds kMaxRows x kMaxCols
struct ParseError {
		ErrorCode code = ErrorCode::Ok;
		std::size_t row = 0;
		std::size_t col = 0;
		std::size_t rows = 0;
		std::size_t expected = 0;
		std::size_t actual = 0;
		char token[kTokenCap]{};
};

constexpr bool is_ok(const ParseError& err) noexcept {
		return is_ok(err.code);
}

// rows are separated by '\n' or '\r' (empty lines are skipped), values by
// runs of spaces or tabs. every row must hold the same number of values.
// on failure *out is left untouched.
ParseError parse_matrix(In const char* text, Out Matrix* out) noexcept;

// human readable text for err, e.g. "Row 2 has 3 columns, but expected 4."
ErrorCode parse_error_message(In const ParseError& err, Out char* out, In std::size_t cap) noexcept;

} // namespace rref_core
