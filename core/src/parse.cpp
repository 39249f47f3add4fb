#include "rref_core/parse.hpp"

#include "rref_core/writer.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace rref_core {
namespace {

constexpr bool is_line_break(char ch) noexcept {
		return ch == '\n' || ch == '\r';
}

constexpr bool is_blank(char ch) noexcept {
		return ch == ' ' || ch == '\t' || ch == '\v' || ch == '\f';
}

// [begin, end) of one line
struct Span {
		const char* begin = nullptr;
		const char* end = nullptr;
};

// advance *cursor past the next non-empty line; false at end of text
bool next_line(const char** cursor, Span* out) noexcept {
		const char* p = *cursor;
		while (*p != '\0' && is_line_break(*p))
				p++;
		if (*p == '\0') {
				*cursor = p;
				return false;
		}
		const char* begin = p;
		while (*p != '\0' && !is_line_break(*p))
				p++;
		*out = {begin, p};
		*cursor = p;
		return true;
}

// advance *cursor past the next token inside line; false at end of line
bool next_token(const char** cursor, const char* end, Span* out) noexcept {
		const char* p = *cursor;
		while (p < end && is_blank(*p))
				p++;
		if (p == end) {
				*cursor = p;
				return false;
		}
		const char* begin = p;
		while (p < end && !is_blank(*p))
				p++;
		*out = {begin, p};
		*cursor = p;
		return true;
}

std::size_t count_tokens(Span line) noexcept {
		std::size_t n = 0;
		const char* cur = line.begin;
		Span tok;
		while (next_token(&cur, line.end, &tok))
				n++;
		return n;
}

void copy_token(Span tok, char* out, std::size_t cap) noexcept {
		std::size_t n = 0;
		for (const char* p = tok.begin; p < tok.end && n + 1 < cap; p++)
				out[n++] = *p;
		out[n] = '\0';
}

// decimal and exponent forms only, whole token, finite. no hex, no length cap
bool parse_f64(Span tok, double* out) noexcept {
		const char* begin = tok.begin;
		// from_chars takes no leading '+'
		if (tok.end - begin > 1 && *begin == '+' && begin[1] != '+' && begin[1] != '-')
				begin++;
		if (begin == tok.end)
				return false;

		double v = 0.0;
		const std::from_chars_result res = std::from_chars(begin, tok.end, v, std::chars_format::general);
		if (res.ec != std::errc{} || res.ptr != tok.end)
				return false;
		if (!std::isfinite(v))
				return false;
		*out = v;
		return true;
}

} // namespace

ParseError parse_matrix(const char* text, Matrix* out) noexcept {
		ParseError err;
		if (!out || !text) {
				err.code = ErrorCode::Internal;
				return err;
		}

		// first pass: shape
		std::size_t rows = 0;
		std::size_t cols = 0;
		{
				const char* cur = text;
				Span line;
				while (next_line(&cur, &line)) {
						if (rows == 0)
								cols = count_tokens(line);
						rows++;
				}
		}

		if (rows == 0 || cols == 0) {
				err.code = ErrorCode::EmptyInput;
				err.rows = rows;
				return err;
		}
		if (rows > kMaxRows || cols > kMaxCols) {
				err.code = ErrorCode::InvalidDimension;
				err.rows = rows;
				err.expected = cols;
				return err;
		}

		double values[kMaxEntries]{};
		const char* cur = text;
		Span line;
		for (std::size_t row = 0; row < rows && next_line(&cur, &line); row++) {
				const std::size_t n = count_tokens(line);
				if (n != cols) {
						err.code = ErrorCode::RaggedRow;
						err.row = row;
						err.rows = rows;
						err.expected = cols;
						err.actual = n;
						return err;
				}

				const char* tok_cur = line.begin;
				Span tok;
				for (std::size_t col = 0; col < cols && next_token(&tok_cur, line.end, &tok); col++) {
						if (!parse_f64(tok, &values[row * cols + col])) {
								err.code = ErrorCode::InvalidNumber;
								err.row = row;
								err.col = col;
								err.rows = rows;
								err.expected = cols;
								copy_token(tok, err.token, sizeof(err.token));
								return err;
						}
				}
		}

		Matrix m;
		const ErrorCode ec = Matrix::create(rows, cols, values, rows * cols, &m);
		if (!is_ok(ec)) {
				err.code = ec;
				err.rows = rows;
				err.expected = cols;
				return err;
		}
		*out = m;
		return err;
}

ErrorCode parse_error_message(const ParseError& err, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};
		switch (err.code) {
		case ErrorCode::Ok:
				return ErrorCode::Ok;
		case ErrorCode::EmptyInput:
				return w.append(err.rows == 0 ? "No rows found." : "No columns found.");
		case ErrorCode::RaggedRow: {
				ErrorCode ec = w.append("Row ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.row + 1u);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" has ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.actual);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" columns, but expected ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.expected);
				if (!is_ok(ec))
						return ec;
				return w.put('.');
		}
		case ErrorCode::InvalidNumber: {
				ErrorCode ec = w.append("Invalid number '");
				if (!is_ok(ec))
						return ec;
				ec = w.append(err.token);
				if (!is_ok(ec))
						return ec;
				ec = w.append("' at Row ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.row + 1u);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", Column ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.col + 1u);
				if (!is_ok(ec))
						return ec;
				return w.put('.');
		}
		case ErrorCode::InvalidDimension: {
				ErrorCode ec = w.append("Matrix is ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.rows);
				if (!is_ok(ec))
						return ec;
				ec = w.put('x');
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(err.expected);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", but at most ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(kMaxRows);
				if (!is_ok(ec))
						return ec;
				ec = w.put('x');
				if (!is_ok(ec))
						return ec;
				ec = w.append_u64(kMaxCols);
				if (!is_ok(ec))
						return ec;
				return w.append(" is supported.");
		}
		default:
				return w.append(error_name(err.code));
		}
}

} // namespace rref_core
