#include "rref_core/rref_core.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <cstring>
#include <string>

using rref_core::ErrorCode;
using rref_core::Matrix;
using rref_core::ParseError;

static std::string message(const ParseError& err) {
		char buf[128];
		assert(rref_core::parse_error_message(err, buf, sizeof(buf)) == ErrorCode::Ok);
		return buf;
}

int main() {
		// happy path, mixed separators, signs, exponents and blank lines.
		{
				Matrix m;
				const ParseError err = rref_core::parse_matrix("1 1 2 9\n2 4 -3 1\r\n\n3\t6  -5 0\n", &m);
				assert(rref_core::is_ok(err));
				assert(m.rows() == 3 && m.cols() == 4);
				const double want[12] = {1, 1, 2, 9, 2, 4, -3, 1, 3, 6, -5, 0};
				assert(rref_test::matrix_near(m.view(), want, 0.0));
		}
		{
				Matrix m;
				assert(rref_core::is_ok(rref_core::parse_matrix("  -1.5e2   +0.25 \r .5 -0 ", &m)));
				assert(m.rows() == 2 && m.cols() == 2);
				assert(m.at(0, 0) == -150.0 && m.at(0, 1) == 0.25);
				assert(m.at(1, 0) == 0.5 && m.at(1, 1) == 0.0);
		}
		{
				Matrix m;
				assert(rref_core::is_ok(rref_core::parse_matrix("42", &m)));
				assert(m.rows() == 1 && m.cols() == 1 && m.at(0, 0) == 42.0);
		}

		// empty input.
		{
				Matrix m;
				ParseError err = rref_core::parse_matrix("", &m);
				assert(err.code == ErrorCode::EmptyInput);
				assert(message(err) == "No rows found.");

				err = rref_core::parse_matrix("\n\r\n", &m);
				assert(err.code == ErrorCode::EmptyInput);

				err = rref_core::parse_matrix("   \n1 2", &m);
				assert(err.code == ErrorCode::EmptyInput);
				assert(message(err) == "No columns found.");
				assert(m.empty());
		}

		// ragged rows name the row and both counts.
		{
				Matrix m;
				ParseError err = rref_core::parse_matrix("1 2 3\n4 5\n6 7 8", &m);
				assert(err.code == ErrorCode::RaggedRow);
				assert(err.row == 1 && err.expected == 3 && err.actual == 2);
				assert(message(err) == "Row 2 has 2 columns, but expected 3.");

				err = rref_core::parse_matrix("1 2\n3 4\n5 6 7", &m);
				assert(err.code == ErrorCode::RaggedRow);
				assert(message(err) == "Row 3 has 3 columns, but expected 2.");

				err = rref_core::parse_matrix("1 2\n   \n3 4", &m);
				assert(err.code == ErrorCode::RaggedRow);
				assert(err.row == 1 && err.actual == 0);
				assert(m.empty());
		}

		// malformed tokens name row, column and text.
		{
				Matrix m;
				ParseError err = rref_core::parse_matrix("1 2 3\n4 x5 6", &m);
				assert(err.code == ErrorCode::InvalidNumber);
				assert(err.row == 1 && err.col == 1);
				assert(std::strcmp(err.token, "x5") == 0);
				assert(message(err) == "Invalid number 'x5' at Row 2, Column 2.");

				err = rref_core::parse_matrix("1 2,5", &m);
				assert(err.code == ErrorCode::InvalidNumber);
				assert(message(err) == "Invalid number '2,5' at Row 1, Column 2.");

				// hex is not a decimal number
				err = rref_core::parse_matrix("0x10 1", &m);
				assert(err.code == ErrorCode::InvalidNumber);
				assert(message(err) == "Invalid number '0x10' at Row 1, Column 1.");

				err = rref_core::parse_matrix("1 +-2", &m);
				assert(err.code == ErrorCode::InvalidNumber && err.col == 1);

				err = rref_core::parse_matrix("inf 1", &m);
				assert(err.code == ErrorCode::InvalidNumber);
				err = rref_core::parse_matrix("1 nan", &m);
				assert(err.code == ErrorCode::InvalidNumber);
				err = rref_core::parse_matrix("1e999 1", &m);
				assert(err.code == ErrorCode::InvalidNumber);

				// long tokens are cut in the report but still rejected
				const std::string longtok(80, '7');
				const std::string text = "1 " + longtok + "z";
				err = rref_core::parse_matrix(text.c_str(), &m);
				assert(err.code == ErrorCode::InvalidNumber);
				assert(std::strlen(err.token) == rref_core::kTokenCap - 1);
				assert(m.empty());
		}

		// a valid number is accepted whatever its length.
		{
				Matrix m;
				const std::string one = "1." + std::string(140, '0');
				const std::string small = "0." + std::string(150, '0') + "25e152";
				const std::string text = one + " " + small;
				assert(rref_core::is_ok(rref_core::parse_matrix(text.c_str(), &m)));
				assert(m.rows() == 1 && m.cols() == 2);
				assert(m.at(0, 0) == 1.0);
				assert(m.at(0, 1) == 25.0);
		}

		// shapes beyond the inline storage.
		{
				std::string wide;
				for (int i = 0; i < rref_core::kMaxCols + 1; i++)
						wide += "1 ";
				Matrix m;
				ParseError err = rref_core::parse_matrix(wide.c_str(), &m);
				assert(err.code == ErrorCode::InvalidDimension);
				assert(message(err) == "Matrix is 1x18, but at most 16x17 is supported.");

				std::string tall;
				for (int i = 0; i < rref_core::kMaxRows + 1; i++)
						tall += "1 2\n";
				err = rref_core::parse_matrix(tall.c_str(), &m);
				assert(err.code == ErrorCode::InvalidDimension);
				assert(err.rows == 17u);
		}

		// argument checks.
		{
				Matrix m;
				assert(rref_core::parse_matrix(nullptr, &m).code == ErrorCode::Internal);
				assert(rref_core::parse_matrix("1", nullptr).code == ErrorCode::Internal);

				ParseError ok;
				char buf[8] = "junk";
				assert(rref_core::parse_error_message(ok, buf, sizeof(buf)) == ErrorCode::Ok);
				assert(buf[0] == '\0');

				ParseError ragged;
				ragged.code = ErrorCode::RaggedRow;
				ragged.expected = 3;
				ragged.actual = 2;
				assert(rref_core::parse_error_message(ragged, buf, sizeof(buf)) == ErrorCode::BufferTooSmall);
		}

		return 0;
}
