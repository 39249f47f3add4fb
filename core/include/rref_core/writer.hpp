#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "rref_core/error.hpp"

namespace rref_core {

// string builder helper that writes to a fixed capacity buffer
// all operations are noexcept and return ErrorCode on overflow
struct Writer {
		char* data = nullptr;
		std::size_t cap = 0;
		std::size_t len = 0;

		ErrorCode put(char ch) noexcept {
				if (!data || cap == 0)
						return ErrorCode::BufferTooSmall;
				if (len + 1 >= cap)
						return ErrorCode::BufferTooSmall;
				data[len++] = ch;
				data[len] = '\0';
				return ErrorCode::Ok;
		}

		ErrorCode append(const char* s) noexcept {
				if (!s)
						return ErrorCode::Internal;
				for (std::size_t i = 0; s[i] != '\0'; i++) {
						ErrorCode ec = put(s[i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_u64(std::uint64_t v) noexcept {
				char buf[32];
				std::size_t n = 0;
				do {
						buf[n++] = static_cast<char>('0' + (v % 10u));
						v /= 10u;
				} while (v != 0u);

				for (std::size_t i = 0; i < n; i++) {
						ErrorCode ec = put(buf[n - 1 - i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		// append a 1 based index (v+1) as decimal
		ErrorCode append_index1(std::uint8_t v) noexcept { return append_u64(static_cast<std::uint64_t>(v) + 1u); }

		// two decimals ("%.2f"); magnitudes >= 1e15 switch to "%.3e" so the
		// text stays short enough for kStepTextCap captions
		ErrorCode append_f64(double v) noexcept {
				char buf[48];
				const char* fmt = (std::fabs(v) < 1e15) ? "%.2f" : "%.3e";
				const int n = std::snprintf(buf, sizeof(buf), fmt, v);
				if (n < 0 || static_cast<std::size_t>(n) >= sizeof(buf))
						return ErrorCode::Internal;
				return append(buf);
		}
};

} // namespace rref_core
