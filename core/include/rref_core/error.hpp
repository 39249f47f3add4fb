#pragma once

#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace rref_core {
struct Dim {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		InvalidDimension,
		DimensionMismatch,
		IndexOutOfRange,
		StepOutOfRange,
		BufferTooSmall,
		EmptyInput,
		RaggedRow,
		InvalidNumber,
		Overflow,
		Internal,
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}

// short stable name for traces and test output
const char* error_name(ErrorCode code) noexcept;
} // namespace rref_core
