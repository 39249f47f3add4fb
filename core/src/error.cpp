#include "rref_core/error.hpp"

namespace rref_core {

const char* error_name(ErrorCode code) noexcept {
		switch (code) {
		case ErrorCode::Ok:
				return "Ok";
		case ErrorCode::InvalidDimension:
				return "InvalidDimension";
		case ErrorCode::DimensionMismatch:
				return "DimensionMismatch";
		case ErrorCode::IndexOutOfRange:
				return "IndexOutOfRange";
		case ErrorCode::StepOutOfRange:
				return "StepOutOfRange";
		case ErrorCode::BufferTooSmall:
				return "BufferTooSmall";
		case ErrorCode::EmptyInput:
				return "EmptyInput";
		case ErrorCode::RaggedRow:
				return "RaggedRow";
		case ErrorCode::InvalidNumber:
				return "InvalidNumber";
		case ErrorCode::Overflow:
				return "Overflow";
		case ErrorCode::Internal:
				return "Internal";
		}
		return "Unknown";
}

} // namespace rref_core
