#pragma once

#include <cstddef>
#include <cstdint>

namespace rref_core {
constexpr std::uint8_t kMaxRows = 16;
// an augmented system of kMaxRows equations in kMaxRows unknowns needs one
// extra column for the constants.
constexpr std::uint8_t kMaxCols = 17;
constexpr std::size_t kMaxEntries = static_cast<std::size_t>(kMaxRows) * static_cast<std::size_t>(kMaxCols);

// every "is this zero / is this one" comparison goes through this
constexpr double kEpsilon = 1e-9;

// caption buffers are sized so the longest step text fits (see Writer::append_f64)
constexpr std::size_t kStepTextCap = 160;

// offending token text kept in ParseError (truncated, always terminated)
constexpr std::size_t kTokenCap = 32;
} // namespace rref_core
