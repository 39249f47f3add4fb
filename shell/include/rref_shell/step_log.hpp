#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/error.hpp"

#include "rref_shell/config.hpp"

namespace rref_shell {

// append only list of step descriptions backed by one malloc'd block.
// when the block (or the entry table) is full, that append and every later
// one until clear() is dropped and truncated() reports it.
class StepLog {
	  public:
		StepLog() noexcept = default;
		StepLog(const StepLog&) = delete;
		StepLog& operator=(const StepLog&) = delete;

		~StepLog() { release(); }

		rref_core::ErrorCode init(In std::size_t bytes) noexcept;
		void release() noexcept;

		// drops all entries, keeps the block
		void clear() noexcept;

		// false when the entry was dropped
		bool append(In const char* text) noexcept;

		std::size_t count() const noexcept { return count_; }
		bool truncated() const noexcept { return truncated_; }
		std::size_t used() const noexcept { return used_; }
		std::size_t capacity() const noexcept { return cap_; }

		// "" when i is out of range
		const char* entry(In std::size_t i) const noexcept;

	  private:
		char* data_ = nullptr;
		std::size_t cap_ = 0;
		std::size_t used_ = 0;
		std::size_t count_ = 0;
		bool truncated_ = false;
		std::uint32_t offsets_[RREF_SHELL_LOG_ENTRIES]{};
};

} // namespace rref_shell
