#include "rref_shell/step_log.hpp"

#include <cstdlib>
#include <cstring>

namespace rref_shell {

rref_core::ErrorCode StepLog::init(std::size_t bytes) noexcept {
		release();
		if (bytes == 0)
				return rref_core::ErrorCode::InvalidDimension;

		void* mem = std::malloc(bytes);
		if (!mem)
				return rref_core::ErrorCode::Overflow;
		data_ = static_cast<char*>(mem);
		cap_ = bytes;
		clear();
		return rref_core::ErrorCode::Ok;
}

void StepLog::release() noexcept {
		if (data_)
				std::free(data_);
		data_ = nullptr;
		cap_ = 0;
		clear();
}

void StepLog::clear() noexcept {
		used_ = 0;
		count_ = 0;
		truncated_ = false;
}

bool StepLog::append(const char* text) noexcept {
		if (!text)
				text = "";
		const std::size_t n = std::strlen(text) + 1;
		// once an entry is dropped the rest go too, so the log never has gaps
		if (truncated_ || !data_ || count_ >= RREF_SHELL_LOG_ENTRIES || n > cap_ - used_) {
				truncated_ = true;
				return false;
		}

		std::memcpy(data_ + used_, text, n);
		offsets_[count_++] = static_cast<std::uint32_t>(used_);
		used_ += n;
		return true;
}

const char* StepLog::entry(std::size_t i) const noexcept {
		if (i >= count_)
				return "";
		return data_ + offsets_[i];
}

} // namespace rref_shell
