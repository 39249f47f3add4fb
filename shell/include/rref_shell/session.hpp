#pragma once

#include <cstddef>
#include <cstdint>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/parse.hpp"
#include "rref_core/step_engine.hpp"

#include "rref_shell/config.hpp"
#include "rref_shell/step_log.hpp"

namespace rref_shell {

constexpr std::size_t kMessageCap = 192;

enum class SessionPhase : std::uint8_t {
		Idle,     // no matrix loaded
		Running,  // matrix loaded, steps remaining
		Finished, // last step shown
};

// start / next step / reset lifecycle around one StepEngine, plus the step
// history. a rendering front end reads matrix(), cursor(), message() and
// run_active() after every call and redraws.
class Session {
	  public:
		Session() noexcept;
		Session(const Session&) = delete;
		Session& operator=(const Session&) = delete;

		// allocates the step log; must be called once before start()
		rref_core::ErrorCode init(In std::size_t log_bytes = RREF_SHELL_LOG_BYTES) noexcept;

		// the example system shown in a fresh input box
		static const char* default_input() noexcept;

		// parses text and begins a new run. on failure the phase is unchanged
		// and message() holds "Error parsing matrix: ..."
		// without a prior init() the run still works but nothing is logged and
		// log().truncated() turns true at the first step
		rref_core::ParseError start(In const char* text) noexcept;

		// performs one step and records it. StepOutOfRange when idle or done
		rref_core::ErrorCode advance() noexcept;

		// back to idle; never fails
		void reset() noexcept;

		SessionPhase phase() const noexcept { return phase_; }
		bool has_matrix() const noexcept { return phase_ != SessionPhase::Idle; }
		// true while steps remain; selects pivot highlighting over the
		// post completion highlighting
		bool run_active() const noexcept { return phase_ == SessionPhase::Running; }

		const char* message() const noexcept { return message_; }
		rref_core::MatrixView matrix() const noexcept { return engine_.matrix(); }
		rref_core::PivotCursor cursor() const noexcept { return engine_.cursor(); }
		const rref_core::StepEngine& engine() const noexcept { return engine_; }
		const StepLog& log() const noexcept { return log_; }

	  private:
		rref_core::StepEngine engine_{};
		StepLog log_{};
		SessionPhase phase_ = SessionPhase::Idle;
		char message_[kMessageCap]{};

		void set_message(const char* text) noexcept;
};

} // namespace rref_shell
