#include "rref_shell/session.hpp"

#include "rref_shell/detail/debug.hpp"

#include "rref_core/writer.hpp"

namespace rref_shell {
namespace {
constexpr const char* kIdleMessage = "Enter an augmented matrix and press 'Start'.";
constexpr const char* kLoadedMessage = "Matrix loaded. Click 'Next Step' to find the first pivot.";
constexpr const char* kParseErrorPrefix = "Error parsing matrix: ";
} // namespace

Session::Session() noexcept {
		set_message(kIdleMessage);
}

rref_core::ErrorCode Session::init(std::size_t log_bytes) noexcept {
		const rref_core::ErrorCode ec = log_.init(log_bytes);
		SHELL_DBG("[session] init log=%uB ec=%s\n", (unsigned)log_bytes, rref_core::error_name(ec));
		return ec;
}

const char* Session::default_input() noexcept {
		return "1 1 2 9\n2 4 -3 1\n3 6 -5 0";
}

rref_core::ParseError Session::start(const char* text) noexcept {
		rref_core::Matrix m;
		const rref_core::ParseError err = rref_core::parse_matrix(text, &m);
		if (!rref_core::is_ok(err)) {
				char detail[kMessageCap];
				if (!rref_core::is_ok(rref_core::parse_error_message(err, detail, sizeof(detail))))
						detail[0] = '\0';

				rref_core::Writer w{message_, sizeof(message_), 0};
				message_[0] = '\0';
				if (!rref_core::is_ok(w.append(kParseErrorPrefix)) || !rref_core::is_ok(w.append(detail)))
						SHELL_DBG("[session] parse message truncated\n");
				SHELL_DBG("[session] start failed: %s\n", rref_core::error_name(err.code));
				return err;
		}

		engine_.reset(m);
		log_.clear();
		phase_ = SessionPhase::Running;
		set_message(kLoadedMessage);
		SHELL_DBG("[session] start %ux%u\n", (unsigned)m.rows(), (unsigned)m.cols());
		detail::dbg_print_matrix("input", engine_.matrix());
		return err;
}

rref_core::ErrorCode Session::advance() noexcept {
		if (phase_ != SessionPhase::Running)
				return rref_core::ErrorCode::StepOutOfRange;

		rref_core::Step step;
		const rref_core::ErrorCode ec = engine_.advance(&step);
		if (!rref_core::is_ok(ec)) {
				SHELL_DBG("[session] advance failed: %s\n", rref_core::error_name(ec));
				return ec;
		}

		set_message(step.text);
		if (!log_.append(step.text))
				SHELL_DBG("[session] log full, dropped step %u\n", (unsigned)engine_.step_count());
		SHELL_DBG("[step %u] %s: %s\n", (unsigned)engine_.step_count(), rref_core::step_kind_name(step.kind), step.text);

		if (engine_.finished()) {
				phase_ = SessionPhase::Finished;
				detail::dbg_print_matrix("result", engine_.matrix());
		}
		return rref_core::ErrorCode::Ok;
}

void Session::reset() noexcept {
		engine_ = rref_core::StepEngine{};
		log_.clear();
		phase_ = SessionPhase::Idle;
		set_message(kIdleMessage);
		SHELL_DBG("[session] reset\n");
}

void Session::set_message(const char* text) noexcept {
		rref_core::Writer w{message_, sizeof(message_), 0};
		message_[0] = '\0';
		if (!rref_core::is_ok(w.append(text)))
				SHELL_DBG("[session] message truncated\n");
}

} // namespace rref_shell
