#include "rref_shell/detail/debug.hpp"

#include "rref_shell/display.hpp"

namespace rref_shell::detail {

void dbg_print_matrix(const char* tag, rref_core::MatrixView m) noexcept {
#if RREF_SHELL_ENABLE_DEBUG
		static char buf[4096];
		const rref_core::ErrorCode ec = format_grid(m, buf, sizeof(buf));
		SHELL_DBG("[%s] %ux%u%s\n%s\n", tag ? tag : "matrix", (unsigned)m.rows, (unsigned)m.cols,
				rref_core::is_ok(ec) ? "" : " (truncated)", buf);
#else
		(void)tag;
		(void)m;
#endif
}

} // namespace rref_shell::detail
