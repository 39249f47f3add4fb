#pragma once

// -----------------------------------------------------------------------------
// Build knobs
// -----------------------------------------------------------------------------
//
#ifndef RREF_SHELL_ENABLE_DEBUG
#define RREF_SHELL_ENABLE_DEBUG 0
#endif

// bytes of step text kept by the session log (one run of a 16x17 matrix
// needs roughly 40KB)
#ifndef RREF_SHELL_LOG_BYTES
#define RREF_SHELL_LOG_BYTES (64u * 1024u)
#endif

#ifndef RREF_SHELL_LOG_ENTRIES
#define RREF_SHELL_LOG_ENTRIES 1024u
#endif
