#pragma once

namespace app {

/// Install handlers for fatal signals (SIGSEGV, SIGFPE, SIGILL, SIGBUS,
/// SIGABRT) that print a stack trace to stderr before re-raising, and ignore
/// SIGPIPE so a backend that closes its stdin early cannot end the server
void InitializeSignalHandlers();

/// Wait for debugger attachment if WAIT_FOR_GDB environment variable is set
/// Raises SIGSTOP to pause execution for debugger attachment
void WaitForDebuggerIfRequested();

}  // namespace app
