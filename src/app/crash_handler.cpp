#include "app/crash_handler.hpp"

#include <array>
#include <cstdlib>

#ifdef __linux__
#include <csignal>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

constexpr std::array kFatalSignals = {SIGSEGV, SIGFPE, SIGILL, SIGBUS, SIGABRT};

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\nlspshim: fatal signal " << sig << "\n";
  std::cerr << "Stack trace:\n";
  std::cerr << std::stacktrace::current() << "\n";
  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeSignalHandlers() {
#ifdef __linux__
  for (int sig : kFatalSignals) {
    std::signal(sig, HandleFatalSignal);
  }
  std::signal(SIGPIPE, SIG_IGN);
#endif
  // On non-Linux platforms, signal handlers are not installed
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
  // On non-Linux platforms, debugger wait is not implemented
}

}  // namespace app
