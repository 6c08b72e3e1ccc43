#include "signal_handler.hpp"

#include <array>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/stacktrace.hpp>

namespace seqpart {

namespace {

constexpr std::array<int, 6> kSignalNumbers{SIGTERM, SIGSEGV, SIGINT, SIGILL, SIGABRT, SIGFPE};

void HandleSignal(int signal_number) {
  std::cerr << "Signal received: " << SignalToString(signal_number) << '\n';
#if SEQPART_DEBUG
  std::cerr << boost::stacktrace::stacktrace(0, 15);
#endif
  std::cerr << std::flush;

  // Restore the default disposition and re-raise so that the exit status reflects the signal.
  std::signal(signal_number, SIG_DFL);
  std::raise(signal_number);
}

}  // namespace

void RegisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, HandleSignal);
  }
}

void DeregisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, SIG_DFL);
  }
}

std::string SignalToString(int signal_number) {
  switch (signal_number) {
    case SIGTERM:
      return "SIGTERM";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGINT:
      return "SIGINT";
    case SIGILL:
      return "SIGILL";
    case SIGABRT:
      return "SIGABRT";
    case SIGFPE:
      return "SIGFPE";
    default:
      return "UNKNOWN";
  }
}

}  // namespace seqpart
