#pragma once

#include <string>

namespace seqpart {

/*
 * Installs handlers for termination and fault signals. The handler reports the signal and, in debug builds, a
 * stacktrace.
 */
void RegisterSignalHandler();

/*
 * Restores the default signal handling behavior.
 */
void DeregisterSignalHandler();

std::string SignalToString(int signal_number);

}  // namespace seqpart
