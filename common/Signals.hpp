#ifndef SIGNALS_HPP
#define SIGNALS_HPP

#include <atomic>

// Set by SIGINT, SIGTERM, SIGHUP and SIGQUIT once handlers are installed
extern std::atomic<bool> terminateProgram;

// Must run after gpioInitialise(), which installs pigpio's own handlers for
// these signals (they exit without going through the monitor shutdown).
bool installSignalHandlers();

#endif // SIGNALS_HPP
