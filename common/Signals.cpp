#include "Signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>

// Global termination flag for signal handling
std::atomic<bool> terminateProgram{false};

namespace {

const int TERMINATION_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

void signalHandler(int signum) {
    for (int sig : TERMINATION_SIGNALS) {
        if (signum == sig) terminateProgram = true;
    }
}

} // namespace

bool installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (int sig : TERMINATION_SIGNALS) {
        if (sigaction(sig, &sa, nullptr) != 0) {
            std::fprintf(stderr, "sigaction %s failed: %s\n", strsignal(sig), std::strerror(errno));
            return false;
        }
    }
    return true;
}
