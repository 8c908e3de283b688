#include "signal_handler.hpp"

#include <csignal>

namespace cloudmock {
namespace runtime {

std::atomic<int> SignalHandler::received_signal_{0};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

bool SignalHandler::is_shutdown_requested() { return received_signal_.load() != 0; }

int SignalHandler::received_signal() { return received_signal_.load(); }

void SignalHandler::reset() { received_signal_.store(0); }

const char *SignalHandler::signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal";
    }
}

void SignalHandler::handle_signal(int signal) {
    // Lock-free atomic store only
    received_signal_.store(signal);
}

}  // namespace runtime
}  // namespace cloudmock
