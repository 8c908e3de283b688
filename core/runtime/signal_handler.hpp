#pragma once

#include <atomic>

namespace cloudmock {
namespace runtime {

/**
 * @brief Process signal wiring for the server
 *
 * SIGINT/SIGTERM set a shutdown flag polled by Runtime::run(). SIGPIPE is
 * ignored so a client hanging up mid-response surfaces as a write error in
 * cpp-httplib instead of killing the process.
 */
class SignalHandler {
public:
    static void install();

    static bool is_shutdown_requested();

    // Signal number that requested shutdown, 0 if none
    static int received_signal();

    // Clear the flag (tests, restart)
    static void reset();

    static const char *signal_name(int signal);

private:
    static void handle_signal(int signal);

    static std::atomic<int> received_signal_;
};

}  // namespace runtime
}  // namespace cloudmock
