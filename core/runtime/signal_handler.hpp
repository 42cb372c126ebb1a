#pragma once

#include <atomic>

namespace modewarden {
namespace runtime {

// SIGINT/SIGTERM latch polled by the runtime main loop
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Signal number that tripped the latch (0 = none)
    static int last_signal();
    static const char *signal_name(int signal);

    // Clears the latch (tests only)
    static void reset();

private:
    static void handle_signal(int signal);

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace modewarden
