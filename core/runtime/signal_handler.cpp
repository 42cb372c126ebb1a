#include "signal_handler.hpp"

#include <csignal>

namespace modewarden {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

int SignalHandler::last_signal() { return last_signal_.load(); }

const char *SignalHandler::signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "none";
    }
}

void SignalHandler::reset() {
    last_signal_.store(0);
    shutdown_requested_.store(false);
}

void SignalHandler::handle_signal(int signal) {
    // Lock-free atomics only
    last_signal_.store(signal);
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace modewarden
