#include "runner/graceful_stop.hpp"

#include <csignal>

namespace das_integrity {

namespace {

// Global token for signal handling
CancellationToken* g_token = nullptr;

void signal_handler(int) {
    if (g_token) {
        g_token->cancel();
    }
}

} // namespace

void install_signal_handlers(CancellationToken& token) {
    g_token = &token;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace das_integrity
