#include <utility>

#include "libsighandler.hpp"

std::atomic_bool SignalHandler::kUnderSignal;

void SignalHandler::signalHandler(int /*signum*/) { kUnderSignal = true; }

std::jthread SignalHandler::watch(std::function<void()> onSignal,
                                  std::chrono::milliseconds interval) {
    return std::jthread([onSignal = std::move(onSignal),
                         interval](const std::stop_token& token) {
        while (!token.stop_requested()) {
            if (isSignaled()) {
                onSignal();
                return;
            }
            std::this_thread::sleep_for(interval);
        }
    });
}
