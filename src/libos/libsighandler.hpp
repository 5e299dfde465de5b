#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

// Turns SIGINT/SIGTERM into a flag that normal threads can poll.
class SignalHandler {
   public:
    /**
     * @brief Installs the handler for SIGINT and SIGTERM.
     *
     * The handler only sets a flag. Call uninstall() to restore the
     * default dispositions.
     */
    static void install();
    static void uninstall();

    static bool isSignaled() { return kUnderSignal.load(); }

    /**
     * @brief Starts a thread that invokes onSignal once a signal arrived.
     *
     * The thread polls the flag every interval and ends when onSignal ran
     * or when the returned jthread is stopped (on destruction).
     */
    static std::jthread watch(
        std::function<void()> onSignal,
        std::chrono::milliseconds interval = std::chrono::milliseconds(100));

   private:
    static std::atomic_bool kUnderSignal;
    static void signalHandler(int /*signum*/);
};
