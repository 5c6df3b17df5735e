#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace GracefulShutdown {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the daemon's main loop.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // Last signal number

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

// ========== Shutdown Controller ==========
// Turns pending signal flags into a stop of the command server.
// Testable without real signal delivery: point it at any SignalState.

class Controller {
   public:
    enum class Action { NONE, SHUTDOWN, RELOAD };

    using StopCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setStopCallback(StopCallback cb) {
        stopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Returns true if a signal was processed. Shutdown wins over a pending reload.
    bool processPendingSignals();

    bool isReloadRequested() const {
        return reloadRequested_.load();
    }
    void clearReloadRequest() {
        reloadRequested_ = false;
    }

    bool isRunning() const {
        return running_.load();
    }
    void setRunning(bool running) {
        running_ = running;
    }

    int getLastSignal() const {
        return lastSignal_;
    }
    Action getLastAction() const {
        return lastAction_;
    }

   private:
    void stop(const char* message);

    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};

    StopCallback stopCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    Action lastAction_ = Action::NONE;
};

// Async-signal-safe: only sets flags in the global state
void signalHandler(int sig);

SignalState& getGlobalSignalState();

// Installs signalHandler for SIGINT, SIGTERM and SIGHUP and ignores SIGPIPE.
// Returns false if sigaction fails.
bool installSignalHandlers();

}  // namespace GracefulShutdown
