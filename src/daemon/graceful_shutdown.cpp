#include "daemon/graceful_shutdown.h"

#include <cstdio>
#include <cstring>

namespace GracefulShutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

bool installSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);

    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            return false;
        }
    }

    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    return sigaction(SIGPIPE, &ignore, nullptr) == 0;
}

void Controller::stop(const char* message) {
    if (logCallback_) {
        logCallback_(message);
    }
    if (stopCallback_) {
        stopCallback_();
    }
    running_ = false;
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;

    if (signalState_->shutdown) {
        signalState_->shutdown = 0;
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        lastAction_ = Action::SHUTDOWN;
        reloadRequested_ = false;

        char buf[64];
        snprintf(buf, sizeof(buf), "Received signal %d, shutting down", lastSignal_);
        stop(buf);
        return true;
    }

    if (signalState_->reload) {
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        lastAction_ = Action::RELOAD;
        reloadRequested_ = true;

        char buf[80];
        snprintf(buf, sizeof(buf), "Received SIGHUP (signal %d), reloading configuration",
                 lastSignal_);
        stop(buf);
        return true;
    }

    return false;
}

}  // namespace GracefulShutdown
