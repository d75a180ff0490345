#include "process/GracefulShutdown.h"
#include "process/ChildProcess.h"
#include "utils/Logger.h"
#include <exception>
#include <thread>

#include <signal.h>

namespace {
// Any status-check failure sends us straight to the forced phase.
bool exitedSafely(ChildProcess& child, bool& statusFailed) {
    try {
        return child.hasExited();
    } catch (const std::exception& e) {
        Logger::getInstance().warn("[" + child.label() + "] " + e.what());
        statusFailed = true;
        return false;
    }
}

void killAndReap(ChildProcess& child) {
    child.signal(SIGKILL);
    try {
        child.wait();
    } catch (const std::exception& e) {
        Logger::getInstance().error("[" + child.label() + "] failed to reap process: " + e.what());
    }
}
} // namespace

void terminateGracefully(ChildProcess& child, const ShutdownPolicy& policy) {
    bool statusFailed = false;
    if (exitedSafely(child, statusFailed)) return;

    if (!statusFailed && child.signal(SIGTERM)) {
        auto deadline = std::chrono::steady_clock::now() + policy.gracePeriod;
        while (std::chrono::steady_clock::now() < deadline) {
            if (exitedSafely(child, statusFailed)) {
                Logger::getInstance().debug("[" + child.label() + "] exited after SIGTERM (pid " +
                                            std::to_string(child.pid()) + ")");
                return;
            }
            if (statusFailed) break;
            std::this_thread::sleep_for(policy.pollInterval);
        }
    }

    if (!statusFailed && exitedSafely(child, statusFailed)) return;

    Logger::getInstance().warn("[" + child.label() + "] did not exit in time, sending SIGKILL to pid " +
                               std::to_string(child.pid()));
    killAndReap(child);
}

void forceTerminate(ChildProcess& child) {
    bool statusFailed = false;
    if (exitedSafely(child, statusFailed)) return;

    Logger::getInstance().warn("[" + child.label() + "] sending SIGKILL to pid " + std::to_string(child.pid()));
    killAndReap(child);
}
