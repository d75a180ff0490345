#pragma once
#include <chrono>

class ChildProcess;

struct ShutdownPolicy {
    std::chrono::milliseconds gracePeriod{3000};
    std::chrono::milliseconds pollInterval{100};
};

/**
 * @brief Two-phase termination: SIGTERM, poll for exit up to the grace
 * period, then SIGKILL and a blocking reap.
 *
 * Always returns. Calling it on a process that already exited (or was
 * already terminated) is a no-op. Failures are logged, never thrown.
 */
void terminateGracefully(ChildProcess& child, const ShutdownPolicy& policy = ShutdownPolicy{});

/// SIGKILL and a blocking reap, skipping the cooperative phase. Never throws.
void forceTerminate(ChildProcess& child);
