#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "process/ChildProcess.h"
#include "process/GracefulShutdown.h"
#include "server/ServerLauncher.h"

struct RegistryOptions {
    std::chrono::milliseconds startupTimeout{15000};
    ShutdownPolicy shutdown;
};

/**
 * @brief Workspace id -> live server process and its advertised URL.
 *
 * One mutex guards the whole map. It is held only to check/remove and to
 * insert; the spawn and handshake run unlocked so a slow server does not
 * block other workspaces. Two concurrent ensureRunning calls for the same
 * workspace can therefore both spawn. The first insert wins; the later
 * caller stops its own process and returns the registered URL. This is
 * acceptable for a single
 * interactive user; a multi-caller deployment needs a per-workspace spawn
 * lock instead.
 */
class ServerRegistry {
public:
    ServerRegistry(ServerLauncher launcher, RegistryOptions options = RegistryOptions{});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /**
     * @brief Returns the URL of the workspace server, starting it if needed.
     *
     * A live entry is reused. An entry whose process has exited is dropped
     * and a new server is spawned.
     *
     * @throws SupervisorError InvalidInput / NotFound for bad id or path,
     *         Process for spawn or status-check failures, StartupTimeout,
     *         Protocol for an unparseable handshake line
     */
    std::string ensureRunning(const std::string& workspaceId, const std::string& workspacePath, bool unrestricted);

    /// Stops and removes the workspace server. Unknown ids are a no-op.
    void stop(const std::string& workspaceId);

    /// Stops every registered server. Idempotent.
    void stopAll();

    std::optional<std::string> urlFor(const std::string& workspaceId) const;
    std::vector<std::string> workspaceIds() const;
    size_t size() const;

private:
    struct WorkspaceServerHandle {
        std::unique_ptr<ChildProcess> process;
        std::string url;
        std::string workspaceId;
    };

    WorkspaceServerHandle startServer(const std::string& workspaceId, const std::string& workspacePath,
                                      bool unrestricted);
    void shutdown(WorkspaceServerHandle& handle);
    static bool isAlive(WorkspaceServerHandle& handle);

    ServerLauncher launcher;
    RegistryOptions options;
    mutable std::mutex mtx;
    std::unordered_map<std::string, WorkspaceServerHandle> servers;
};
