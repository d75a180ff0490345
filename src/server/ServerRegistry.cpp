#include "server/ServerRegistry.h"
#include "core/Errors.h"
#include "process/HandshakeReader.h"
#include "utils/IdValidator.h"
#include "utils/Logger.h"

ServerRegistry::ServerRegistry(ServerLauncher launcher, RegistryOptions options)
    : launcher(std::move(launcher)), options(options) {}

ServerRegistry::~ServerRegistry() {
    stopAll();
}

std::string ServerRegistry::ensureRunning(const std::string& workspaceId, const std::string& workspacePath,
                                          bool unrestricted) {
    IdValidator::validateSafeId(workspaceId, "workspace_id");

    // Declared outside the locked scope so a dropped handle is destroyed unlocked.
    std::optional<WorkspaceServerHandle> stale;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(workspaceId);
        if (it != servers.end()) {
            bool exited = false;
            try {
                exited = it->second.process->hasExited();
            } catch (const SupervisorError&) {
                stale = std::move(it->second);
                servers.erase(it);
                throw;
            }
            if (!exited) {
                return it->second.url;
            }
            Logger::getInstance().warn("[cowork-server:" + workspaceId + "] exited without a stop request, restarting");
            stale = std::move(it->second);
            servers.erase(it);
        }
        // The lock is released here: the spawn and handshake below can take
        // up to the startup timeout.
    }
    stale.reset();

    IdValidator::validateWorkspacePath(workspacePath);

    WorkspaceServerHandle handle = startServer(workspaceId, workspacePath, unrestricted);

    // A concurrent call may have registered a server while this one was
    // starting. A live registered server wins and the fresh one is stopped, so
    // every caller gets the URL of the process that stays running.
    std::optional<WorkspaceServerHandle> surplus;
    std::string url;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(workspaceId);
        if (it == servers.end()) {
            url = handle.url;
            servers.emplace(workspaceId, std::move(handle));
        } else if (isAlive(it->second)) {
            url = it->second.url;
            surplus = std::move(handle);
        } else {
            url = handle.url;
            surplus = std::move(it->second);
            it->second = std::move(handle);
        }
    }

    if (surplus) {
        Logger::getInstance().warn("[cowork-server:" + workspaceId + "] concurrent start detected, stopping " +
                                   surplus->url + " and keeping " + url);
        shutdown(*surplus);
    }
    return url;
}

bool ServerRegistry::isAlive(WorkspaceServerHandle& handle) {
    try {
        return !handle.process->hasExited();
    } catch (const SupervisorError& e) {
        Logger::getInstance().warn("[cowork-server:" + handle.workspaceId + "] " + e.what());
        return false;
    }
}

ServerRegistry::WorkspaceServerHandle ServerRegistry::startServer(const std::string& workspaceId,
                                                                  const std::string& workspacePath,
                                                                  bool unrestricted) {
    LaunchCommand cmd = launcher.forWorkspace(workspacePath, unrestricted);
    std::string label = "cowork-server:" + workspaceId;

    std::unique_ptr<ChildProcess> process = ChildProcess::spawn(cmd, label);
    try {
        std::string line = process->output().awaitFirstLine(options.startupTimeout);
        HandshakeMessage msg = HandshakeReader::parseHandshake(line);
        Logger::getInstance().success("[" + label + "] listening on " + msg.url);
        return WorkspaceServerHandle{std::move(process), msg.url, workspaceId};
    } catch (const SupervisorError& e) {
        Logger::getInstance().error("[" + label + "] startup failed: " + e.what());
        if (e.kind() == ErrorKind::StartupTimeout) {
            forceTerminate(*process);
        } else {
            terminateGracefully(*process, options.shutdown);
        }
        throw;
    }
}

void ServerRegistry::shutdown(WorkspaceServerHandle& handle) {
    Logger::getInstance().info("[cowork-server:" + handle.workspaceId + "] stopping pid " +
                               std::to_string(handle.process->pid()));
    terminateGracefully(*handle.process, options.shutdown);
}

void ServerRegistry::stop(const std::string& workspaceId) {
    IdValidator::validateSafeId(workspaceId, "workspace_id");

    std::optional<WorkspaceServerHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(workspaceId);
        if (it == servers.end()) return;
        handle = std::move(it->second);
        servers.erase(it);
    }
    shutdown(*handle);
}

void ServerRegistry::stopAll() {
    std::unordered_map<std::string, WorkspaceServerHandle> drained;
    {
        std::lock_guard<std::mutex> lock(mtx);
        drained.swap(servers);
    }
    for (auto& [id, handle] : drained) {
        shutdown(handle);
    }
}

std::optional<std::string> ServerRegistry::urlFor(const std::string& workspaceId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(workspaceId);
    if (it == servers.end()) return std::nullopt;
    return it->second.url;
}

std::vector<std::string> ServerRegistry::workspaceIds() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> ids;
    ids.reserve(servers.size());
    for (const auto& [id, handle] : servers) {
        ids.push_back(id);
    }
    return ids;
}

size_t ServerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return servers.size();
}
