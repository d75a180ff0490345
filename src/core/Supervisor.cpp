#include "core/Supervisor.h"
#include "core/Errors.h"
#include "utils/Logger.h"

RegistryOptions registryOptionsFrom(const Config::Server& server) {
    RegistryOptions options;
    options.startupTimeout = std::chrono::milliseconds(server.startupTimeoutMs);
    options.shutdown.gracePeriod = std::chrono::milliseconds(server.shutdownGraceMs);
    options.shutdown.pollInterval = std::chrono::milliseconds(server.shutdownPollMs);
    return options;
}

Supervisor::Supervisor(const Config& config)
    : Supervisor(AppPaths(fs::u8path(config.storage.dataDir)), ServerLauncher(config.server),
                 registryOptionsFrom(config.server)) {}

Supervisor::Supervisor(const AppPaths& paths, ServerLauncher launcher, RegistryOptions options)
    : appPaths(paths),
      stateStore(paths.stateFile()),
      transcripts(paths.transcriptsDir()),
      servers(std::move(launcher), options) {}

std::string Supervisor::ensureWorkspaceServer(const std::string& workspaceId, const std::string& workspacePath,
                                              bool unrestricted) {
    std::string url = servers.ensureRunning(workspaceId, workspacePath, unrestricted);

    // Ensure app data dirs exist early.
    try {
        appPaths.ensureDirectories();
    } catch (const SupervisorError& e) {
        Logger::getInstance().warn(e.what());
    }
    return url;
}

void Supervisor::stopWorkspaceServer(const std::string& workspaceId) {
    servers.stop(workspaceId);
}

void Supervisor::stopAllServers() {
    servers.stopAll();
}

PersistedState Supervisor::loadState() const {
    return stateStore.load();
}

void Supervisor::saveState(const PersistedState& state) {
    stateStore.save(state);
}

std::vector<TranscriptEvent> Supervisor::readTranscript(const std::string& threadId) const {
    return transcripts.read(threadId);
}

void Supervisor::appendTranscriptEvent(const TranscriptEvent& event) {
    transcripts.appendOne(event);
}

void Supervisor::appendTranscriptBatch(const std::vector<TranscriptEvent>& events) {
    transcripts.appendBatch(events);
}

void Supervisor::deleteTranscript(const std::string& threadId) {
    transcripts.remove(threadId);
}
