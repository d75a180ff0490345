#pragma once
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "server/ServerRegistry.h"
#include "storage/AppPaths.h"
#include "storage/StateStore.h"
#include "storage/TranscriptLog.h"

/**
 * @brief The operations offered to the UI layer.
 *
 * Every failure is a SupervisorError whose what() is shown to the user.
 * Destruction stops every workspace server.
 */
class Supervisor {
public:
    explicit Supervisor(const Config& config);
    Supervisor(const AppPaths& paths, ServerLauncher launcher, RegistryOptions options);

    std::string ensureWorkspaceServer(const std::string& workspaceId, const std::string& workspacePath,
                                      bool unrestricted);
    void stopWorkspaceServer(const std::string& workspaceId);
    void stopAllServers();

    PersistedState loadState() const;
    void saveState(const PersistedState& state);

    std::vector<TranscriptEvent> readTranscript(const std::string& threadId) const;
    void appendTranscriptEvent(const TranscriptEvent& event);
    void appendTranscriptBatch(const std::vector<TranscriptEvent>& events);
    void deleteTranscript(const std::string& threadId);

    const AppPaths& paths() const { return appPaths; }
    ServerRegistry& registry() { return servers; }

private:
    AppPaths appPaths;
    StateStore stateStore;
    TranscriptLog transcripts;
    ServerRegistry servers;
};

RegistryOptions registryOptionsFrom(const Config::Server& server);
