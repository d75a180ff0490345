#include "storage/StateStore.h"
#include "core/Errors.h"
#include "utils/Logger.h"

StateStore::StateStore(fs::path stateFile) : file(std::move(stateFile)) {}

PersistedState StateStore::load() const {
    std::optional<std::string> raw = file.read();
    if (!raw) {
        return PersistedState{};
    }

    const std::string context = "Failed to parse state file JSON (" + file.path().u8string() + "): ";
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::exception& e) {
        throw SupervisorError::protocol(context + e.what());
    }
    if (!j.is_object()) {
        throw SupervisorError::protocol(context + "expected an object");
    }

    try {
        return PersistedState::fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw SupervisorError::protocol(context + e.what());
    } catch (const SupervisorError& e) {
        throw SupervisorError::protocol(context + e.what());
    }
}

void StateStore::save(const PersistedState& state) {
    std::string raw;
    try {
        raw = state.toJson().dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw SupervisorError::protocol(std::string("Failed to serialize state: ") + e.what());
    }

    file.write(raw);
    Logger::getInstance().debug("Saved state (" + std::to_string(state.workspaces.size()) + " workspaces, " +
                                std::to_string(state.threads.size()) + " threads) to " + file.path().u8string());
}
