#include "storage/PersistedState.h"
#include "core/Errors.h"
#include <cstdint>
#include <limits>

namespace {
nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

unsigned versionFromJson(const nlohmann::json& v) {
    constexpr std::uint64_t kMax = std::numeric_limits<unsigned>::max();
    bool valid = false;
    if (v.is_number_unsigned()) {
        valid = v.get<std::uint64_t>() <= kMax;
    } else if (v.is_number_integer()) {
        std::int64_t n = v.get<std::int64_t>();
        valid = n >= 0 && static_cast<std::uint64_t>(n) <= kMax;
    }
    if (!valid) {
        throw SupervisorError::protocol("invalid state version " + v.dump() + ", expected a non-negative integer");
    }
    return static_cast<unsigned>(v.get<std::uint64_t>());
}

std::optional<std::string> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}
} // namespace

nlohmann::json WorkspaceRecord::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["path"] = path;
    j["createdAt"] = createdAt;
    j["lastOpenedAt"] = lastOpenedAt;
    j["defaultProvider"] = optionalToJson(defaultProvider);
    j["defaultModel"] = optionalToJson(defaultModel);
    j["defaultEnableMcp"] = defaultEnableMcp;
    j["yolo"] = yolo;
    return j;
}

WorkspaceRecord WorkspaceRecord::fromJson(const nlohmann::json& j) {
    WorkspaceRecord w;
    w.id = j.at("id").get<std::string>();
    w.name = j.at("name").get<std::string>();
    w.path = j.at("path").get<std::string>();
    w.createdAt = j.at("createdAt").get<std::string>();
    w.lastOpenedAt = j.at("lastOpenedAt").get<std::string>();
    w.defaultProvider = optionalFromJson(j, "defaultProvider");
    w.defaultModel = optionalFromJson(j, "defaultModel");
    w.defaultEnableMcp = j.at("defaultEnableMcp").get<bool>();
    w.yolo = j.at("yolo").get<bool>();
    return w;
}

bool WorkspaceRecord::operator==(const WorkspaceRecord& other) const {
    return id == other.id && name == other.name && path == other.path && createdAt == other.createdAt &&
           lastOpenedAt == other.lastOpenedAt && defaultProvider == other.defaultProvider &&
           defaultModel == other.defaultModel && defaultEnableMcp == other.defaultEnableMcp && yolo == other.yolo;
}

nlohmann::json ThreadRecord::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["workspaceId"] = workspaceId;
    j["title"] = title;
    j["createdAt"] = createdAt;
    j["lastMessageAt"] = lastMessageAt;
    j["status"] = status;
    return j;
}

ThreadRecord ThreadRecord::fromJson(const nlohmann::json& j) {
    ThreadRecord t;
    t.id = j.at("id").get<std::string>();
    t.workspaceId = j.at("workspaceId").get<std::string>();
    t.title = j.at("title").get<std::string>();
    t.createdAt = j.at("createdAt").get<std::string>();
    t.lastMessageAt = j.at("lastMessageAt").get<std::string>();
    t.status = j.at("status").get<std::string>();
    return t;
}

bool ThreadRecord::operator==(const ThreadRecord& other) const {
    return id == other.id && workspaceId == other.workspaceId && title == other.title &&
           createdAt == other.createdAt && lastMessageAt == other.lastMessageAt && status == other.status;
}

nlohmann::json PersistedState::toJson() const {
    nlohmann::json j;
    j["version"] = version;
    j["workspaces"] = nlohmann::json::array();
    for (const auto& w : workspaces) {
        j["workspaces"].push_back(w.toJson());
    }
    j["threads"] = nlohmann::json::array();
    for (const auto& t : threads) {
        j["threads"].push_back(t.toJson());
    }
    return j;
}

PersistedState PersistedState::fromJson(const nlohmann::json& j) {
    PersistedState state;
    state.version = 0;
    if (j.contains("version") && !j.at("version").is_null()) {
        state.version = versionFromJson(j.at("version"));
    }
    if (state.version == 0) {
        state.version = kCurrentVersion;
    }
    if (j.contains("workspaces")) {
        for (const auto& item : j.at("workspaces").get<std::vector<nlohmann::json>>()) {
            state.workspaces.push_back(WorkspaceRecord::fromJson(item));
        }
    }
    if (j.contains("threads")) {
        for (const auto& item : j.at("threads").get<std::vector<nlohmann::json>>()) {
            state.threads.push_back(ThreadRecord::fromJson(item));
        }
    }
    return state;
}

bool PersistedState::operator==(const PersistedState& other) const {
    return version == other.version && workspaces == other.workspaces && threads == other.threads;
}
