#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct WorkspaceRecord {
    std::string id;
    std::string name;
    std::string path;
    std::string createdAt;
    std::string lastOpenedAt;
    std::optional<std::string> defaultProvider;
    std::optional<std::string> defaultModel;
    bool defaultEnableMcp = false;
    bool yolo = false;

    nlohmann::json toJson() const;
    static WorkspaceRecord fromJson(const nlohmann::json& j);

    bool operator==(const WorkspaceRecord& other) const;
};

struct ThreadRecord {
    std::string id;
    std::string workspaceId;
    std::string title;
    std::string createdAt;
    std::string lastMessageAt;
    std::string status;

    nlohmann::json toJson() const;
    static ThreadRecord fromJson(const nlohmann::json& j);

    bool operator==(const ThreadRecord& other) const;
};

/**
 * @brief The whole application state document (state.json).
 *
 * Always read and written as a unit. A missing or zero version is a
 * pre-versioning document and loads as version 1.
 */
struct PersistedState {
    static constexpr unsigned kCurrentVersion = 1;

    unsigned version = kCurrentVersion;
    std::vector<WorkspaceRecord> workspaces;
    std::vector<ThreadRecord> threads;

    nlohmann::json toJson() const;
    /// Throws nlohmann::json::exception on a malformed document and
    /// SupervisorError (Protocol) on a version that is not a non-negative integer.
    static PersistedState fromJson(const nlohmann::json& j);

    bool operator==(const PersistedState& other) const;
};
