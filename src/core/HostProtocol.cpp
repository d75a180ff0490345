#include "core/HostProtocol.h"
#include <vector>
#include "core/Errors.h"
#include "utils/Logger.h"

namespace {
std::string requireString(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args.at(key).is_string()) {
        throw SupervisorError::invalidInput(std::string("missing string argument '") + key + "'");
    }
    return args.at(key).get<std::string>();
}

TranscriptEvent eventFromArgs(const nlohmann::json& args) {
    TranscriptEvent evt;
    evt.ts = requireString(args, "ts");
    evt.threadId = requireString(args, "threadId");
    evt.direction = requireString(args, "direction");
    evt.payload = args.contains("payload") ? args.at("payload") : nlohmann::json();
    return evt;
}
} // namespace

HostProtocol::HostProtocol(Supervisor& supervisor) : supervisor(supervisor) {}

nlohmann::json HostProtocol::dispatch(const std::string& cmd, const nlohmann::json& args) {
    if (cmd == "ensureWorkspaceServer") {
        bool yolo = args.contains("yolo") && args.at("yolo").is_boolean() && args.at("yolo").get<bool>();
        std::string url = supervisor.ensureWorkspaceServer(requireString(args, "workspaceId"),
                                                           requireString(args, "workspacePath"), yolo);
        return {{"url", url}};
    }
    if (cmd == "stopWorkspaceServer") {
        supervisor.stopWorkspaceServer(requireString(args, "workspaceId"));
        return nullptr;
    }
    if (cmd == "stopAllServers") {
        supervisor.stopAllServers();
        return nullptr;
    }
    if (cmd == "loadState") {
        return supervisor.loadState().toJson();
    }
    if (cmd == "saveState") {
        if (!args.contains("state") || !args.at("state").is_object()) {
            throw SupervisorError::invalidInput("missing object argument 'state'");
        }
        supervisor.saveState(PersistedState::fromJson(args.at("state")));
        return nullptr;
    }
    if (cmd == "readTranscript") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& evt : supervisor.readTranscript(requireString(args, "threadId"))) {
            out.push_back(evt.toJson());
        }
        return out;
    }
    if (cmd == "appendTranscriptEvent") {
        supervisor.appendTranscriptEvent(eventFromArgs(args));
        return nullptr;
    }
    if (cmd == "appendTranscriptBatch") {
        if (!args.contains("events") || !args.at("events").is_array()) {
            throw SupervisorError::invalidInput("missing array argument 'events'");
        }
        // Every element is converted before anything is written.
        std::vector<TranscriptEvent> events;
        for (const auto& item : args.at("events")) {
            events.push_back(eventFromArgs(item));
        }
        supervisor.appendTranscriptBatch(events);
        return nullptr;
    }
    if (cmd == "deleteTranscript") {
        supervisor.deleteTranscript(requireString(args, "threadId"));
        return nullptr;
    }
    throw SupervisorError::invalidInput("unknown command: " + cmd);
}

nlohmann::json HostProtocol::errorResponse(const nlohmann::json& id, ErrorKind kind, const std::string& message) {
    return {{"id", id}, {"ok", false}, {"error", {{"kind", errorKindName(kind)}, {"message", message}}}};
}

nlohmann::json HostProtocol::handleLine(const std::string& line) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return errorResponse(nullptr, ErrorKind::InvalidInput, std::string("Invalid input: malformed request: ") + e.what());
    }

    nlohmann::json id = request.is_object() && request.contains("id") ? request.at("id") : nlohmann::json();
    if (!request.is_object() || !request.contains("cmd") || !request.at("cmd").is_string()) {
        return errorResponse(id, ErrorKind::InvalidInput, "Invalid input: request needs a string 'cmd'");
    }

    try {
        nlohmann::json args = request.value("args", nlohmann::json::object());
        if (!args.is_object()) {
            return errorResponse(id, ErrorKind::InvalidInput, "Invalid input: 'args' must be an object");
        }
        nlohmann::json result = dispatch(request.at("cmd").get<std::string>(), args);
        return {{"id", id}, {"ok", true}, {"result", result}};
    } catch (const SupervisorError& e) {
        return errorResponse(id, e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(id, ErrorKind::InvalidInput, std::string("Invalid input: ") + e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Request failed: ") + e.what());
        return errorResponse(id, ErrorKind::Process, std::string("Process error: ") + e.what());
    }
}
