#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "core/Supervisor.h"

/**
 * @brief Line-delimited JSON request handling for the host process.
 *
 * A request is {"id": any, "cmd": string, "args": object}. The reply echoes
 * the id with either {"ok": true, "result": ...} or
 * {"ok": false, "error": {"kind": ..., "message": ...}}.
 * Requests are independent; the class holds no state beyond the Supervisor.
 */
class HostProtocol {
public:
    explicit HostProtocol(Supervisor& supervisor);

    /// Handles one request line. Never throws; every failure becomes an error reply.
    nlohmann::json handleLine(const std::string& line);

    /**
     * @brief Runs a single command against the Supervisor.
     * @return the command's result, null for commands without one
     * @throws SupervisorError InvalidInput for an unknown command or bad args,
     *         or whatever the Supervisor operation raises
     */
    nlohmann::json dispatch(const std::string& cmd, const nlohmann::json& args);

    static nlohmann::json errorResponse(const nlohmann::json& id, ErrorKind kind, const std::string& message);

private:
    Supervisor& supervisor;
};
