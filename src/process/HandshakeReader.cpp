#include "process/HandshakeReader.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <exception>
#include <system_error>

#include <poll.h>
#include <unistd.h>

namespace {
constexpr int kPollIntervalMs = 50;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

HandshakeReader::HandshakeReader(int stdoutFd, int stderrFd, std::string label)
    : stdoutFd(stdoutFd), stderrFd(stderrFd), label(std::move(label)) {
    firstLineFuture = firstLinePromise.get_future();
    stdoutThread = std::thread(&HandshakeReader::stdoutLoop, this);
    try {
        stderrThread = std::thread(&HandshakeReader::stderrLoop, this);
    } catch (const std::system_error&) {
        stop();
        throw;
    }
}

HandshakeReader::~HandshakeReader() {
    stop();
}

void HandshakeReader::stop() {
    stopRequested = true;
    if (stdoutThread.joinable()) stdoutThread.join();
    if (stderrThread.joinable()) stderrThread.join();
}

std::string HandshakeReader::awaitFirstLine(std::chrono::milliseconds timeout) {
    if (!firstLineFuture.valid()) {
        throw SupervisorError::process("Server startup line was already consumed");
    }
    if (firstLineFuture.wait_for(timeout) != std::future_status::ready) {
        throw SupervisorError::startupTimeout(timeout);
    }
    return firstLineFuture.get();
}

template <typename OnLine>
void HandshakeReader::pumpLines(int fd, std::string& pending, OnLine&& onLine) {
    char buf[4096];
    while (!stopRequested) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return;
        }
        if (n == 0) return;  // pipe closed, the process is gone

        pending.append(buf, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            onLine(line);
        }
        // Unterminated output is cut into kMaxLineBytes pieces.
        while (pending.size() >= kMaxLineBytes) {
            onLine(pending.substr(0, kMaxLineBytes));
            pending.erase(0, kMaxLineBytes);
        }
    }
}

void HandshakeReader::stdoutLoop() {
    std::string pending;
    pumpLines(stdoutFd, pending, [this](const std::string& line) {
        if (!firstLineDelivered) {
            firstLineDelivered = true;
            firstLinePromise.set_value(line);
            return;
        }
        Logger::getInstance().debug("[" + label + "] stdout: " + line);
    });

    if (firstLineDelivered) return;
    firstLineDelivered = true;
    if (!pending.empty() && !stopRequested) {
        firstLinePromise.set_value(pending);
    } else {
        firstLinePromise.set_exception(std::make_exception_ptr(SupervisorError::process(
            "Failed to read server startup line: server stdout reader closed")));
    }
}

void HandshakeReader::stderrLoop() {
    std::string pending;
    pumpLines(stderrFd, pending, [this](const std::string& line) {
        Logger::getInstance().info("[" + label + "] " + line);
    });
    if (!pending.empty()) {
        Logger::getInstance().info("[" + label + "] " + pending);
    }
}

HandshakeMessage HandshakeReader::parseHandshake(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(trim(line));
    } catch (const nlohmann::json::parse_error& e) {
        throw SupervisorError::protocol(std::string("Failed to parse server startup JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw SupervisorError::protocol("Failed to parse server startup JSON: expected an object");
    }
    if (!j.contains("url") || !j["url"].is_string()) {
        throw SupervisorError::protocol("Failed to parse server startup JSON: missing string field 'url'");
    }

    HandshakeMessage msg;
    msg.url = j["url"].get<std::string>();
    if (j.contains("type") && j["type"].is_string()) {
        msg.type = j["type"].get<std::string>();
    }
    if (j.contains("port")) {
        const auto& port = j["port"];
        if (!port.is_number_integer() || port.get<long long>() < 0 || port.get<long long>() > 65535) {
            throw SupervisorError::protocol("Failed to parse server startup JSON: invalid port");
        }
        msg.port = port.get<int>();
    }
    if (j.contains("cwd") && j["cwd"].is_string()) {
        msg.cwd = j["cwd"].get<std::string>();
    }
    return msg;
}
