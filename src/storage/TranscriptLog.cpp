#include "storage/TranscriptLog.h"
#include "core/Errors.h"
#include "utils/IdValidator.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <unordered_map>

#include <fcntl.h>
#include <unistd.h>

namespace {
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

nlohmann::json TranscriptEvent::toJson() const {
    nlohmann::json j;
    j["ts"] = ts;
    j["threadId"] = threadId;
    j["direction"] = direction;
    j["payload"] = payload;
    return j;
}

TranscriptEvent TranscriptEvent::fromJson(const nlohmann::json& j) {
    TranscriptEvent e;
    e.ts = j.at("ts").get<std::string>();
    e.threadId = j.at("threadId").get<std::string>();
    e.direction = j.at("direction").get<std::string>();
    e.payload = j.contains("payload") ? j.at("payload") : nlohmann::json();
    return e;
}

bool TranscriptEvent::operator==(const TranscriptEvent& other) const {
    return ts == other.ts && threadId == other.threadId && direction == other.direction &&
           payload == other.payload;
}

TranscriptLog::TranscriptLog(fs::path transcriptsDir) : dir(std::move(transcriptsDir)) {}

fs::path TranscriptLog::pathFor(const std::string& threadId) const {
    IdValidator::validateSafeId(threadId, "thread_id");
    return dir / (threadId + ".jsonl");
}

std::string TranscriptLog::normalizeDirection(const std::string& direction) {
    std::string norm = trim(direction);
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm != "server" && norm != "client") {
        throw SupervisorError::invalidInput("direction must be 'server' or 'client'");
    }
    return norm;
}

std::string TranscriptLog::encodeLine(const TranscriptEvent& event, const std::string& direction) {
    TranscriptEvent normalized = event;
    normalized.direction = direction;
    try {
        return normalized.toJson().dump() + "\n";
    } catch (const nlohmann::json::exception& e) {
        throw SupervisorError::protocol(std::string("Failed to serialize transcript event: ") + e.what());
    }
}

std::vector<TranscriptEvent> TranscriptLog::read(const std::string& threadId) const {
    fs::path p = pathFor(threadId);

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        return {};
    }

    std::ifstream file(p, std::ios::binary);
    if (!file.is_open()) {
        throw SupervisorError::io("Failed to read transcript " + p.u8string());
    }

    std::vector<TranscriptEvent> out;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;
        try {
            out.push_back(TranscriptEvent::fromJson(nlohmann::json::parse(trimmed)));
        } catch (const nlohmann::json::exception& e) {
            throw SupervisorError::protocol("Failed to parse transcript line " + std::to_string(lineNo) + " (" +
                                            p.u8string() + "): " + e.what());
        }
    }
    if (file.bad()) {
        throw SupervisorError::io("Failed to read transcript " + p.u8string());
    }
    return out;
}

void TranscriptLog::appendOne(const TranscriptEvent& event) {
    fs::path p = pathFor(event.threadId);
    std::string line = encodeLine(event, normalizeDirection(event.direction));
    appendToFile(p, line);
}

void TranscriptLog::appendBatch(const std::vector<TranscriptEvent>& events) {
    if (events.empty()) return;

    // Validate and encode everything before the first write.
    std::vector<std::string> order;
    std::unordered_map<std::string, std::string> buffers;
    for (const auto& evt : events) {
        IdValidator::validateSafeId(evt.threadId, "thread_id");
        std::string line = encodeLine(evt, normalizeDirection(evt.direction));
        auto it = buffers.find(evt.threadId);
        if (it == buffers.end()) {
            order.push_back(evt.threadId);
            buffers.emplace(evt.threadId, std::move(line));
        } else {
            it->second += line;
        }
    }

    for (const auto& threadId : order) {
        appendToFile(pathFor(threadId), buffers[threadId]);
    }
}

void TranscriptLog::remove(const std::string& threadId) {
    fs::path p = pathFor(threadId);
    std::error_code ec;
    bool removed = fs::remove(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw SupervisorError::io("Failed to delete transcript " + p.u8string() + ": " + ec.message());
    }
    if (removed) {
        Logger::getInstance().debug("Deleted transcript " + p.u8string());
    }
}

void TranscriptLog::appendToFile(const fs::path& path, const std::string& buffer) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw SupervisorError::io("Failed to create " + dir.u8string() + ": " + ec.message());
    }

    // One O_APPEND write per call keeps concurrent appenders from interleaving lines.
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw SupervisorError::io("Failed to open transcript file " + path.u8string() + ": " +
                                  std::generic_category().message(errno));
    }

    const char* data = buffer.data();
    size_t remaining = buffer.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw SupervisorError::io("Failed to append transcript " + path.u8string() + ": " +
                                      std::generic_category().message(err));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        throw SupervisorError::io("Failed to close transcript " + path.u8string() + ": " +
                                  std::generic_category().message(errno));
    }
}
