#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

/// One line of a thread transcript. payload is kept as an opaque JSON value.
struct TranscriptEvent {
    std::string ts;
    std::string threadId;
    std::string direction;  // "server" or "client"
    nlohmann::json payload;

    nlohmann::json toJson() const;
    static TranscriptEvent fromJson(const nlohmann::json& j);

    bool operator==(const TranscriptEvent& other) const;
};

/**
 * @brief Append-only JSON-lines transcript per thread.
 *
 * Files live at <dir>/<threadId>.jsonl and are never rewritten: events are
 * appended, or the whole file is deleted.
 */
class TranscriptLog {
public:
    explicit TranscriptLog(fs::path transcriptsDir);

    /**
     * @brief All events of a thread in append order; empty when no file exists.
     * @throws SupervisorError InvalidInput for a bad id, Protocol naming the
     *         1-based line number and file for an unparseable line, Io
     */
    std::vector<TranscriptEvent> read(const std::string& threadId) const;

    /// @throws SupervisorError InvalidInput for a bad id or direction, Io
    void appendOne(const TranscriptEvent& event);

    /**
     * @brief Appends events that may span many threads.
     *
     * Every event is validated before anything is written. Events are grouped
     * by thread and each thread file gets one open/write/close cycle, with
     * the events of that thread in the order they were given.
     */
    void appendBatch(const std::vector<TranscriptEvent>& events);

    /// Deletes the thread's file. A missing file is not an error.
    void remove(const std::string& threadId);

    fs::path pathFor(const std::string& threadId) const;

    /**
     * @brief Trims and lowercases; accepts only "server" and "client".
     * @throws SupervisorError (InvalidInput)
     */
    static std::string normalizeDirection(const std::string& direction);

private:
    static std::string encodeLine(const TranscriptEvent& event, const std::string& direction);
    void appendToFile(const fs::path& path, const std::string& buffer);

    fs::path dir;
};
