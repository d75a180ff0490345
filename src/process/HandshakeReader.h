#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <string>
#include <thread>

/// First stdout line of a workspace server. Only url is consumed.
struct HandshakeMessage {
    std::string type;
    std::string url;
    int port = 0;
    std::string cwd;
};

/**
 * @brief Startup handshake over a child's output pipes.
 *
 * The stdout reader delivers the first line through a one-shot
 * promise/future and keeps draining stdout afterwards so the child never
 * stalls on a full pipe. The stderr reader logs every line. Both readers
 * poll with a short interval so stop() returns even when a grandchild still
 * holds the write end of a pipe.
 *
 * The descriptors are borrowed; the owner must call stop() before closing them.
 */
class HandshakeReader {
public:
    /// Longest line handed on; longer output without a newline is split.
    static constexpr std::size_t kMaxLineBytes = 64 * 1024;

    HandshakeReader(int stdoutFd, int stderrFd, std::string label);
    ~HandshakeReader();

    HandshakeReader(const HandshakeReader&) = delete;
    HandshakeReader& operator=(const HandshakeReader&) = delete;

    /**
     * @brief Waits for the first stdout line. Callable once.
     * @throws SupervisorError StartupTimeout when the timeout elapses,
     *         Process when stdout closes before a line arrives
     */
    std::string awaitFirstLine(std::chrono::milliseconds timeout);

    /// Stops and joins both readers. Idempotent.
    void stop();

    /**
     * @brief Parses a handshake line.
     * @throws SupervisorError (Protocol) unless the line is a JSON object with a string url
     */
    static HandshakeMessage parseHandshake(const std::string& line);

private:
    void stdoutLoop();
    void stderrLoop();

    // Runs until EOF, a read error or stop(). Complete lines go to onLine,
    // an unterminated tail is left in pending until it reaches kMaxLineBytes.
    template <typename OnLine>
    void pumpLines(int fd, std::string& pending, OnLine&& onLine);

    int stdoutFd;
    int stderrFd;
    std::string label;
    std::atomic<bool> stopRequested{false};
    std::promise<std::string> firstLinePromise;
    std::future<std::string> firstLineFuture;
    bool firstLineDelivered = false;  // touched by the stdout thread only
    std::thread stdoutThread;
    std::thread stderrThread;
};
