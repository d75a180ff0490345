#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

class HandshakeReader;

struct LaunchCommand {
    std::string program;
    std::vector<std::string> args;
    std::string workingDir;                     // empty: inherit
    std::map<std::string, std::string> env;     // added on top of the parent environment

    std::string describe() const;
};

/**
 * @brief Owning handle to one spawned child process.
 *
 * stdin is bound to /dev/null, stdout and stderr are captured on pipes that
 * are handed to a HandshakeReader. The handle is the only releaser of the
 * OS process: destruction terminates a still-running child through
 * GracefulShutdown, stops the readers and closes the pipes.
 */
class ChildProcess {
public:
    /**
     * @brief fork/exec the command.
     * @param label tag used for the diagnostic log lines of this process
     * @throws SupervisorError (Process) when pipes, fork or exec fail
     */
    static std::unique_ptr<ChildProcess> spawn(const LaunchCommand& command, const std::string& label);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return childPid; }
    const std::string& label() const { return processLabel; }

    /**
     * @brief Non-blocking reap.
     * @return exit status once the process has exited, std::nullopt while running
     * @throws SupervisorError (Process) when the status check itself fails
     */
    std::optional<int> tryWait();

    bool hasExited();

    /// Blocks until the process is reaped. Returns the exit status.
    int wait();

    /// No-op (returns false) once the process has been reaped.
    bool signal(int sig);

    HandshakeReader& output() { return *reader; }

private:
    ChildProcess(pid_t pid, int stdoutFd, int stderrFd, std::string label);

    void recordStatus(int status);
    void closeDescriptors();

    pid_t childPid = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
    std::string processLabel;
    std::optional<int> exitStatus;
    std::unique_ptr<HandshakeReader> reader;
};
