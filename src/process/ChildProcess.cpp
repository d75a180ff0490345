#include "process/ChildProcess.h"
#include "process/GracefulShutdown.h"
#include "process/HandshakeReader.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <cerrno>
#include <initializer_list>
#include <system_error>

#include <fcntl.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace {
std::string errnoMessage(int err) {
    return std::generic_category().message(err);
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
        if (overrides.count(key)) continue;
        out.push_back(std::move(kv));
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> toCharPointers(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& v : values) {
        out.push_back(const_cast<char*>(v.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void closeAll(std::initializer_list<int> fds) {
    for (int fd : fds) {
        if (fd >= 0) ::close(fd);
    }
}
} // namespace

std::string LaunchCommand::describe() const {
    std::string out = program;
    for (const auto& arg : args) {
        out += " " + arg;
    }
    return out;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchCommand& command, const std::string& label) {
    if (command.program.empty()) {
        throw SupervisorError::process("Failed to spawn server process: empty command");
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argStorage;
    argStorage.push_back(command.program);
    argStorage.insert(argStorage.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv = toCharPointers(argStorage);
    std::vector<std::string> envStorage = buildEnvironment(command.env);
    std::vector<char*> envp = toCharPointers(envStorage);
    const char* workingDir = command.workingDir.empty() ? nullptr : command.workingDir.c_str();

    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull < 0) {
        throw SupervisorError::process("Failed to open /dev/null: " + errnoMessage(errno));
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll({devNull, outPipe[0], outPipe[1], errPipe[0], errPipe[1], statusPipe[0], statusPipe[1]});
        throw SupervisorError::process("Failed to capture server output: " + errnoMessage(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll({devNull, outPipe[0], outPipe[1], errPipe[0], errPipe[1], statusPipe[0], statusPipe[1]});
        throw SupervisorError::process("Failed to spawn server process: " + errnoMessage(err));
    }

    if (pid == 0) {
        ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        int err = 0;
        if (workingDir && ::chdir(workingDir) != 0) {
            err = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        // statusPipe[1] is close-on-exec: the parent reads EOF on success, errno on failure.
        auto ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeAll({devNull, outPipe[1], errPipe[1], statusPipe[1]});

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeAll({outPipe[0], errPipe[0]});
        throw SupervisorError::process("Failed to spawn server process: " + errnoMessage(childErr));
    }

    Logger::getInstance().info("[" + label + "] spawned pid " + std::to_string(pid) + ": " + command.describe());

    std::unique_ptr<ChildProcess> child(new ChildProcess(pid, outPipe[0], errPipe[0], label));
    // If the readers fail to start, the destructor still terminates and reaps the child.
    child->reader = std::make_unique<HandshakeReader>(child->stdoutFd, child->stderrFd, label);
    return child;
}

ChildProcess::ChildProcess(pid_t pid, int stdoutFd, int stderrFd, std::string label)
    : childPid(pid), stdoutFd(stdoutFd), stderrFd(stderrFd), processLabel(std::move(label)) {}

ChildProcess::~ChildProcess() {
    terminateGracefully(*this);
    if (reader) reader->stop();
    closeDescriptors();
}

void ChildProcess::closeDescriptors() {
    closeAll({stdoutFd, stderrFd});
    stdoutFd = -1;
    stderrFd = -1;
}

void ChildProcess::recordStatus(int status) {
    if (WIFEXITED(status)) {
        exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitStatus = 128 + WTERMSIG(status);
    } else {
        exitStatus = -1;
    }
}

std::optional<int> ChildProcess::tryWait() {
    if (exitStatus) return exitStatus;

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(childPid, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) return std::nullopt;
    if (rc < 0) {
        int err = errno;
        // ECHILD: nothing left to reap, so the pid must never be signalled again.
        if (err == ECHILD) exitStatus = -1;
        throw SupervisorError::process("Failed to check server process status: " + errnoMessage(err));
    }
    recordStatus(status);
    return exitStatus;
}

bool ChildProcess::hasExited() {
    return tryWait().has_value();
}

int ChildProcess::wait() {
    if (exitStatus) return *exitStatus;

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(childPid, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        int err = errno;
        if (err == ECHILD) {
            exitStatus = -1;
            return *exitStatus;
        }
        throw SupervisorError::process("Failed to wait for server process: " + errnoMessage(err));
    }
    recordStatus(status);
    return *exitStatus;
}

bool ChildProcess::signal(int sig) {
    if (exitStatus || childPid <= 0) return false;
    return ::kill(childPid, sig) == 0;
}
