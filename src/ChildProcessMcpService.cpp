#include "ChildProcessMcpService.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>
#include <trantor/utils/Logger.h>

namespace {

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        if (WEXITSTATUS(status) == 127) return "could not be executed";
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "was killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "ended with wait status " + std::to_string(status);
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    return status;
}

}

ChildProcessMcpService::ChildProcessMcpService(std::string executable, ServicePorts ports)
    : executable_(std::move(executable)), ports_(ports) {
}

ChildProcessMcpService::~ChildProcessMcpService() {
    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

void ChildProcessMcpService::start() {
    if (pid_ > 0) {
        throw std::logic_error("MCP service process is already running");
    }

    // Everything the child needs is built before fork()
    std::string http = std::to_string(ports_.httpPort);
    std::string ws = std::to_string(ports_.wsPort);
    std::vector<char*> argv{const_cast<char*>(executable_.c_str()),
                            const_cast<char*>("--http-port"), http.data(),
                            const_cast<char*>("--ws-port"), ws.data(),
                            nullptr};

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (child == 0) {
        // stdout becomes the readiness pipe; the host's stdin stays with the host
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        static const char msg[] = "MCP service: exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::close(fds[1]);
    std::string line;
    char c = 0;
    for (;;) {
        ssize_t n = ::read(fds[0], &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0 || c == '\n') break;
        line.push_back(c);
    }
    ::close(fds[0]);

    if (line.compare(0, 5, "READY") == 0) {
        pid_ = child;
        LOG_INFO << "MCP service process " << pid_ << " ready (" << line << ")";
        return;
    }

    // No readiness line: the child failed to bind or to exec
    ::kill(child, SIGKILL);
    int status = wait_for(child);
    throw std::runtime_error(executable_ + " " + describe_exit(status) + " before it was ready (HTTP port " + http +
                             ", WebSocket port " + ws + ")");
}

void ChildProcessMcpService::stop() {
    if (pid_ <= 0) {
        return;
    }
    pid_t child = pid_;
    pid_ = -1;
    if (::kill(child, SIGTERM) != 0 && errno != ESRCH) {
        throw std::system_error(errno, std::generic_category(), "kill");
    }
    int status = wait_for(child);
    bool clean = (WIFEXITED(status) && WEXITSTATUS(status) == 0) ||
                 (WIFSIGNALED(status) && WTERMSIG(status) == SIGTERM);
    if (!clean) {
        throw std::runtime_error("MCP service process " + describe_exit(status));
    }
    LOG_INFO << "MCP service process " << child << " stopped";
}

ServicePorts ChildProcessMcpService::ports() const {
    return ports_;
}

pid_t ChildProcessMcpService::pid() const {
    return pid_;
}
