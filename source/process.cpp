#include "iman/process.hpp"
#include "iman/logger.hpp"
#include "iman/raii.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace iman {

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

// Child side: report errno to the parent and leave without running atexit handlers.
[[noreturn]] void childFail(int fd) {
    int e = errno;
    ssize_t ignored = ::write(fd, &e, sizeof(e));
    (void)ignored;
    _exit(127);
}

void redirectStdinToNull() {
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
        if (devNull != STDIN_FILENO) ::close(devNull);
    }
}

// Blocks until the write end is closed (exec succeeded) or an errno arrives.
int readExecErrno(const UniqueFd& fd) {
    int childErrno = 0;
    for (;;) {
        ssize_t n = ::read(fd.fd, &childErrno, sizeof(childErrno));
        if (n < 0 && errno == EINTR) continue;
        return n == static_cast<ssize_t>(sizeof(childErrno)) ? childErrno : 0;
    }
}

pid_t waitChild(pid_t pid, int& status) {
    for (;;) {
        pid_t r = ::waitpid(pid, &status, 0);
        if (r < 0 && errno == EINTR) continue;
        return r;
    }
}

} // namespace

bool runCapture(const std::vector<std::string>& argv, int timeoutSec, ProcessOutput& out, std::string& err) {
    out = ProcessOutput{};
    if (argv.empty() || argv.front().empty()) {
        err = "Spawn failed: empty command";
        return false;
    }
    Pipe outPipe, execPipe;
    if (!outPipe.open() || !execPipe.open()) {
        err = std::string("Spawn failed: pipe: ") + std::strerror(errno);
        return false;
    }
    auto cargv = makeArgv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("Spawn failed: fork: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        redirectStdinToNull();
        if (::dup2(outPipe.writeEnd.fd, STDOUT_FILENO) < 0) childFail(execPipe.writeEnd.fd);
        ::execvp(cargv[0], cargv.data());
        childFail(execPipe.writeEnd.fd);
    }

    outPipe.writeEnd.reset();
    execPipe.writeEnd.reset();
    if (int childErrno = readExecErrno(execPipe.readEnd)) {
        int status = 0;
        waitChild(pid, status);
        err = "Spawn failed: " + argv.front() + ": " + std::strerror(childErrno);
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSec > 0 ? timeoutSec : 10);
    char buf[4096];
    bool timedOut = false;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd{outPipe.readEnd.fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) {
            timedOut = true;
            break;
        }
        ssize_t n = ::read(outPipe.readEnd.fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        out.stdoutText.append(buf, static_cast<size_t>(n));
    }

    if (timedOut) ::kill(pid, SIGKILL);
    int status = 0;
    if (waitChild(pid, status) < 0) {
        err = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }
    if (timedOut) {
        err = "Subprocess timed out: " + argv.front();
        return false;
    }
    out.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return true;
}

bool spawnDetached(const std::vector<std::string>& argv, const std::string& workDir, std::string& err) {
    if (argv.empty() || argv.front().empty()) {
        err = "Spawn failed: empty command";
        return false;
    }
    Pipe execPipe;
    if (!execPipe.open()) {
        err = std::string("Spawn failed: pipe: ") + std::strerror(errno);
        return false;
    }
    auto cargv = makeArgv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("Spawn failed: fork: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild < 0) childFail(execPipe.writeEnd.fd);
        if (grandchild > 0) _exit(0);
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) childFail(execPipe.writeEnd.fd);
        redirectStdinToNull();
        ::execvp(cargv[0], cargv.data());
        childFail(execPipe.writeEnd.fd);
    }

    execPipe.writeEnd.reset();
    int status = 0;
    waitChild(pid, status);
    if (int childErrno = readExecErrno(execPipe.readEnd)) {
        err = "Spawn failed: " + argv.front() + ": " + std::strerror(childErrno);
        return false;
    }
    logDebug("Spawned detached: " + argv.front(), "PROC");
    return true;
}

} // namespace iman
