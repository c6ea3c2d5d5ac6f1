#pragma once

#include <cstdio>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace iman {

// Owns a POSIX descriptor (pipe ends of spawned children).
struct UniqueFd {
    int fd{-1};

    UniqueFd() = default;
    explicit UniqueFd(int f) : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd(std::exchange(other.fd, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(std::exchange(other.fd, -1));
        return *this;
    }

    void reset(int newFd = -1) {
        if (fd >= 0) ::close(fd);
        fd = newFd;
    }

    explicit operator bool() const { return fd >= 0; }
};

// Both ends are close-on-exec; a child keeps only what it dup2()s.
struct Pipe {
    UniqueFd readEnd;
    UniqueFd writeEnd;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        readEnd.reset(fds[0]);
        writeEnd.reset(fds[1]);
        return true;
    }
};

// stdio handle for downloads and extracted entries.
struct UniqueFile {
    FILE* f{nullptr};

    explicit UniqueFile(FILE* file) : f(file) {}
    ~UniqueFile() {
        if (f) std::fclose(f);
    }

    UniqueFile(const UniqueFile&) = delete;
    UniqueFile& operator=(const UniqueFile&) = delete;

    // False when buffered data could not be flushed.
    bool close() {
        if (!f) return true;
        const bool ok = std::fclose(f) == 0;
        f = nullptr;
        return ok;
    }

    explicit operator bool() const { return f != nullptr; }
};

template <class F>
class ScopeGuard {
public:
    explicit ScopeGuard(F fn) : fn_(std::move(fn)) {}
    ~ScopeGuard() { fn_(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    F fn_;
};

template <class F>
ScopeGuard<F> make_scope_guard(F fn) {
    return ScopeGuard<F>(std::move(fn));
}

} // namespace iman
