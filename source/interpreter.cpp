#include "iman/interpreter.hpp"
#include "iman/config.hpp"
#include "iman/filesystem.hpp"
#include "iman/logger.hpp"
#include "iman/process.hpp"
#include "iman/util.hpp"
#include <cstdlib>

namespace iman {

namespace {

constexpr int kCheckTimeoutSec = 10;

} // namespace

std::vector<std::string> defaultCandidatePaths() {
#ifdef __APPLE__
    return {
        "/Applications/Instead.app/Contents/MacOS/sdl-instead",
        "/usr/local/bin/sdl-instead",
        "/opt/homebrew/bin/sdl-instead",
    };
#else
    return {
        "/usr/local/bin/sdl-instead",
        "/usr/bin/sdl-instead",
        "/usr/games/sdl-instead",
        "/usr/local/games/sdl-instead",
        "/app/bin/sdl-instead",
    };
#endif
}

std::vector<std::string> defaultBinaryNames() {
    return {"sdl-instead", "instead"};
}

InterpreterLocator::InterpreterLocator(std::string appDir,
                                       std::vector<std::string> candidates,
                                       std::optional<std::string> pathEnv,
                                       std::vector<std::string> binaryNames)
    : appDir_(std::move(appDir)), candidates_(std::move(candidates)), binaryNames_(std::move(binaryNames)) {
    if (pathEnv) {
        pathEnv_ = *pathEnv;
    } else if (const char* p = std::getenv("PATH")) {
        pathEnv_ = p;
    }
}

std::optional<std::string> InterpreterLocator::find() const {
    for (const auto& c : candidates_) {
        if (isRegularFile(c)) {
            logDebug("Interpreter candidate found: " + c, "INTERP");
            return c;
        }
    }
    const auto dirs = util::splitList(pathEnv_, ':');
    for (const auto& name : binaryNames_) {
        for (const auto& dir : dirs) {
            std::string path = dir + "/" + name;
            if (isRegularFile(path)) {
                logDebug("Interpreter found on PATH: " + path, "INTERP");
                return path;
            }
        }
    }
    return std::nullopt;
}

bool InterpreterLocator::check(const std::string& command, std::string& outVersion, ErrorInfo& outError) const {
    outVersion.clear();
    outError = ErrorInfo{};
    const std::string expanded = expandInterpreterCommand(command, appDir_);
    ProcessOutput out;
    std::string err;
    if (!runCapture({expanded, "-version"}, kCheckTimeoutSec, out, err)) {
        outError = makeError(ErrorCategory::Subprocess, ErrorCode::SpawnFailed, err, checkFailureMessage(command));
        return false;
    }
    if (out.exitCode != 0) {
        outError = makeError(ErrorCategory::Subprocess, ErrorCode::NonZeroExit,
                             expanded + " -version exited with status " + std::to_string(out.exitCode),
                             checkFailureMessage(command));
        return false;
    }
    std::string version;
    version.reserve(out.stdoutText.size());
    for (char c : out.stdoutText) {
        if (c != '\n' && c != '\r') version.push_back(c);
    }
    outVersion = util::trim(version);
    logInfo("Interpreter " + expanded + " reports version " + outVersion, "INTERP");
    return true;
}

bool InterpreterLocator::hasBuiltin() const {
    return !appDir_.empty() && isRegularFile(appDir_ + "/" + kBuiltinRelativePath);
}

std::string InterpreterLocator::findBuiltin() const {
    if (!hasBuiltin()) return {};
    return appDir_ + "/" + kBuiltinRelativePath;
}

bool InterpreterLocator::isBuiltin(const std::string& command) const {
    if (command.empty() || appDir_.empty()) return false;
    return expandInterpreterCommand(command, appDir_) == appDir_ + "/" + kBuiltinRelativePath;
}

std::string InterpreterLocator::checkFailureMessage(const std::string& command) const {
    return isBuiltin(command) ? "INSTEAD built-in check failed!" : "INSTEAD check failed!";
}

std::optional<InterpreterCandidate> InterpreterLocator::locate(bool verify) const {
    auto path = find();
    if (!path) return std::nullopt;
    InterpreterCandidate c;
    c.commandPath = *path;
    if (verify) {
        std::string version;
        ErrorInfo err;
        if (check(*path, version, err)) c.verifiedVersion = version;
        else logWarn("Interpreter " + *path + " failed verification: " + err.detail, "INTERP");
    }
    return c;
}

} // namespace iman
