#pragma once

#include <optional>
#include <string>
#include <vector>
#include "iman/errors.hpp"
#include "iman/models.hpp"

namespace iman {

// Well-known install locations of the INSTEAD interpreter on this platform.
std::vector<std::string> defaultCandidatePaths();
// Names looked up along PATH after the fixed candidates.
std::vector<std::string> defaultBinaryNames();

class InterpreterLocator {
public:
    static constexpr const char* kBuiltinRelativePath = "instead/sdl-instead";

    explicit InterpreterLocator(std::string appDir,
                                std::vector<std::string> candidates = defaultCandidatePaths(),
                                std::optional<std::string> pathEnv = std::nullopt,
                                std::vector<std::string> binaryNames = defaultBinaryNames());

    // First existing file among the candidates, then the binary names on PATH.
    // Existence only; whether it runs is for check() to say.
    std::optional<std::string> find() const;

    // Runs "<command> -version"; the version is stdout with line breaks removed.
    bool check(const std::string& command, std::string& outVersion, ErrorInfo& outError) const;

    bool hasBuiltin() const;
    // Empty when no bundled interpreter is present.
    std::string findBuiltin() const;
    bool isBuiltin(const std::string& command) const;
    std::string checkFailureMessage(const std::string& command) const;

    // find() plus an optional check(); a failed check still returns the path without a version.
    std::optional<InterpreterCandidate> locate(bool verify) const;

    const std::string& appDir() const { return appDir_; }

private:
    std::string appDir_;
    std::vector<std::string> candidates_;
    std::string pathEnv_;
    std::vector<std::string> binaryNames_;
};

} // namespace iman
