#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "iman/errors.hpp"

namespace iman {

// A configured source of games. Identity is the name.
struct Repository {
    std::string name;
    std::string url;
};

struct Game {
    std::string name;            // stable id, unique within one repository
    std::string title;
    std::string description;
    std::string version;
    std::vector<std::string> languages;
    std::string repositoryName;
    std::string descriptionUrl;
    std::string downloadUrl;
    std::string imageUrl;        // optional icon
    uint64_t sizeBytes{0};
    int64_t publishedAt{0};      // seconds since epoch, 0 when unknown
    bool installed{false};       // derived from the filesystem, never authoritative
};

inline bool sameGame(const Game& a, const Game& b) {
    return a.repositoryName == b.repositoryName && a.name == b.name;
}

// Immutable once published; readers hold a shared_ptr to one snapshot.
struct Catalog {
    std::vector<Game> games;
};

struct InterpreterCandidate {
    std::string commandPath;
    std::optional<std::string> verifiedVersion;
};

struct SyncError {
    std::string repository;
    ErrorInfo cause;
};

} // namespace iman
