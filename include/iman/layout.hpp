#pragma once

#include <optional>
#include <string>
#include "iman/models.hpp"

namespace iman {

// On-disk layout under the data directory:
//   games/<name>            installed game (or games/<name>@<repository> on a name clash)
//   games/<dir>/.iman-repository   owner of that directory
//   repositories/<repo>.index      cached index documents (XML or JSON)
//   icons/<repo>_<name><ext>       cached game icons
//   tmp/                           downloads and staging
class GameLayout {
public:
    static constexpr const char* kOwnerMarker = ".iman-repository";

    explicit GameLayout(std::string dataPath);

    const std::string& dataPath() const { return dataPath_; }
    const std::string& gamesRoot() const { return gamesRoot_; }
    const std::string& tempDir() const { return tempDir_; }
    const std::string& iconsDir() const { return iconsDir_; }
    const std::string& repositoriesDir() const { return repositoriesDir_; }
    std::string logPath() const;

    // Directory of the installed copy of this game, if any.
    std::optional<std::string> installDirectory(const Game& game) const;
    // Where a fresh install of this game goes.
    std::string targetDirectory(const Game& game) const;
    bool isInstalled(const Game& game) const { return installDirectory(game).has_value(); }

    std::string iconPath(const Game& game) const;
    std::string indexCachePath(const std::string& repositoryName) const;

    // Repository recorded in dir/.iman-repository; empty when unmarked.
    static std::string readOwner(const std::string& dir);
    static bool writeOwner(const std::string& dir, const std::string& repositoryName, std::string& err);

private:
    std::string plainDirectory(const Game& game) const;
    std::string qualifiedDirectory(const Game& game) const;

    std::string dataPath_;
    std::string gamesRoot_;
    std::string tempDir_;
    std::string iconsDir_;
    std::string repositoriesDir_;
};

} // namespace iman
