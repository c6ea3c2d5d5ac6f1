#pragma once

#include <optional>
#include <string>
#include <vector>
#include "iman/catalog.hpp"
#include "iman/config.hpp"
#include "iman/errors.hpp"
#include "iman/http.hpp"
#include "iman/installer.hpp"
#include "iman/interpreter.hpp"
#include "iman/layout.hpp"
#include "iman/runner.hpp"
#include "iman/sync.hpp"

namespace iman {

// Front-end facing entry point: one configuration, one data directory.
class Manager {
public:
    Manager(Config cfg, std::string appDir, HttpGetFn fetch = httpGetStream,
            std::vector<std::string> interpreterCandidates = defaultCandidatePaths());

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    const Config& config() const { return cfg_; }
    Config& config() { return cfg_; }
    const GameLayout& layout() const { return layout_; }
    const InterpreterLocator& locator() const { return locator_; }

    // Publishes the new catalog when at least one repository succeeded.
    SyncResult updateRepositories();
    bool hasDownloadedRepositories() const;

    // Both fail with NotFound until repositories were synced at least once.
    bool sortedGames(std::vector<Game>& out, ErrorInfo& outError);
    bool sortedGamesByDateDesc(std::vector<Game>& out, ErrorInfo& outError);

    bool installGame(Game& game, const ProgressFn& onProgress, ErrorInfo& outError);
    bool removeGame(Game& game, ErrorInfo& outError);
    bool runGame(const Game& game, ErrorInfo& outError) const;
    std::optional<std::string> gameIconPath(const Game& game) const;

    std::optional<std::string> findInterpreter() const;
    bool checkInterpreter(const std::string& command, std::string& outVersion, ErrorInfo& outError) const;
    std::optional<std::string> interpreterCommand() const;

    const std::vector<Repository>& repositories() const { return cfg_.repositories; }
    std::vector<std::string> findLanguages(const std::vector<Game>& games) const;

private:
    bool gamesSnapshot(SortOrder order, std::vector<Game>& out, ErrorInfo& outError);

    Config cfg_;
    GameLayout layout_;
    InterpreterLocator locator_;
    HttpGetFn fetch_;
    CatalogStore store_;
    Installer installer_;
    GameRunner runner_;
};

} // namespace iman
