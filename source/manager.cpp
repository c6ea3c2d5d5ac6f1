#include "iman/manager.hpp"
#include "iman/logger.hpp"

namespace iman {

Manager::Manager(Config cfg, std::string appDir, HttpGetFn fetch, std::vector<std::string> interpreterCandidates)
    : cfg_(std::move(cfg)),
      layout_(cfg_.dataPath.empty() ? defaultDataPath() : cfg_.dataPath),
      locator_(std::move(appDir), std::move(interpreterCandidates)),
      fetch_(std::move(fetch)),
      installer_(layout_, fetch_, cfg_.httpTimeoutSeconds),
      runner_(cfg_, locator_, layout_) {
    if (cfg_.dataPath.empty()) cfg_.dataPath = layout_.dataPath();
}

SyncResult Manager::updateRepositories() {
    SyncResult result = syncAll(cfg_.repositories, cfg_, fetch_);
    if (result.succeeded > 0 || cfg_.repositories.empty()) {
        store_.publish(result.catalog);
    } else {
        logWarn("All repositories failed; keeping the previous catalog", "MGR");
    }
    return result;
}

bool Manager::hasDownloadedRepositories() const {
    return store_.hasAnySyncedData() || hasCachedIndex(cfg_.repositories, layout_);
}

bool Manager::gamesSnapshot(SortOrder order, std::vector<Game>& out, ErrorInfo& outError) {
    auto snap = store_.snapshot();
    if (!snap) {
        snap = loadCachedCatalog(cfg_.repositories, layout_);
        if (snap) store_.publish(snap);
    }
    if (!snap) {
        outError = makeError(ErrorCategory::NotFound, ErrorCode::GameNotFound, "No repository data",
                             "Repositories have not been downloaded. Run \"update\" first.");
        return false;
    }
    out = sortGames(snap->games, order);
    refreshInstalled(out, layout_);
    return true;
}

bool Manager::sortedGames(std::vector<Game>& out, ErrorInfo& outError) {
    return gamesSnapshot(SortOrder::Title, out, outError);
}

bool Manager::sortedGamesByDateDesc(std::vector<Game>& out, ErrorInfo& outError) {
    return gamesSnapshot(SortOrder::PublishedAtDesc, out, outError);
}

bool Manager::installGame(Game& game, const ProgressFn& onProgress, ErrorInfo& outError) {
    return installer_.install(game, onProgress, outError);
}

bool Manager::removeGame(Game& game, ErrorInfo& outError) {
    return installer_.remove(game, outError);
}

bool Manager::runGame(const Game& game, ErrorInfo& outError) const {
    return runner_.run(game, outError);
}

std::optional<std::string> Manager::gameIconPath(const Game& game) const {
    return installer_.gameIconPath(game);
}

std::optional<std::string> Manager::findInterpreter() const {
    return locator_.find();
}

bool Manager::checkInterpreter(const std::string& command, std::string& outVersion, ErrorInfo& outError) const {
    return locator_.check(command, outVersion, outError);
}

std::optional<std::string> Manager::interpreterCommand() const {
    return runner_.resolveInterpreterCommand();
}

std::vector<std::string> Manager::findLanguages(const std::vector<Game>& games) const {
    return iman::findLanguages(games);
}

} // namespace iman
