#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "iman/config.hpp"
#include "iman/http.hpp"
#include "iman/models.hpp"

namespace iman {

class GameLayout;

struct SyncResult {
    std::shared_ptr<const Catalog> catalog;  // never null; games of the repositories that succeeded
    std::vector<SyncError> errors;           // one per failed repository
    size_t succeeded{0};
};

// Parse one index document. XML documents use the <game_list><game>... layout
// served by the stock repositories; JSON documents are a top-level array of
// game objects or an object with a "games" array. Records missing name, url or
// a whole byte size are dropped and counted; relative links are resolved
// against baseUrl when given.
bool parseRepositoryIndex(const std::string& body,
                          const std::string& repositoryName,
                          std::vector<Game>& outGames,
                          size_t& outDropped,
                          std::string& err,
                          const std::string& baseUrl = std::string());

// Fetch every repository independently and build a fresh catalog once all
// have been attempted. Successful index documents are cached under
// <dataPath>/repositories when cfg.dataPath is set.
SyncResult syncAll(const std::vector<Repository>& repositories, const Config& cfg, const HttpGetFn& fetch);

bool hasCachedIndex(const std::vector<Repository>& repositories, const GameLayout& layout);
// Rebuild a catalog from cached index documents; nullptr when none are cached.
std::shared_ptr<const Catalog> loadCachedCatalog(const std::vector<Repository>& repositories,
                                                 const GameLayout& layout);

// Holder of the current catalog snapshot. Readers keep the shared_ptr for the
// whole query; publish swaps the pointer and never mutates a published catalog.
class CatalogStore {
public:
    void publish(std::shared_ptr<const Catalog> catalog);
    std::shared_ptr<const Catalog> snapshot() const;
    bool hasAnySyncedData() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Catalog> current_;
};

} // namespace iman
