#include "iman/catalog.hpp"
#include "iman/layout.hpp"
#include "iman/util.hpp"
#include <algorithm>

namespace iman {

namespace {

// Strict weak ordering shared by both sort orders after their primary key.
bool titleThenIdentityLess(const Game& a, const Game& b) {
    int c = util::icompare(a.title, b.title);
    if (c != 0) return c < 0;
    if (a.name != b.name) return a.name < b.name;
    return a.repositoryName < b.repositoryName;
}

} // namespace

std::vector<Game> sortGames(std::vector<Game> games, SortOrder order) {
    switch (order) {
        case SortOrder::Title:
            std::stable_sort(games.begin(), games.end(), titleThenIdentityLess);
            break;
        case SortOrder::PublishedAtDesc:
            std::stable_sort(games.begin(), games.end(), [](const Game& a, const Game& b) {
                if (a.publishedAt != b.publishedAt) return a.publishedAt > b.publishedAt;
                return titleThenIdentityLess(a, b);
            });
            break;
    }
    return games;
}

bool matchesFilter(const Game& game, const GameFilter& filter) {
    if (filter.onlyInstalled && !game.installed) return false;
    if (filter.repositoryName && game.repositoryName != *filter.repositoryName) return false;
    if (filter.keyword &&
        !util::icontains(game.name, *filter.keyword) && !util::icontains(game.title, *filter.keyword))
        return false;
    if (filter.language) {
        const std::string& lang = *filter.language;
        bool found = std::any_of(game.languages.begin(), game.languages.end(),
                                 [&](const std::string& l) { return util::iequals(l, lang); });
        if (!found) return false;
    }
    return true;
}

std::vector<Game> filterGames(const std::vector<Game>& games, const GameFilter& filter) {
    std::vector<Game> out;
    for (const auto& g : games) {
        if (matchesFilter(g, filter)) out.push_back(g);
    }
    return out;
}

std::vector<std::string> findLanguages(const std::vector<Game>& games) {
    std::vector<std::string> out;
    for (const auto& g : games) {
        for (const auto& lang : g.languages) {
            if (lang.empty()) continue;
            bool dup = std::any_of(out.begin(), out.end(),
                                   [&](const std::string& l) { return util::iequals(l, lang); });
            if (!dup) out.push_back(lang);
        }
    }
    std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
        return util::icompare(a, b) < 0;
    });
    return out;
}

std::optional<Game> resolveByKeyword(const std::vector<Game>& candidates, const std::string& keyword) {
    if (candidates.empty()) return std::nullopt;
    for (const auto& g : candidates) {
        if (util::iequals(g.name, keyword)) return g;
    }
    return candidates.front();
}

const Game* findGame(const std::vector<Game>& games, const std::string& repositoryName, const std::string& name) {
    for (const auto& g : games) {
        if (g.repositoryName == repositoryName && g.name == name) return &g;
    }
    return nullptr;
}

void refreshInstalled(std::vector<Game>& games, const GameLayout& layout) {
    for (auto& g : games) g.installed = layout.isInstalled(g);
}

} // namespace iman
