#pragma once

#include <optional>
#include <string>
#include <vector>
#include "iman/models.hpp"

namespace iman {

class GameLayout;

enum class SortOrder {
    Title,            // case-insensitive title ascending
    PublishedAtDesc   // newest first, ties by title
};

struct GameFilter {
    std::optional<std::string> keyword;         // substring of name or title, case-insensitive
    std::optional<std::string> repositoryName;  // exact
    std::optional<std::string> language;        // case-insensitive membership
    bool onlyInstalled{false};
};

// Returns a sorted copy. Both orders are total (name, then repository break ties).
std::vector<Game> sortGames(std::vector<Game> games, SortOrder order);

// Keeps the relative order of the input.
std::vector<Game> filterGames(const std::vector<Game>& games, const GameFilter& filter);

bool matchesFilter(const Game& game, const GameFilter& filter);

// Sorted, de-duplicated case-insensitively; the first spelling seen is kept.
std::vector<std::string> findLanguages(const std::vector<Game>& games);

// Exact case-insensitive name match wins, otherwise the first candidate.
std::optional<Game> resolveByKeyword(const std::vector<Game>& candidates, const std::string& keyword);

const Game* findGame(const std::vector<Game>& games, const std::string& repositoryName, const std::string& name);

// Recompute Game::installed from the filesystem.
void refreshInstalled(std::vector<Game>& games, const GameLayout& layout);

} // namespace iman
