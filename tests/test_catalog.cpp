#include "catch.hpp"
#include "iman/catalog.hpp"
#include "iman/layout.hpp"
#include "iman/util.hpp"
#include "test_support.hpp"

namespace {

iman::Game makeGame(const std::string& name, const std::string& title, const std::string& repo,
                    int64_t published, std::vector<std::string> langs = {}) {
    iman::Game g;
    g.name = name;
    g.title = title;
    g.repositoryName = repo;
    g.publishedAt = published;
    g.languages = std::move(langs);
    g.downloadUrl = "http://example.com/" + name + ".zip";
    g.sizeBytes = 1000;
    return g;
}

std::vector<std::string> names(const std::vector<iman::Game>& games) {
    std::vector<std::string> out;
    for (const auto& g : games) out.push_back(g.name + "@" + g.repositoryName);
    return out;
}

} // namespace

TEST_CASE("sortGames by date is newest first with title tie-break") {
    std::vector<iman::Game> games = {
        makeGame("old", "Old", "a", 100),
        makeGame("zeta", "zeta", "a", 300),
        makeGame("alpha", "Alpha", "a", 300),
        makeGame("undated", "Undated", "a", 0),
    };
    auto sorted = iman::sortGames(games, iman::SortOrder::PublishedAtDesc);
    REQUIRE(names(sorted) == std::vector<std::string>{"alpha@a", "zeta@a", "old@a", "undated@a"});
}

TEST_CASE("sortGames by title is case-insensitive and total") {
    std::vector<iman::Game> games = {
        makeGame("b", "beta", "r2", 0),
        makeGame("a", "Alpha", "r1", 0),
        makeGame("b", "Beta", "r1", 0),
    };
    auto sorted = iman::sortGames(games, iman::SortOrder::Title);
    REQUIRE(sorted[0].name == "a");
    // Same title and name: repository decides.
    REQUIRE(sorted[1].repositoryName == "r1");
    REQUIRE(sorted[2].repositoryName == "r2");
}

TEST_CASE("filterGames keyword matches name or title and keeps order") {
    std::vector<iman::Game> games = {
        makeGame("galaxy", "Galaxy Quest", "a", 0),
        makeGame("lostworld", "The Lost GALAXY", "a", 0),
        makeGame("cave", "Cave", "a", 0),
    };
    iman::GameFilter f;
    f.keyword = "galaxy";
    REQUIRE(names(iman::filterGames(games, f)) == std::vector<std::string>{"galaxy@a", "lostworld@a"});
    f.keyword = "zzz";
    REQUIRE(iman::filterGames(games, f).empty());
}

TEST_CASE("filterGames composes repository, language and installed with AND") {
    std::vector<iman::Game> games = {
        makeGame("g1", "One", "official", 0, {"ru", "en"}),
        makeGame("g2", "Two", "sandbox", 0, {"RU"}),
        makeGame("g3", "Three", "official", 0, {"en"}),
    };
    games[0].installed = true;
    games[1].installed = true;

    iman::GameFilter f;
    f.language = "Ru";
    REQUIRE(names(iman::filterGames(games, f)) == std::vector<std::string>{"g1@official", "g2@sandbox"});
    f.repositoryName = "official";
    REQUIRE(names(iman::filterGames(games, f)) == std::vector<std::string>{"g1@official"});
    f = iman::GameFilter{};
    f.onlyInstalled = true;
    REQUIRE(iman::filterGames(games, f).size() == 2);
    f.language = "e";
    REQUIRE(iman::filterGames(games, f).empty());
}

TEST_CASE("findLanguages dedupes case-insensitively and sorts") {
    std::vector<iman::Game> games = {
        makeGame("g1", "One", "a", 0, {"ru", "en"}),
        makeGame("g2", "Two", "a", 0, {"EN", "de"}),
    };
    REQUIRE(iman::findLanguages(games) == std::vector<std::string>{"de", "en", "ru"});
}

TEST_CASE("filterGames folds case beyond ASCII") {
    std::vector<iman::Game> games = {
        makeGame("galaktika", "Галактика", "a", 0, {"Ру"}),
        makeGame("strasse", "STRASSE", "a", 0, {"De"}),
        makeGame("cave", "Cave", "a", 0, {"en"}),
    };
    iman::GameFilter byTitle;
    byTitle.keyword = "галактика";
    REQUIRE(names(iman::filterGames(games, byTitle)) == std::vector<std::string>{"galaktika@a"});

    iman::GameFilter byLanguage;
    byLanguage.language = "ру";
    REQUIRE(names(iman::filterGames(games, byLanguage)) == std::vector<std::string>{"galaktika@a"});

    iman::GameFilter sharpS;
    sharpS.keyword = "straße";
    REQUIRE(names(iman::filterGames(games, sharpS)) == std::vector<std::string>{"strasse@a"});

    std::vector<iman::Game> byName = {makeGame("cave", "Cave", "a", 0), makeGame("Галактика", "Галактика", "a", 0)};
    auto exact = iman::resolveByKeyword(byName, "ГАЛАКТИКА");
    REQUIRE(exact);
    REQUIRE(exact->name == "Галактика");
}

TEST_CASE("findLanguages dedupes Cyrillic codes regardless of case") {
    std::vector<iman::Game> games = {
        makeGame("g1", "One", "a", 0, {"Ру"}),
        makeGame("g2", "Two", "a", 0, {"ру", "en"}),
    };
    const auto langs = iman::findLanguages(games);
    REQUIRE(langs.size() == 2);
    REQUIRE(langs[0] == "en");
    REQUIRE(iman::util::iequals(langs[1], "ру"));
}

TEST_CASE("filterGames gives the same result whichever criterion is applied first") {
    std::vector<iman::Game> games = {
        makeGame("galaxy", "Galaxy Quest", "a", 0, {"ru", "en"}),
        makeGame("galaxy", "Galaxy Quest", "b", 0, {"en"}),
        makeGame("lostgalaxy", "Lost Galaxy", "a", 0, {"RU"}),
        makeGame("cave", "Cave", "a", 0, {"ru"}),
    };
    iman::GameFilter keywordOnly;
    keywordOnly.keyword = "galaxy";
    iman::GameFilter languageOnly;
    languageOnly.language = "ru";
    iman::GameFilter both = keywordOnly;
    both.language = "ru";

    const auto keywordThenLanguage = iman::filterGames(iman::filterGames(games, keywordOnly), languageOnly);
    const auto languageThenKeyword = iman::filterGames(iman::filterGames(games, languageOnly), keywordOnly);
    const auto combined = iman::filterGames(games, both);

    const std::vector<std::string> expected = {"galaxy@a", "lostgalaxy@a"};
    REQUIRE(names(keywordThenLanguage) == expected);
    REQUIRE(names(languageThenKeyword) == expected);
    REQUIRE(names(combined) == expected);
}

TEST_CASE("resolveByKeyword prefers exact name") {
    std::vector<iman::Game> games = {
        makeGame("galaxy2", "Galaxy 2", "a", 0),
        makeGame("Galaxy", "Galaxy", "a", 0),
    };
    auto g = iman::resolveByKeyword(games, "galaxy");
    REQUIRE(g);
    REQUIRE(g->name == "Galaxy");

    auto first = iman::resolveByKeyword(games, "gal");
    REQUIRE(first);
    REQUIRE(first->name == "galaxy2");

    REQUIRE_FALSE(iman::resolveByKeyword({}, "gal"));
}

TEST_CASE("findGame and refreshInstalled use repository identity") {
    auto dir = testsupport::makeTempDir("catalog_installed");
    iman::GameLayout layout(dir.string());
    std::vector<iman::Game> games = {
        makeGame("cave", "Cave", "official", 0),
        makeGame("cave", "Cave", "sandbox", 0),
    };
    REQUIRE(iman::findGame(games, "sandbox", "cave") == &games[1]);
    REQUIRE(iman::findGame(games, "nowhere", "cave") == nullptr);

    testsupport::writeText(dir / "games" / "cave" / "main.lua", "--");
    testsupport::writeText(dir / "games" / "cave" / iman::GameLayout::kOwnerMarker, "official\n");
    iman::refreshInstalled(games, layout);
    REQUIRE(games[0].installed);
    REQUIRE_FALSE(games[1].installed);
}
