#include "catch.hpp"
#include "iman/runner.hpp"
#include "test_support.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace {

iman::Game installedGame(const fs::path& dataDir, const std::string& name) {
    iman::Game g;
    g.name = name;
    g.title = name;
    g.repositoryName = "official";
    testsupport::writeText(dataDir / "games" / name / "main.lua", "--");
    return g;
}

} // namespace

TEST_CASE("resolveInterpreterCommand follows configured, built-in, detected order") {
    auto dir = testsupport::makeTempDir("runner_resolve");
    const fs::path app = dir / "app";
    testsupport::writeScript(dir / "usr" / "sdl-instead", "exit 0\n");
    iman::GameLayout layout((dir / "data").string());

    iman::Config cfg;
    iman::InterpreterLocator detected(app.string(), {(dir / "usr" / "sdl-instead").string()}, std::string());
    iman::GameRunner runner(cfg, detected, layout);
    REQUIRE(runner.resolveInterpreterCommand() == std::optional<std::string>((dir / "usr" / "sdl-instead").string()));

    testsupport::writeScript(app / "instead" / "sdl-instead", "exit 0\n");
    const std::string builtin = (app / "instead" / "sdl-instead").string();
    // Detected interpreter still wins unless the built-in one is preferred.
    REQUIRE(runner.resolveInterpreterCommand() == std::optional<std::string>((dir / "usr" / "sdl-instead").string()));
    cfg.useBuiltinInterpreter = true;
    REQUIRE(runner.resolveInterpreterCommand() == std::optional<std::string>(builtin));

    cfg.interpreterCommand = "~/games/sdl-instead";
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(runner.resolveInterpreterCommand() == std::optional<std::string>(std::string(home) + "/games/sdl-instead"));

    iman::Config plain;
    iman::InterpreterLocator onlyBuiltin(app.string(), {}, std::string());
    iman::GameRunner fallback(plain, onlyBuiltin, layout);
    REQUIRE(fallback.resolveInterpreterCommand() == std::optional<std::string>(builtin));

    iman::InterpreterLocator none((dir / "empty").string(), {}, std::string());
    iman::GameRunner missing(plain, none, layout);
    REQUIRE_FALSE(missing.resolveInterpreterCommand());
}

TEST_CASE("run refuses games that are not installed") {
    auto dir = testsupport::makeTempDir("runner_missing");
    iman::GameLayout layout(dir.string());
    iman::Config cfg;
    cfg.interpreterCommand = "/bin/true";
    iman::InterpreterLocator locator(dir.string(), {}, std::string());
    iman::GameRunner runner(cfg, locator, layout);

    iman::Game g;
    g.name = "ghost";
    g.repositoryName = "official";
    iman::ErrorInfo err;
    REQUIRE_FALSE(runner.run(g, err));
    REQUIRE(err.category == iman::ErrorCategory::NotFound);
    REQUIRE(err.code == iman::ErrorCode::GameNotInstalled);
}

TEST_CASE("run reports a missing interpreter") {
    auto dir = testsupport::makeTempDir("runner_nointerp");
    iman::GameLayout layout(dir.string());
    auto game = installedGame(dir, "cave");
    iman::Config cfg;
    iman::InterpreterLocator locator((dir / "app").string(), {}, std::string());
    iman::GameRunner runner(cfg, locator, layout);

    iman::ErrorInfo err;
    REQUIRE_FALSE(runner.run(game, err));
    REQUIRE(err.code == iman::ErrorCode::InterpreterMissing);
}

TEST_CASE("run starts the interpreter with the game directory") {
    auto dir = testsupport::makeTempDir("runner_spawn");
    iman::GameLayout layout((dir / "data").string());
    auto game = installedGame(dir / "data", "galaxy");
    // Written in the working directory; renamed so a partial file is never observed.
    testsupport::writeScript(dir / "fake-instead",
                             "printf '%s\\n' \"$1\" > ran.tmp && mv ran.tmp ran.txt\n");

    iman::Config cfg;
    cfg.interpreterCommand = (dir / "fake-instead").string();
    iman::InterpreterLocator locator(dir.string(), {}, std::string());
    iman::GameRunner runner(cfg, locator, layout);

    iman::ErrorInfo err;
    REQUIRE(runner.run(game, err));
    const fs::path marker = dir / "data" / "games" / "galaxy" / "ran.txt";
    REQUIRE(testsupport::waitForFile(marker));
    REQUIRE(testsupport::readText(marker) == (dir / "data" / "games" / "galaxy").string() + "\n");
}

TEST_CASE("run reports interpreters that cannot be started") {
    auto dir = testsupport::makeTempDir("runner_badexec");
    iman::GameLayout layout(dir.string());
    auto game = installedGame(dir, "cave");
    iman::Config cfg;
    cfg.interpreterCommand = "/bin/nonexistent-instead-binary";
    iman::InterpreterLocator locator(dir.string(), {}, std::string());
    iman::GameRunner runner(cfg, locator, layout);

    iman::ErrorInfo err;
    REQUIRE_FALSE(runner.run(game, err));
    REQUIRE(err.category == iman::ErrorCategory::Subprocess);
    REQUIRE(err.code == iman::ErrorCode::SpawnFailed);
}
