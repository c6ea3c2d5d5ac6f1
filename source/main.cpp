#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <climits>
#include <unistd.h>

#include "iman/catalog.hpp"
#include "iman/config.hpp"
#include "iman/errors.hpp"
#include "iman/logger.hpp"
#include "iman/manager.hpp"
#include "iman/util.hpp"
#include "iman/version.hpp"

using iman::Config;
using iman::ErrorInfo;
using iman::Game;
using iman::Manager;

namespace {

bool gColor = false;

std::string paint(const std::string& s, const char* code) {
    if (!gColor) return s;
    return std::string("\033[") + code + "m" + s + "\033[0m";
}

std::string fmtTitle(const std::string& s) { return paint(s, "1"); }
std::string fmtName(const std::string& s) { return paint(s, "33"); }
std::string fmtRepo(const std::string& s) { return paint(s, "35"); }
std::string fmtLang(const std::string& s) { return paint(s, "36"); }
std::string fmtInstalled(const std::string& s) { return paint(s, "32"); }
std::string fmtUrl(const std::string& s) { return paint(s, "4"); }
std::string fmtError(const std::string& s) { return paint(s, "31"); }

struct CliArgs {
    std::string command;
    std::optional<std::string> keyword;
    std::optional<std::string> repository;
    std::optional<std::string> lang;
    bool onlyInstalled{false};
    bool verbose{false};
};

CliArgs parseArgs(int argc, char** argv) {
    CliArgs out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](const char* prefix) -> std::optional<std::string> {
            std::string p = std::string(prefix) + "=";
            if (a.rfind(p, 0) == 0) return a.substr(p.size());
            return std::nullopt;
        };
        if (a == "-v" || a == "--verbose") {
            out.verbose = true;
            continue;
        }
        if (a == "-h" || a == "--help") {
            out.command = "help";
            continue;
        }
        if (a.rfind("--", 0) == 0) {
            if (auto v = value("--repository")) out.repository = *v;
            else if (auto r = value("--repo")) out.repository = *r;
            else if (auto l = value("--lang")) out.lang = *l;
            else if (a == "--installed") out.onlyInstalled = true;
            continue;
        }
        if (out.command.empty()) out.command = iman::util::toLower(a);
        else if (!out.keyword) out.keyword = a;
    }
    return out;
}

std::string executableDir(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    std::string exe;
    if (n > 0) {
        buf[n] = '\0';
        exe = buf;
    } else if (argv0) {
        exe = argv0;
    }
    auto slash = exe.find_last_of('/');
    if (slash == std::string::npos) return ".";
    return slash == 0 ? "/" : exe.substr(0, slash);
}

void printHelp() {
    std::cout << fmtTitle("InsteadMan CLI") << " " << iman::appVersion() << " - INSTEAD games manager (launcher)\n\n"
              << "Usage:\n"
              << "    iman [command] [keyword] [options]\n\n"
              << "Commands:\n"
              << "  update\n      Update game repositories\n"
              << "  list --repository=[name] --lang=[lang] --installed\n      Print list of games with filtering\n"
              << "  search [keyword] --repository=[name] --lang=[lang] --installed\n"
              << "      Search games by name and title with filtering\n"
              << "  show [keyword]\n      Show information about a game\n"
              << "  install [keyword]\n      Install a game\n"
              << "  run [keyword]\n      Run an installed game\n"
              << "  remove [keyword]\n      Remove an installed game\n"
              << "  findinterpreter\n      Find the INSTEAD interpreter and save its path to the config\n"
              << "  checkinterpreter [command]\n      Run the interpreter and print its version\n"
              << "  repositories\n      Print configured repositories\n"
              << "  langs\n      Print available game languages\n"
              << "  configpath\n      Print config path\n"
              << "  version\n      Print the application version\n\n"
              << "Options:\n"
              << "  --verbose   mirror the log to stderr\n";
}

int fail(const ErrorInfo& e) {
    std::cerr << fmtError(iman::describeError(e)) << "\n";
    return 1;
}

void printGames(const std::vector<Game>& games) {
    for (const auto& g : games) {
        std::string langs;
        for (size_t i = 0; i < g.languages.size(); ++i) langs += (i ? " " : "") + g.languages[i];
        std::cout << fmtTitle(g.title) << ", " << fmtName(g.name) << ", " << fmtRepo(g.repositoryName) << " "
                  << fmtLang("[" + langs + "]");
        if (g.installed) std::cout << " " << fmtInstalled("[installed]");
        std::cout << "\n";
    }
}

// Exact name match first, else the first filtered game.
std::optional<Game> pickGame(Manager& m, const CliArgs& args, int& exitCode) {
    exitCode = 0;
    if (!args.keyword) {
        printHelp();
        exitCode = 1;
        return std::nullopt;
    }
    std::vector<Game> games;
    ErrorInfo err;
    if (!m.sortedGames(games, err)) {
        exitCode = fail(err);
        return std::nullopt;
    }
    iman::GameFilter filter;
    filter.keyword = *args.keyword;
    filter.repositoryName = args.repository;
    auto game = iman::resolveByKeyword(iman::filterGames(games, filter), *args.keyword);
    if (!game) {
        std::cout << "Game " << fmtName(*args.keyword) << " has not found\n";
        exitCode = 1;
    }
    return game;
}

int cmdUpdate(Manager& m) {
    std::cout << "Updating repositories...\n";
    auto result = m.updateRepositories();
    if (!result.errors.empty()) std::cout << "There are errors:\n";
    for (const auto& e : result.errors) {
        std::cout << fmtRepo(e.repository) << ": " << fmtError(iman::describeError(e.cause)) << "\n";
    }
    std::cout << "Repositories have updated.\n";
    return result.succeeded > 0 || m.repositories().empty() ? 0 : 1;
}

int cmdList(Manager& m, const CliArgs& args, bool search) {
    if (search && !args.keyword) {
        printHelp();
        return 1;
    }
    std::vector<Game> games;
    ErrorInfo err;
    bool ok = search ? m.sortedGames(games, err) : m.sortedGamesByDateDesc(games, err);
    if (!ok) return fail(err);
    iman::GameFilter filter;
    if (search) filter.keyword = args.keyword;
    filter.repositoryName = args.repository;
    filter.language = args.lang;
    filter.onlyInstalled = args.onlyInstalled;
    printGames(iman::filterGames(games, filter));
    return 0;
}

int cmdShow(Manager& m, const CliArgs& args) {
    int code = 0;
    auto game = pickGame(m, args, code);
    if (!game) return code;
    const Game& g = *game;
    std::cout << fmtTitle(g.title) << " (" << fmtName(g.name) << ") " << iman::util::humanSize(g.sizeBytes);
    if (g.installed) std::cout << " " << fmtInstalled("[installed]");
    std::cout << "\n";
    std::cout << "Version: " << (g.version.empty() ? "-" : g.version) << "\n";
    if (!g.languages.empty()) {
        std::string langs;
        for (size_t i = 0; i < g.languages.size(); ++i) langs += (i ? ", " : "") + g.languages[i];
        std::cout << "Languages: " << fmtLang(langs) << "\n";
    }
    if (!g.repositoryName.empty()) std::cout << "Repository: " << fmtRepo(g.repositoryName) << "\n";
    if (g.publishedAt > 0) std::cout << "Published: " << iman::util::formatDate(g.publishedAt) << "\n";
    if (!g.descriptionUrl.empty()) std::cout << "More: " << fmtUrl(g.descriptionUrl) << "\n";
    if (auto icon = m.gameIconPath(g)) std::cout << "Icon: " << *icon << "\n";
    if (!g.description.empty()) std::cout << "\n" << fmtTitle("Description") << ":\n" << g.description << "\n";
    return 0;
}

int cmdFindInterpreter(Manager& m, const std::string& configPath) {
    auto path = m.findInterpreter();
    if (!path) {
        std::cout << "INSTEAD has not found. Please add it in " << configPath << " (interpreter_command)\n";
        return 1;
    }
    std::cout << "INSTEAD has found: " << *path << "\n";
    m.config().interpreterCommand = *path;
    std::string err;
    if (!iman::saveConfig(configPath, m.config(), err)) {
        return fail(iman::classifyError(err, iman::ErrorCategory::Config));
    }
    std::cout << "Path has saved\n";
    return 0;
}

int cmdCheckInterpreter(Manager& m, const CliArgs& args) {
    std::optional<std::string> command = args.keyword;
    if (!command) command = m.interpreterCommand();
    if (!command) {
        std::cout << "INSTEAD has not found.\n";
        return 1;
    }
    std::string version;
    ErrorInfo err;
    if (!m.checkInterpreter(*command, version, err)) {
        std::cout << fmtError(m.locator().checkFailureMessage(*command)) << "\n";
        iman::logWarn(err.detail, "CLI");
        return 1;
    }
    std::cout << "INSTEAD " << *command << ": " << version << "\n";
    return 0;
}

int cmdInstall(Manager& m, const CliArgs& args) {
    int code = 0;
    auto game = pickGame(m, args, code);
    if (!game) return code;
    Game g = *game;
    const std::string prefix = "Downloading and installing game " + fmtName(g.title) + "...";
    std::cout << prefix << std::flush;
    ErrorInfo err;
    bool ok = m.installGame(g, [&](uint64_t bytes) {
        std::cout << "\r" << prefix << " " << fmtInstalled(iman::util::percent(bytes, g.sizeBytes)) << std::flush;
    }, err);
    std::cout << "\n";
    if (!ok) return fail(err);
    std::cout << "Game " << fmtName(g.title) << " has installed.\n";
    return 0;
}

int cmdRun(Manager& m, const CliArgs& args) {
    int code = 0;
    auto game = pickGame(m, args, code);
    if (!game) return code;
    if (!game->installed) {
        std::cout << "Game " << fmtName(game->title) << " isn't installed.\n"
                  << "Please run for installation:\n"
                  << "iman install " << game->name << "\n";
        return 1;
    }
    ErrorInfo err;
    if (!m.runGame(*game, err)) return fail(err);
    std::cout << "Running " << fmtName(game->title) << " game...\n";
    return 0;
}

int cmdRemove(Manager& m, const CliArgs& args) {
    int code = 0;
    auto game = pickGame(m, args, code);
    if (!game) return code;
    Game g = *game;
    std::cout << "Removing game " << fmtName(g.title) << "...\n";
    ErrorInfo err;
    if (!m.removeGame(g, err)) return fail(err);
    std::cout << "Game " << fmtName(g.title) << " has removed.\n";
    return 0;
}

int cmdLangs(Manager& m) {
    std::vector<Game> games;
    ErrorInfo err;
    if (!m.sortedGames(games, err)) return fail(err);
    for (const auto& lang : m.findLanguages(games)) std::cout << fmtLang(lang) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    gColor = ::isatty(STDOUT_FILENO) == 1;
    const CliArgs args = parseArgs(argc, argv);

    if (args.command == "version") {
        std::cout << iman::appVersion() << "\n";
        return 0;
    }
    if (args.command == "help") {
        printHelp();
        return 0;
    }

    const std::string configPath = iman::defaultConfigPath();
    if (args.command == "configpath") {
        std::cout << configPath << "\n";
        return 0;
    }

    Config cfg;
    std::string cfgError;
    if (!iman::loadConfig(configPath, cfg, cfgError)) {
        std::cerr << fmtError(iman::describeError(
                         iman::makeError(iman::ErrorCategory::Config, iman::ErrorCode::ConfigInvalid, cfgError)))
                  << "\n";
        return 1;
    }
    iman::setLogToStderr(args.verbose);
    iman::setLogLevelFromString(args.verbose ? "debug" : cfg.logLevel);

    Manager m(cfg, executableDir(argc > 0 ? argv[0] : nullptr));
    if (!iman::initLogFile(m.layout().logPath())) {
        std::cerr << "Warning: cannot open log file " << m.layout().logPath() << "\n";
    }
    iman::logInfo("insteadman " + std::string(iman::appVersion()) + " command=" + args.command, "CLI");

    const std::string& cmd = args.command;
    if ((cmd == "list" || cmd == "search" || cmd == "langs") && !m.hasDownloadedRepositories()) {
        cmdUpdate(m);
    }
    if ((cmd == "install" || cmd == "run") && m.config().interpreterCommand.empty() &&
        !m.config().useBuiltinInterpreter) {
        cmdFindInterpreter(m, configPath);
    }

    int rc = 1;
    if (cmd == "update") rc = cmdUpdate(m);
    else if (cmd == "list") rc = cmdList(m, args, false);
    else if (cmd == "search") rc = cmdList(m, args, true);
    else if (cmd == "show") rc = cmdShow(m, args);
    else if (cmd == "install") rc = cmdInstall(m, args);
    else if (cmd == "run") rc = cmdRun(m, args);
    else if (cmd == "remove") rc = cmdRemove(m, args);
    else if (cmd == "findinterpreter") rc = cmdFindInterpreter(m, configPath);
    else if (cmd == "checkinterpreter") rc = cmdCheckInterpreter(m, args);
    else if (cmd == "repositories") {
        for (const auto& r : m.repositories()) std::cout << fmtRepo(r.name) << " (" << r.url << ")\n";
        rc = 0;
    } else if (cmd == "langs") rc = cmdLangs(m);
    else printHelp();

    iman::logInfo("Exit " + std::to_string(rc), "CLI");
    iman::closeLogFile();
    return rc;
}
