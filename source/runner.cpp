#include "iman/runner.hpp"
#include "iman/logger.hpp"
#include "iman/process.hpp"

namespace iman {

GameRunner::GameRunner(const Config& cfg, const InterpreterLocator& locator, const GameLayout& layout)
    : cfg_(cfg), locator_(locator), layout_(layout) {}

std::optional<std::string> GameRunner::resolveInterpreterCommand() const {
    if (!cfg_.interpreterCommand.empty())
        return expandInterpreterCommand(cfg_.interpreterCommand, locator_.appDir());
    if (cfg_.useBuiltinInterpreter) {
        std::string builtin = locator_.findBuiltin();
        if (!builtin.empty()) return builtin;
    }
    if (auto found = locator_.find()) return found;
    std::string builtin = locator_.findBuiltin();
    if (!builtin.empty()) return builtin;
    return std::nullopt;
}

bool GameRunner::run(const Game& game, ErrorInfo& outError) const {
    outError = ErrorInfo{};
    auto dir = layout_.installDirectory(game);
    if (!dir) {
        outError = makeError(ErrorCategory::NotFound, ErrorCode::GameNotInstalled,
                             "Game " + game.name + " isn't installed", "Game " + game.title + " isn't installed.");
        return false;
    }
    auto interpreter = resolveInterpreterCommand();
    if (!interpreter) {
        outError = makeError(ErrorCategory::NotFound, ErrorCode::InterpreterMissing,
                             "No INSTEAD interpreter configured or found",
                             "INSTEAD has not found. Please set interpreter_command in the config.");
        return false;
    }

    logInfo("Running " + game.name + " with " + *interpreter, "RUN");
    std::string err;
    if (!spawnDetached({*interpreter, *dir}, *dir, err)) {
        outError = makeError(ErrorCategory::Subprocess, ErrorCode::SpawnFailed, err,
                             "Failed to start the INSTEAD interpreter.");
        logError("Run failed for " + game.name + ": " + err, "RUN");
        return false;
    }
    return true;
}

} // namespace iman
