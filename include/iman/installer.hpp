#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "iman/errors.hpp"
#include "iman/http.hpp"
#include "iman/layout.hpp"
#include "iman/models.hpp"

namespace iman {

// Cumulative bytes downloaded so far; called once per received chunk.
using ProgressFn = std::function<void(uint64_t bytesSoFar)>;

// Downloads, extracts and removes games under a GameLayout. Calls are
// synchronous; installing the same game from two threads at once is the
// caller's problem.
class Installer {
public:
    Installer(GameLayout layout, HttpGetFn fetch, int timeoutSec);

    // On failure nothing is left behind that would make the game look installed.
    bool install(Game& game, const ProgressFn& onProgress, ErrorInfo& outError);
    // Missing install directory is not an error.
    bool remove(Game& game, ErrorInfo& outError);

    std::optional<std::string> gameIconPath(const Game& game) const;

    const GameLayout& layout() const { return layout_; }

private:
    bool download(const Game& game, const std::string& partPath, const ProgressFn& onProgress,
                  ErrorInfo& outError);
    void fetchIcon(const Game& game);

    GameLayout layout_;
    HttpGetFn fetch_;
    int timeoutSec_;
};

} // namespace iman
