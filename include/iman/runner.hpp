#pragma once

#include <optional>
#include <string>
#include "iman/config.hpp"
#include "iman/errors.hpp"
#include "iman/interpreter.hpp"
#include "iman/layout.hpp"
#include "iman/models.hpp"

namespace iman {

class GameRunner {
public:
    GameRunner(const Config& cfg, const InterpreterLocator& locator, const GameLayout& layout);

    // Configured command (expanded), built-in when preferred, detected, then built-in.
    std::optional<std::string> resolveInterpreterCommand() const;

    // Starts "<interpreter> <installDir>" detached; returns once the exec succeeded.
    bool run(const Game& game, ErrorInfo& outError) const;

private:
    const Config& cfg_;
    const InterpreterLocator& locator_;
    const GameLayout& layout_;
};

} // namespace iman
