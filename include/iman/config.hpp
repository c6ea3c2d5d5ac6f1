#pragma once

#include <string>
#include <vector>
#include "iman/models.hpp"

namespace iman {

struct Config {
    // Interpreter executable; empty means "detect". May start with "~/" or "./".
    std::string interpreterCommand;
    // Preferred game language (informational, used as the default --lang)
    std::string language;
    // Root for games/, repositories/, icons/, tmp/ and the log file
    std::string dataPath;
    std::vector<Repository> repositories;
    // HTTP timeout (seconds) for index fetches and downloads
    int httpTimeoutSeconds{30};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Prefer the interpreter bundled next to the executable
    bool useBuiltinInterpreter{false};
};

std::vector<Repository> defaultRepositories();
Config defaultConfig();

// $IMAN_CONFIG_PATH, else $XDG_CONFIG_HOME/insteadman/config.json, else ~/.config/insteadman/config.json.
std::string defaultConfigPath();
// $XDG_DATA_HOME/insteadman, else ~/.local/share/insteadman.
std::string defaultDataPath();

bool parseConfigString(const std::string& json, Config& outCfg, std::string& outError);
// Missing file is not an error: outCfg receives defaults.
bool loadConfig(const std::string& path, Config& outCfg, std::string& outError);
bool saveConfig(const std::string& path, const Config& cfg, std::string& outError);

std::string expandInterpreterCommand(const std::string& command, const std::string& appDir);

} // namespace iman
