#include "iman/config.hpp"
#include "iman/filesystem.hpp"
#include "iman/logger.hpp"
#include "iman/util.hpp"
#include "mini/json.hpp"
#include <cstdlib>
#include <set>
#include <sstream>

namespace iman {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (v && *v) return v;
    return fallback;
}

std::string homeDir() {
    return envOr("HOME", ".");
}

} // namespace

std::vector<Repository> defaultRepositories() {
    return {
        {"official", "http://instead-games.ru/xml.php"},
        {"sandbox", "http://instead-games.ru/xml2.php"},
    };
}

Config defaultConfig() {
    Config cfg;
    cfg.dataPath = defaultDataPath();
    cfg.repositories = defaultRepositories();
    return cfg;
}

std::string defaultConfigPath() {
    const std::string forced = envOr("IMAN_CONFIG_PATH", "");
    if (!forced.empty()) return forced;
    const std::string base = envOr("XDG_CONFIG_HOME", homeDir() + "/.config");
    return base + "/insteadman/config.json";
}

std::string defaultDataPath() {
    const std::string base = envOr("XDG_DATA_HOME", homeDir() + "/.local/share");
    return base + "/insteadman";
}

bool parseConfigString(const std::string& json, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(json, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    auto getStr = [&](const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.isString()) out = it->second.str;
    };
    auto getInt = [&](const char* key, int& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.isNumber()) out = static_cast<int>(it->second.number);
    };
    auto getBool = [&](const char* key, bool& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Bool) out = it->second.boolean;
    };

    getStr("interpreter_command", outCfg.interpreterCommand);
    getStr("lang", outCfg.language);
    getStr("data_path", outCfg.dataPath);
    getInt("http_timeout_seconds", outCfg.httpTimeoutSeconds);
    getBool("use_builtin_interpreter", outCfg.useBuiltinInterpreter);
    {
        std::string lvl;
        getStr("log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = util::toLower(lvl);
    }
    if (outCfg.httpTimeoutSeconds <= 0) {
        logWarn("http_timeout_seconds must be positive; using 30", "CFG");
        outCfg.httpTimeoutSeconds = 30;
    }

    auto reposIt = obj.find("repositories");
    if (reposIt != obj.end()) {
        if (!reposIt->second.isArray()) {
            outError = "Invalid config: repositories must be an array.";
            return false;
        }
        std::vector<Repository> repos;
        std::set<std::string> seen;
        for (const auto& item : reposIt->second.array) {
            if (!item.isObject()) continue;
            Repository r;
            auto n = item.object.find("name");
            auto u = item.object.find("url");
            if (n != item.object.end() && n->second.isString()) r.name = util::trim(n->second.str);
            if (u != item.object.end() && u->second.isString()) r.url = util::trim(u->second.str);
            if (r.name.empty() || r.url.empty()) {
                logWarn("Skipping repository entry without name or url", "CFG");
                continue;
            }
            if (!seen.insert(r.name).second) {
                logWarn("Duplicate repository name ignored: " + r.name, "CFG");
                continue;
            }
            repos.push_back(std::move(r));
        }
        outCfg.repositories = std::move(repos);
    }
    return true;
}

bool loadConfig(const std::string& path, Config& outCfg, std::string& outError) {
    outCfg = defaultConfig();
    if (!fileExists(path)) {
        logInfo("No config at " + path + "; using defaults", "CFG");
        return true;
    }
    std::string content;
    if (!readFile(path, content, outError)) return false;
    if (!parseConfigString(content, outCfg, outError)) {
        outError += " (" + path + ")";
        return false;
    }
    if (outCfg.dataPath.empty()) outCfg.dataPath = defaultDataPath();
    return true;
}

bool saveConfig(const std::string& path, const Config& cfg, std::string& outError) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"interpreter_command\": \"" << mini::escape(cfg.interpreterCommand) << "\",\n";
    os << "  \"lang\": \"" << mini::escape(cfg.language) << "\",\n";
    os << "  \"data_path\": \"" << mini::escape(cfg.dataPath) << "\",\n";
    os << "  \"http_timeout_seconds\": " << cfg.httpTimeoutSeconds << ",\n";
    os << "  \"log_level\": \"" << mini::escape(cfg.logLevel) << "\",\n";
    os << "  \"use_builtin_interpreter\": " << (cfg.useBuiltinInterpreter ? "true" : "false") << ",\n";
    os << "  \"repositories\": [";
    for (size_t i = 0; i < cfg.repositories.size(); ++i) {
        const auto& r = cfg.repositories[i];
        os << (i ? ",\n" : "\n");
        os << "    {\"name\": \"" << mini::escape(r.name) << "\", \"url\": \"" << mini::escape(r.url) << "\"}";
    }
    os << (cfg.repositories.empty() ? "]\n" : "\n  ]\n");
    os << "}\n";
    return writeFileAtomic(path, os.str(), outError);
}

std::string expandInterpreterCommand(const std::string& command, const std::string& appDir) {
    if (command.rfind("~/", 0) == 0) return homeDir() + command.substr(1);
    if (command.rfind("./", 0) == 0 && !appDir.empty()) {
        std::string dir = appDir;
        while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
        return dir + command.substr(1);
    }
    return command;
}

} // namespace iman
