#include "iman/logger.hpp"
#include <atomic>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace iman {

static constexpr size_t kMaxLogBytes = 512 * 1024;
static std::atomic<int> gMinLevel{static_cast<int>(LogLevel::Info)};
static std::atomic<bool> gMirrorStderr{true};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;
static bool gLogReady = false;

bool initLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) return false;
    gLogPath = path;
    gLogFile << "insteadman log start\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
    gLogReady = true;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    gLogReady = false;
    if (gLogFile.is_open()) gLogFile.close();
}

void setLogLevel(LogLevel level) { gMinLevel.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(gMinLevel.load()); }

void setLogToStderr(bool enabled) { gMirrorStderr.store(enabled); }

void setLogLevelFromString(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") setLogLevel(LogLevel::Debug);
    else if (l == "warn" || l == "warning") setLogLevel(LogLevel::Warn);
    else if (l == "error") setLogLevel(LogLevel::Error);
    else setLogLevel(LogLevel::Info);
}

static const char* levelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static void rotateLocked() {
    if (gLogFile.is_open()) gLogFile.close();
    std::error_code ec;
    std::filesystem::path p(gLogPath);
    std::filesystem::path rotated = p;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(p, rotated, ec); // best-effort
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
    if (gLogFile) {
        gLogFile << "insteadman log start (rotated)\n";
        gLogFile.flush();
        gLogBytes = static_cast<size_t>(gLogFile.tellp());
    }
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < gMinLevel.load()) return;

    char stamp[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&now, &tmv);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmv);

    std::string line = std::string(stamp) + " " + levelLabel(level) + " [" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gMirrorStderr.load()) std::cerr << line << std::endl;
    if (!gLogReady) return;

    size_t writeBytes = line.size() + 1;
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotateLocked();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logLine(const std::string& msg) { logInternal(LogLevel::Info, "APP", msg); }
void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace iman
