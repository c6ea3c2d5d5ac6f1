#include "iman/installer.hpp"
#include "iman/archive.hpp"
#include "iman/filesystem.hpp"
#include "iman/logger.hpp"
#include "iman/raii.hpp"
#include "iman/util.hpp"
#include <cstdio>
#include <filesystem>

namespace iman {

namespace fs = std::filesystem;

namespace {

// Archives usually wrap the game in one folder; return it so main.lua ends up at the top.
std::string contentRoot(const std::string& staging) {
    std::error_code ec;
    fs::directory_iterator it(staging, ec);
    if (ec) return staging;
    std::string only;
    int count = 0;
    for (const auto& entry : it) {
        if (++count > 1) return staging;
        if (!entry.is_directory(ec)) return staging;
        only = entry.path().string();
    }
    return count == 1 ? only : staging;
}

ErrorInfo filesystemError(const std::string& detail) {
    ErrorInfo e = classifyError(detail, ErrorCategory::Filesystem);
    if (e.category != ErrorCategory::Filesystem)
        e = makeError(ErrorCategory::Filesystem, ErrorCode::WriteFailed, detail);
    return e;
}

} // namespace

Installer::Installer(GameLayout layout, HttpGetFn fetch, int timeoutSec)
    : layout_(std::move(layout)), fetch_(std::move(fetch)), timeoutSec_(timeoutSec) {}

bool Installer::download(const Game& game, const std::string& partPath, const ProgressFn& onProgress,
                         ErrorInfo& outError) {
    UniqueFile out(std::fopen(partPath.c_str(), "wb"));
    if (!out) {
        outError = filesystemError("Open failed: " + partPath);
        return false;
    }

    uint64_t received = 0;
    std::string writeErr;
    auto sink = [&](const char* data, size_t len) {
        if (len == 0) return true;
        if (std::fwrite(data, 1, len, out.f) != len) {
            writeErr = "Write failed: " + partPath;
            return false;
        }
        received += len;
        if (onProgress) onProgress(received);
        return true;
    };

    HttpResponse resp;
    std::string err;
    bool ok = fetch_(game.downloadUrl, timeoutSec_, resp, sink, err);
    bool closed = out.close();
    if (!writeErr.empty()) {
        outError = filesystemError(writeErr);
        return false;
    }
    if (!ok) {
        outError = classifyError(err, ErrorCategory::Network);
        return false;
    }
    if (!closed) {
        outError = filesystemError("Write failed (flush): " + partPath);
        return false;
    }
    if (game.sizeBytes > 0 && received != game.sizeBytes) {
        logWarn("Downloaded " + std::to_string(received) + " bytes for " + game.name + ", index says " +
                std::to_string(game.sizeBytes), "INST");
    }
    return true;
}

bool Installer::install(Game& game, const ProgressFn& onProgress, ErrorInfo& outError) {
    outError = ErrorInfo{};
    if (game.downloadUrl.empty()) {
        outError = makeError(ErrorCategory::Data, ErrorCode::MissingRequiredField,
                             "Game " + game.name + " has no download URL");
        return false;
    }
    if (!ensureDirectory(layout_.tempDir()) || !ensureDirectory(layout_.gamesRoot())) {
        outError = filesystemError("Mkdir failed: " + layout_.dataPath());
        return false;
    }

    const uint64_t freeBytes = getFreeSpace(layout_.tempDir());
    // Archive plus extracted copy; 0 means the query is unsupported.
    if (freeBytes != 0 && game.sizeBytes > 0 && freeBytes / 2 < game.sizeBytes) {
        outError = makeError(ErrorCategory::Filesystem, ErrorCode::NoSpace,
                             "Not enough free space: need " + util::humanSize(game.sizeBytes * 2) +
                             ", have " + util::humanSize(freeBytes));
        return false;
    }

    const std::string base = util::safeName(game.name);
    const std::string partPath = layout_.tempDir() + "/" + base + ".part";
    const std::string staging = layout_.tempDir() + "/" + base + ".staging";
    std::string err;
    if (!removeTree(staging, err)) {
        outError = filesystemError(err);
        return false;
    }
    auto cleanupTemp = make_scope_guard([&]() {
        std::string ignored;
        removeFileBestEffort(partPath);
        if (!removeTree(staging, ignored)) logWarn(ignored, "INST");
    });

    logInfo("Downloading " + game.name + " from " + game.downloadUrl, "INST");
    if (!download(game, partPath, onProgress, outError)) {
        logError("Download failed for " + game.name + ": " + outError.detail, "INST");
        return false;
    }

    ExtractStats stats;
    if (!extractZip(partPath, staging, stats, err)) {
        outError = classifyError(err, ErrorCategory::Parse);
        logError("Extract failed for " + game.name + ": " + err, "INST");
        return false;
    }
    if (stats.files == 0) {
        outError = makeError(ErrorCategory::Parse, ErrorCode::CorruptArchive, "Archive contains no files");
        return false;
    }

    const std::string source = contentRoot(staging);
    const std::string target = layout_.targetDirectory(game);
    if (!removeTree(target, err)) {
        outError = filesystemError(err);
        return false;
    }
    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec) {
        outError = filesystemError("Rename failed: " + source + " -> " + target + " (" + ec.message() + ")");
        return false;
    }
    if (!GameLayout::writeOwner(target, game.repositoryName, err)) {
        std::string ignored;
        if (!removeTree(target, ignored)) logWarn(ignored, "INST");
        outError = filesystemError(err);
        return false;
    }

    if (!game.imageUrl.empty()) fetchIcon(game);

    game.installed = true;
    logInfo("Installed " + game.name + " (" + std::to_string(stats.files) + " files) -> " + target, "INST");
    return true;
}

void Installer::fetchIcon(const Game& game) {
    if (!ensureDirectory(layout_.iconsDir())) return;
    const std::string path = layout_.iconPath(game);
    std::string body, err;
    if (!fetchToString(fetch_, game.imageUrl, timeoutSec_, body, err)) {
        logWarn("Icon fetch failed for " + game.name + ": " + err, "INST");
        return;
    }
    if (!writeFileAtomic(path, body, err)) logWarn("Icon write failed for " + game.name + ": " + err, "INST");
}

bool Installer::remove(Game& game, ErrorInfo& outError) {
    outError = ErrorInfo{};
    if (auto dir = layout_.installDirectory(game)) {
        std::string err;
        if (!removeTree(*dir, err)) {
            outError = filesystemError(err);
            logError("Remove failed for " + game.name + ": " + err, "INST");
            return false;
        }
        logInfo("Removed " + game.name + " (" + *dir + ")", "INST");
    } else {
        logDebug("Remove: " + game.name + " is not installed", "INST");
    }
    const std::string icon = layout_.iconPath(game);
    if (isRegularFile(icon)) removeFileBestEffort(icon);
    game.installed = false;
    return true;
}

std::optional<std::string> Installer::gameIconPath(const Game& game) const {
    std::string path = layout_.iconPath(game);
    if (isRegularFile(path)) return path;
    return std::nullopt;
}

} // namespace iman
