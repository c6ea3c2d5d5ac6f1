#include "iman/layout.hpp"
#include "iman/filesystem.hpp"
#include "iman/util.hpp"

namespace iman {

namespace {

std::string iconExtension(const std::string& url) {
    std::string path = url;
    auto q = path.find_first_of("?#");
    if (q != std::string::npos) path = path.substr(0, q);
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return ".png";
    std::string ext = util::toLower(path.substr(dot));
    if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".gif" || ext == ".bmp" || ext == ".webp")
        return ext;
    return ".png";
}

} // namespace

GameLayout::GameLayout(std::string dataPath) : dataPath_(std::move(dataPath)) {
    while (dataPath_.size() > 1 && dataPath_.back() == '/') dataPath_.pop_back();
    gamesRoot_ = dataPath_ + "/games";
    tempDir_ = dataPath_ + "/tmp";
    iconsDir_ = dataPath_ + "/icons";
    repositoriesDir_ = dataPath_ + "/repositories";
}

std::string GameLayout::logPath() const {
    return dataPath_ + "/insteadman.log";
}

std::string GameLayout::plainDirectory(const Game& game) const {
    return gamesRoot_ + "/" + util::safeName(game.name);
}

std::string GameLayout::qualifiedDirectory(const Game& game) const {
    return gamesRoot_ + "/" + util::safeName(game.name) + "@" + util::safeName(game.repositoryName);
}

std::optional<std::string> GameLayout::installDirectory(const Game& game) const {
    const std::string qualified = qualifiedDirectory(game);
    if (isDirectory(qualified)) return qualified;

    const std::string plain = plainDirectory(game);
    if (!isDirectory(plain)) return std::nullopt;
    // Unmarked directories (installed by hand or by an older manager) count for every repository.
    const std::string owner = readOwner(plain);
    if (owner.empty() || owner == game.repositoryName) return plain;
    return std::nullopt;
}

std::string GameLayout::targetDirectory(const Game& game) const {
    const std::string plain = plainDirectory(game);
    if (!isDirectory(plain)) return plain;
    const std::string owner = readOwner(plain);
    if (owner.empty() || owner == game.repositoryName) return plain;
    return qualifiedDirectory(game);
}

std::string GameLayout::iconPath(const Game& game) const {
    return iconsDir_ + "/" + util::safeName(game.repositoryName) + "_" + util::safeName(game.name) +
           iconExtension(game.imageUrl);
}

std::string GameLayout::indexCachePath(const std::string& repositoryName) const {
    return repositoriesDir_ + "/" + util::safeName(repositoryName) + ".index";
}

std::string GameLayout::readOwner(const std::string& dir) {
    const std::string marker = dir + "/" + kOwnerMarker;
    if (!isRegularFile(marker)) return {};
    std::string content, err;
    if (!readFile(marker, content, err)) return {};
    return util::trim(content);
}

bool GameLayout::writeOwner(const std::string& dir, const std::string& repositoryName, std::string& err) {
    return writeFileAtomic(dir + "/" + kOwnerMarker, repositoryName + "\n", err);
}

} // namespace iman
