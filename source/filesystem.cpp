#include "iman/filesystem.hpp"
#include "iman/logger.hpp"
#include "iman/raii.hpp"
#include <filesystem>
#include <sys/statvfs.h>

namespace iman {

namespace fs = std::filesystem;

bool ensureDirectory(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    bool ok = fs::create_directories(p, ec) || fs::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::path(path), ec);
}

bool isDirectory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

bool isRegularFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

uint64_t getFreeSpace(const std::string& path) {
    struct statvfs s{};
    if (statvfs(path.c_str(), &s) != 0) return 0;
    return static_cast<uint64_t>(s.f_bavail) * static_cast<uint64_t>(s.f_frsize);
}

bool readFile(const std::string& path, std::string& out, std::string& err) {
    out.clear();
    UniqueFile f(std::fopen(path.c_str(), "rb"));
    if (!f) {
        err = "Open failed: " + path;
        return false;
    }
    char buf[8192];
    for (;;) {
        size_t n = std::fread(buf, 1, sizeof(buf), f.f);
        if (n > 0) out.append(buf, n);
        if (n < sizeof(buf)) break;
    }
    if (std::ferror(f.f)) {
        err = "Read failed: " + path;
        return false;
    }
    return true;
}

bool writeFileAtomic(const std::string& path, const std::string& data, std::string& err) {
    fs::path target(path);
    if (target.has_parent_path() && !ensureDirectory(target.parent_path().string())) {
        err = "Mkdir failed: " + target.parent_path().string();
        return false;
    }
    const std::string tmp = path + ".tmp";
    {
        UniqueFile f(std::fopen(tmp.c_str(), "wb"));
        if (!f) {
            err = "Open failed: " + tmp;
            return false;
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.f) != data.size()) {
            f.close();
            removeFileBestEffort(tmp);
            err = "Write failed: " + tmp;
            return false;
        }
        if (!f.close()) {
            removeFileBestEffort(tmp);
            err = "Write failed (flush): " + tmp;
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        removeFileBestEffort(tmp);
        err = "Rename failed: " + path + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

bool removeTree(const std::string& path, std::string& err) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return true;
    fs::remove_all(path, ec);
    if (ec) {
        err = "Remove failed: " + path + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

void removeFileBestEffort(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) logWarn("Failed to remove " + path + ": " + ec.message(), "FS");
}

} // namespace iman
