#include "iman/archive.hpp"
#include "iman/filesystem.hpp"
#include "iman/logger.hpp"
#include "iman/raii.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>
#include <sys/stat.h>
#include <sys/types.h>
#include <zlib.h>

namespace iman {

namespace {

constexpr uint32_t kLocalSig   = 0x04034b50;
constexpr uint32_t kCentralSig = 0x02014b50;
constexpr uint32_t kEocdSig    = 0x06054b50;
constexpr uint32_t kZip64LocatorSig = 0x07064b50;
constexpr uint16_t kMethodStored  = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr size_t kIoChunk = 64 * 1024;

struct CentralEntry {
    uint16_t versionMade{0};
    uint16_t flags{0};
    uint16_t method{0};
    uint32_t crc{0};
    uint32_t compSize{0};
    uint32_t uncompSize{0};
    uint32_t extAttr{0};
    uint32_t localOffset{0};
    std::string name;
};

bool readU16(FILE* f, uint16_t& out) {
    uint8_t b[2];
    if (std::fread(b, 1, 2, f) != 2) return false;
    out = static_cast<uint16_t>(b[0] | (b[1] << 8));
    return true;
}

bool readU32(FILE* f, uint32_t& out) {
    uint8_t b[4];
    if (std::fread(b, 1, 4, f) != 4) return false;
    out = static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
          (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
    return true;
}

bool findEndOfCentralDirectory(FILE* f, off_t& cdOffset, uint16_t& entries, std::string& err) {
    if (fseeko(f, 0, SEEK_END) != 0) {
        err = "Zip seek failed";
        return false;
    }
    const off_t fileSize = ftello(f);
    if (fileSize < 22) {
        err = "Not a zip archive (too small)";
        return false;
    }
    const off_t searchStart = std::max<off_t>(0, fileSize - 65535 - 22);
    for (off_t pos = fileSize - 22; pos >= searchStart; --pos) {
        if (fseeko(f, pos, SEEK_SET) != 0) break;
        uint32_t sig = 0;
        if (!readU32(f, sig) || sig != kEocdSig) continue;

        uint16_t disk = 0, diskCd = 0, entriesDisk = 0;
        uint32_t cdSize = 0, cdOfs = 0;
        if (!readU16(f, disk) || !readU16(f, diskCd) || !readU16(f, entriesDisk) ||
            !readU16(f, entries) || !readU32(f, cdSize) || !readU32(f, cdOfs)) {
            err = "Zip end of central directory truncated";
            return false;
        }
        if (disk != 0 || diskCd != 0 || entriesDisk != entries) {
            err = "Multi-volume zip archives are not supported";
            return false;
        }
        // A ZIP64 locator sits right before the EOCD record.
        if (pos >= 20) {
            uint32_t locSig = 0;
            if (fseeko(f, pos - 20, SEEK_SET) == 0 && readU32(f, locSig) && locSig == kZip64LocatorSig) {
                err = "ZIP64 archives are not supported";
                return false;
            }
        }
        if (entries == 0xFFFF || cdOfs == 0xFFFFFFFFu) {
            err = "ZIP64 archives are not supported";
            return false;
        }
        if (static_cast<off_t>(cdOfs) + static_cast<off_t>(cdSize) > pos) {
            err = "Corrupt zip: central directory out of bounds";
            return false;
        }
        cdOffset = static_cast<off_t>(cdOfs);
        return true;
    }
    err = "Not a zip archive (end of central directory not found)";
    return false;
}

bool readCentralDirectory(FILE* f, off_t cdOffset, uint16_t entries,
                          std::vector<CentralEntry>& out, std::string& err) {
    if (fseeko(f, cdOffset, SEEK_SET) != 0) {
        err = "Zip seek failed";
        return false;
    }
    out.clear();
    out.reserve(entries);
    for (uint16_t i = 0; i < entries; ++i) {
        CentralEntry ce;
        uint32_t sig = 0;
        uint16_t versionNeeded = 0, modTime = 0, modDate = 0;
        uint16_t nameLen = 0, extraLen = 0, commentLen = 0, diskStart = 0, intAttr = 0;
        if (!readU32(f, sig) || sig != kCentralSig) {
            err = "Corrupt zip: bad central directory entry";
            return false;
        }
        if (!readU16(f, ce.versionMade) || !readU16(f, versionNeeded) || !readU16(f, ce.flags) ||
            !readU16(f, ce.method) || !readU16(f, modTime) || !readU16(f, modDate) ||
            !readU32(f, ce.crc) || !readU32(f, ce.compSize) || !readU32(f, ce.uncompSize) ||
            !readU16(f, nameLen) || !readU16(f, extraLen) || !readU16(f, commentLen) ||
            !readU16(f, diskStart) || !readU16(f, intAttr) || !readU32(f, ce.extAttr) ||
            !readU32(f, ce.localOffset)) {
            err = "Corrupt zip: central directory truncated";
            return false;
        }
        ce.name.resize(nameLen);
        if (nameLen && std::fread(&ce.name[0], 1, nameLen, f) != nameLen) {
            err = "Corrupt zip: entry name truncated";
            return false;
        }
        if (fseeko(f, static_cast<off_t>(extraLen) + commentLen, SEEK_CUR) != 0) {
            err = "Corrupt zip: central directory truncated";
            return false;
        }
        if (ce.compSize == 0xFFFFFFFFu || ce.uncompSize == 0xFFFFFFFFu || ce.localOffset == 0xFFFFFFFFu) {
            err = "ZIP64 archives are not supported";
            return false;
        }
        out.push_back(std::move(ce));
    }
    return true;
}

// Normalise an entry name to a relative path; rejects absolute and ".." paths.
bool sanitizeEntryName(const std::string& raw, std::string& out) {
    std::string s = raw;
    std::replace(s.begin(), s.end(), '\\', '/');
    if (s.find('\0') != std::string::npos) return false;
    if (!s.empty() && s.front() == '/') return false;
    if (s.size() >= 2 && s[1] == ':') return false;

    out.clear();
    size_t start = 0;
    while (start <= s.size()) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) slash = s.size();
        std::string part = s.substr(start, slash - start);
        start = slash + 1;
        if (part.empty() || part == ".") continue;
        if (part == "..") return false;
        if (!out.empty()) out.push_back('/');
        out += part;
    }
    return true;
}

bool parentDirFor(const std::string& path, std::string& err) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return true;
    const std::string dir = path.substr(0, slash);
    if (!isDirectory(dir) && !ensureDirectory(dir)) {
        err = "Mkdir failed: " + dir;
        return false;
    }
    return true;
}

bool extractEntry(FILE* f, const CentralEntry& ce, const std::string& outPath,
                  ExtractStats& stats, std::string& err) {
    if (fseeko(f, static_cast<off_t>(ce.localOffset), SEEK_SET) != 0) {
        err = "Zip seek failed";
        return false;
    }
    uint32_t sig = 0;
    uint16_t version = 0, flags = 0, method = 0, modTime = 0, modDate = 0, nameLen = 0, extraLen = 0;
    uint32_t crc = 0, compSize = 0, uncompSize = 0;
    if (!readU32(f, sig) || sig != kLocalSig || !readU16(f, version) || !readU16(f, flags) ||
        !readU16(f, method) || !readU16(f, modTime) || !readU16(f, modDate) || !readU32(f, crc) ||
        !readU32(f, compSize) || !readU32(f, uncompSize) || !readU16(f, nameLen) || !readU16(f, extraLen)) {
        err = "Corrupt zip: bad local header for " + ce.name;
        return false;
    }
    if (fseeko(f, static_cast<off_t>(nameLen) + extraLen, SEEK_CUR) != 0) {
        err = "Corrupt zip: local header truncated for " + ce.name;
        return false;
    }

    if (!parentDirFor(outPath, err)) return false;
    UniqueFile out(std::fopen(outPath.c_str(), "wb"));
    if (!out) {
        err = "Open failed: " + outPath;
        return false;
    }

    std::vector<unsigned char> inBuf(kIoChunk);
    std::vector<unsigned char> outBuf(kIoChunk);
    uLong runningCrc = crc32(0L, Z_NULL, 0);
    uint64_t written = 0;
    uint64_t remaining = ce.compSize;

    auto writeOut = [&](const unsigned char* data, size_t len) {
        if (len == 0) return true;
        if (len > ce.uncompSize - written) {
            err = "Corrupt zip: entry larger than declared size for " + ce.name;
            return false;
        }
        if (std::fwrite(data, 1, len, out.f) != len) {
            err = "Write failed: " + outPath;
            return false;
        }
        runningCrc = crc32(runningCrc, data, static_cast<uInt>(len));
        written += len;
        return true;
    };

    if (ce.method == kMethodStored) {
        while (remaining > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, kIoChunk));
            if (std::fread(inBuf.data(), 1, want, f) != want) {
                err = "Corrupt zip: entry data truncated for " + ce.name;
                return false;
            }
            remaining -= want;
            if (!writeOut(inBuf.data(), want)) return false;
        }
    } else {
        z_stream strm{};
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
            err = "Zip inflate init failed";
            return false;
        }
        auto endInflate = make_scope_guard([&strm]() { inflateEnd(&strm); });
        bool streamEnd = false;
        while (remaining > 0 && !streamEnd) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, kIoChunk));
            if (std::fread(inBuf.data(), 1, want, f) != want) {
                err = "Corrupt zip: entry data truncated for " + ce.name;
                return false;
            }
            remaining -= want;
            strm.next_in = inBuf.data();
            strm.avail_in = static_cast<uInt>(want);
            while (strm.avail_in > 0 && !streamEnd) {
                strm.next_out = outBuf.data();
                strm.avail_out = static_cast<uInt>(outBuf.size());
                int zr = inflate(&strm, Z_NO_FLUSH);
                if (zr != Z_OK && zr != Z_STREAM_END) {
                    err = "Corrupt zip: inflate error for " + ce.name;
                    return false;
                }
                if (!writeOut(outBuf.data(), outBuf.size() - strm.avail_out)) return false;
                if (zr == Z_STREAM_END) streamEnd = true;
                else if (strm.avail_out != 0 && strm.avail_in == 0) break;
            }
        }
        // Drain any output still buffered inside zlib.
        while (!streamEnd) {
            strm.next_out = outBuf.data();
            strm.avail_out = static_cast<uInt>(outBuf.size());
            int zr = inflate(&strm, Z_SYNC_FLUSH);
            if (zr != Z_OK && zr != Z_STREAM_END && zr != Z_BUF_ERROR) {
                err = "Corrupt zip: inflate error for " + ce.name;
                return false;
            }
            size_t have = outBuf.size() - strm.avail_out;
            if (!writeOut(outBuf.data(), have)) return false;
            if (zr == Z_STREAM_END) streamEnd = true;
            else if (have == 0) break;
        }
        if (!streamEnd) {
            err = "Corrupt zip: deflate stream truncated for " + ce.name;
            return false;
        }
    }

    if (!out.close()) {
        err = "Write failed: " + outPath;
        return false;
    }
    if (written != ce.uncompSize) {
        err = "Corrupt zip: size mismatch for " + ce.name;
        return false;
    }
    if (static_cast<uint32_t>(runningCrc) != ce.crc) {
        err = "Corrupt zip: CRC mismatch for " + ce.name;
        return false;
    }

    // Keep unix permission bits (game launch scripts) when the archive carries them.
    if ((ce.versionMade >> 8) == 3) {
        mode_t mode = static_cast<mode_t>((ce.extAttr >> 16) & 0777);
        if (mode != 0) ::chmod(outPath.c_str(), mode | S_IRUSR | S_IWUSR);
    }
    stats.files++;
    stats.bytes += written;
    return true;
}

} // namespace

bool extractZip(const std::string& archivePath, const std::string& outDir,
                ExtractStats& stats, std::string& err) {
    stats = ExtractStats{};
    UniqueFile f(std::fopen(archivePath.c_str(), "rb"));
    if (!f) {
        err = "Open failed: archive " + archivePath;
        return false;
    }
    off_t cdOffset = 0;
    uint16_t entries = 0;
    if (!findEndOfCentralDirectory(f.f, cdOffset, entries, err)) return false;

    std::vector<CentralEntry> central;
    if (!readCentralDirectory(f.f, cdOffset, entries, central, err)) return false;

    if (!ensureDirectory(outDir)) {
        err = "Mkdir failed: " + outDir;
        return false;
    }

    for (const auto& ce : central) {
        std::string rel;
        if (!sanitizeEntryName(ce.name, rel)) {
            err = "Unsafe path in zip archive: " + ce.name;
            return false;
        }
        if (ce.flags & kFlagEncrypted) {
            err = "Encrypted zip entries are not supported: " + ce.name;
            return false;
        }
        const bool isDir = !ce.name.empty() && (ce.name.back() == '/' || ce.name.back() == '\\');
        if (isDir || rel.empty()) {
            if (rel.empty()) continue;
            if (!ensureDirectory(outDir + "/" + rel)) {
                err = "Mkdir failed: " + outDir + "/" + rel;
                return false;
            }
            stats.directories++;
            continue;
        }
        if ((ce.versionMade >> 8) == 3 && S_ISLNK(static_cast<mode_t>(ce.extAttr >> 16))) {
            logWarn("Skipping symlink entry in archive: " + ce.name, "ZIP");
            continue;
        }
        if (ce.method != kMethodStored && ce.method != kMethodDeflate) {
            err = "Unsupported zip compression method " + std::to_string(ce.method) + " for " + ce.name;
            return false;
        }
        if (!extractEntry(f.f, ce, outDir + "/" + rel, stats, err)) return false;
    }

    logDebug("Extracted " + std::to_string(stats.files) + " files (" + std::to_string(stats.bytes) +
             " bytes) -> " + outDir, "ZIP");
    return true;
}

} // namespace iman
