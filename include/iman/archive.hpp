#pragma once

#include <cstdint>
#include <string>

namespace iman {

struct ExtractStats {
    size_t files{0};
    size_t directories{0};
    uint64_t bytes{0};     // uncompressed bytes written
};

// Extract a ZIP archive (stored/deflate entries) into outDir, verifying CRC-32
// of every file. Entries with absolute paths or ".." components, encrypted or
// ZIP64 archives and unknown compression methods fail the whole extraction.
// Partial output is left for the caller to clean up.
bool extractZip(const std::string& archivePath, const std::string& outDir,
                ExtractStats& stats, std::string& err);

} // namespace iman
