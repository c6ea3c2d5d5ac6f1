#pragma once

#include <cstdint>
#include <string>

namespace iman {

// Ensure a directory exists, creating it (and parents) if necessary.
bool ensureDirectory(const std::string& path);
// Check if a path exists (file or directory).
bool fileExists(const std::string& path);
bool isDirectory(const std::string& path);
bool isRegularFile(const std::string& path);
// Best-effort free-space query for a path (bytes); 0 when unknown.
uint64_t getFreeSpace(const std::string& path);

bool readFile(const std::string& path, std::string& out, std::string& err);
// Write to "<path>.tmp" then rename over path, creating parent directories.
bool writeFileAtomic(const std::string& path, const std::string& data, std::string& err);
// Recursive delete. A missing path is success.
bool removeTree(const std::string& path, std::string& err);
// Best-effort single file delete; logs on failure.
void removeFileBestEffort(const std::string& path);

} // namespace iman
