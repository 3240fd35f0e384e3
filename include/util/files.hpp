#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace bh::util {

// "1.50 MB" style, base 1024
std::string formatSize(uintmax_t bytes);

// Walks up from path until an existing entry is found. Returns "/" (or the
// current directory for relative paths) when nothing along the way exists.
std::filesystem::path nearestExistingAncestor(const std::filesystem::path& path);

// Replaces characters that are unsafe in a single path component.
std::string sanitizeFilename(const std::string& name);

}
