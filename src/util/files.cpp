#include "util/files.hpp"

#include <array>
#include <fmt/core.h>

namespace fs = std::filesystem;

std::string bh::util::formatSize(const uintmax_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    for (const auto* unit : units) {
        if (size < 1024.0) return fmt::format("{:.2f} {}", size, unit);
        size /= 1024.0;
    }
    return fmt::format("{:.2f} PB", size);
}

fs::path bh::util::nearestExistingAncestor(const fs::path& path) {
    std::error_code ec;
    auto current = path.lexically_normal();
    while (!current.empty()) {
        if (fs::exists(current, ec)) return current;
        if (!current.has_parent_path() || current.parent_path() == current) break;
        current = current.parent_path();
    }
    return path.is_absolute() ? fs::path("/") : fs::current_path();
}

std::string bh::util::sanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        if (c == '/' || c == '\\' || c == '\0' || c == ':') out += '_';
        else out += c;
    }
    return out.empty() ? std::string("_") : out;
}
