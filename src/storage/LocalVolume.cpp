#include "storage/Volume.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>
#include <sys/statvfs.h>
#include <unistd.h>

using namespace bh::storage;

namespace {

[[noreturn]] void throwErrno(const std::string& what, const fs::path& path, const int err) {
    throw fs::filesystem_error(what, path, std::error_code(err, std::generic_category()));
}

}

uintmax_t LocalVolume::freeSpace(const fs::path& path) const {
    const auto probe = bh::util::nearestExistingAncestor(path);

    struct statvfs st{};
    if (::statvfs(probe.c_str(), &st) < 0) throwErrno("statvfs failed", probe, errno);

    return static_cast<uintmax_t>(st.f_bavail) * static_cast<uintmax_t>(st.f_frsize);
}

bool LocalVolume::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalVolume::isReadable(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;
    const int mode = fs::is_directory(path, ec) ? (R_OK | X_OK) : R_OK;
    return ::access(path.c_str(), mode) == 0;
}

bool LocalVolume::isWritable(const fs::path& path) const {
    std::error_code ec;
    const auto target = bh::util::nearestExistingAncestor(path);
    if (!fs::is_directory(target, ec)) return false;
    return ::access(target.c_str(), W_OK | X_OK) == 0;
}

uintmax_t LocalVolume::fileSize(const fs::path& path) const {
    return fs::file_size(path);
}

std::optional<uintmax_t> LocalVolume::existingSize(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    const auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::optional<fs::file_time_type> LocalVolume::lastWriteTime(const fs::path& path) const {
    std::error_code ec;
    const auto time = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return time;
}

void LocalVolume::setLastWriteTime(const fs::path& path, const fs::file_time_type time) const {
    fs::last_write_time(path, time);
}

std::unique_ptr<std::istream> LocalVolume::openSource(const fs::path& path, const uint64_t offset) const {
    errno = 0;
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) throwErrno("Failed to open source", path, errno != 0 ? errno : EIO);

    in->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!*in) throwErrno("Failed to seek source", path, EIO);
    return in;
}

std::unique_ptr<std::ostream> LocalVolume::openDestination(const fs::path& path, const uint64_t offset) const {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    errno = 0;
    if (offset == 0) {
        auto out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
        if (!out->is_open()) throwErrno("Failed to open destination", path, errno != 0 ? errno : EIO);
        return out;
    }

    // in|out keeps existing content; no trunc
    auto out = std::make_unique<std::fstream>(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!out->is_open()) throwErrno("Failed to open destination", path, errno != 0 ? errno : EIO);

    out->seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!*out) throwErrno("Failed to seek destination", path, EIO);
    return out;
}
