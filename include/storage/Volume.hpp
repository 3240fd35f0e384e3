#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>

namespace fs = std::filesystem;

namespace bh::storage {

// Filesystem operations the engine performs. LocalVolume is the production
// implementation; the seam exists so volumes with other space/IO behaviour
// can be substituted.
class Volume {
public:
    virtual ~Volume() = default;

    // Bytes available to an unprivileged writer on the volume holding path
    [[nodiscard]] virtual uintmax_t freeSpace(const fs::path& path) const = 0;

    [[nodiscard]] virtual bool exists(const fs::path& path) const = 0;
    [[nodiscard]] virtual bool isReadable(const fs::path& path) const = 0;

    // True when path (or its nearest existing ancestor) accepts new entries
    [[nodiscard]] virtual bool isWritable(const fs::path& path) const = 0;

    // Throws fs::filesystem_error when the file cannot be stat'ed
    [[nodiscard]] virtual uintmax_t fileSize(const fs::path& path) const = 0;

    [[nodiscard]] virtual std::optional<uintmax_t> existingSize(const fs::path& path) const = 0;

    // Nullopt when the path does not exist or cannot be stat'ed
    [[nodiscard]] virtual std::optional<fs::file_time_type> lastWriteTime(const fs::path& path) const = 0;

    // Throws fs::filesystem_error on failure
    virtual void setLastWriteTime(const fs::path& path, fs::file_time_type time) const = 0;

    // Source stream positioned at offset. Throws fs::filesystem_error on failure.
    [[nodiscard]] virtual std::unique_ptr<std::istream> openSource(const fs::path& path, uint64_t offset) const = 0;

    // Destination stream positioned at offset; truncates when offset is zero.
    // Creates missing parent directories. Throws fs::filesystem_error on failure.
    [[nodiscard]] virtual std::unique_ptr<std::ostream> openDestination(const fs::path& path, uint64_t offset) const = 0;
};

class LocalVolume : public Volume {
public:
    LocalVolume() = default;
    ~LocalVolume() override = default;

    [[nodiscard]] uintmax_t freeSpace(const fs::path& path) const override;
    [[nodiscard]] bool exists(const fs::path& path) const override;
    [[nodiscard]] bool isReadable(const fs::path& path) const override;
    [[nodiscard]] bool isWritable(const fs::path& path) const override;
    [[nodiscard]] uintmax_t fileSize(const fs::path& path) const override;
    [[nodiscard]] std::optional<uintmax_t> existingSize(const fs::path& path) const override;
    [[nodiscard]] std::optional<fs::file_time_type> lastWriteTime(const fs::path& path) const override;
    void setLastWriteTime(const fs::path& path, fs::file_time_type time) const override;
    [[nodiscard]] std::unique_ptr<std::istream> openSource(const fs::path& path, uint64_t offset) const override;
    [[nodiscard]] std::unique_ptr<std::ostream> openDestination(const fs::path& path, uint64_t offset) const override;
};

}
