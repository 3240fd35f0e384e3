#include "engine/Manifest.hpp"
#include "storage/Volume.hpp"
#include "types/JobSpec.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

using namespace bh::engine;

uint64_t Manifest::totalBytes() const noexcept {
    uint64_t total = 0;
    for (const auto& e : entries) total += e.size;
    return total;
}

uint64_t Manifest::startOffset(const std::size_t index) const noexcept {
    uint64_t offset = 0;
    for (std::size_t i = 0; i < index && i < entries.size(); ++i) offset += entries[i].size;
    return offset;
}

std::pair<std::size_t, uint64_t> Manifest::locate(const uint64_t offset) const noexcept {
    uint64_t start = 0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto end = start + entries[i].size;
        if (offset < end) return {i, offset - start};
        start = end;
    }
    return {entries.size(), 0};
}

namespace {

fs::file_time_type modifiedTime(const bh::storage::Volume& volume, const fs::path& path) {
    const auto time = volume.lastWriteTime(path);
    if (!time) throw fs::filesystem_error("Failed to read modification time", path,
                                          std::make_error_code(std::errc::no_such_file_or_directory));
    return *time;
}

bool upToDate(const ManifestEntry& entry, const bh::storage::Volume& volume) {
    const auto existing = volume.lastWriteTime(entry.destination);
    return existing && *existing >= entry.modified;
}

}

Manifest bh::engine::resolveManifest(const types::JobSpec& spec, const storage::Volume& volume) {
    Manifest manifest;

    const auto add = [&](const fs::path& file, const fs::path& destination) {
        manifest.entries.push_back({file, destination, volume.fileSize(file), modifiedTime(volume, file)});
    };

    for (const auto& source : spec.sources) {
        if (!fs::is_directory(source)) {
            add(source, spec.destination / source.filename());
            continue;
        }

        const auto root = source.has_filename() ? source : source.parent_path();
        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(source))
            if (entry.is_regular_file()) files.push_back(entry.path());

        std::ranges::sort(files);

        for (const auto& file : files) add(file, spec.destination / root.filename() / fs::relative(file, source));
    }

    if (spec.type == types::JobSpec::Type::INCREMENTAL)
        std::erase_if(manifest.entries, [&](const ManifestEntry& e) { return upToDate(e, volume); });

    return manifest;
}

Manifest bh::engine::refreshManifest(const Manifest& pinned, const storage::Volume& volume) {
    Manifest manifest;
    manifest.entries.reserve(pinned.size());
    for (const auto& e : pinned.entries)
        manifest.entries.push_back({e.source, e.destination, volume.fileSize(e.source), modifiedTime(volume, e.source)});
    return manifest;
}
