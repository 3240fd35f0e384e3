#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

namespace bh::types { struct JobSpec; }
namespace bh::storage { class Volume; }

namespace bh::engine {

struct ManifestEntry {
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t size{0};
    std::filesystem::file_time_type modified{}; // source mtime, carried over to the destination
};

// Ordered list of files an execution copies. The files are treated as one
// contiguous byte stream so that a single offset describes durable progress.
struct Manifest {
    std::vector<ManifestEntry> entries;

    [[nodiscard]] uint64_t totalBytes() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    // Offset of the first byte of entries[index] in the stream
    [[nodiscard]] uint64_t startOffset(std::size_t index) const noexcept;

    // Maps a stream offset to (entry index, offset within entry). An offset at
    // or past the end maps to (size(), 0).
    [[nodiscard]] std::pair<std::size_t, uint64_t> locate(uint64_t offset) const noexcept;
};

// Expands directory sources recursively (sorted, regular files only). A
// directory source "a/docs" lands under destination/docs, a file source under
// destination/<file name>. Incremental jobs leave out files whose destination
// is at least as new as the source. Throws fs::filesystem_error on unreadable trees.
Manifest resolveManifest(const types::JobSpec& spec, const storage::Volume& volume);

// Same file set as `pinned` with sizes and times re-read from the volume.
// Throws fs::filesystem_error when a file has gone away.
Manifest refreshManifest(const Manifest& pinned, const storage::Volume& volume);

}
