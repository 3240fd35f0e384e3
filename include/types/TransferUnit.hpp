#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace bh::types {

// One chunk moved by the transfer engine. Offsets are relative to the
// execution's byte stream once recorded by the worker.
struct TransferUnit {
    uint64_t offset{0};
    uint64_t length{0};
    std::optional<uint32_t> checksum; // CRC-32 of the chunk when enabled
    bool success{true};
    std::size_t file_index{0};

    [[nodiscard]] uint64_t end() const noexcept { return offset + length; }
};

}
