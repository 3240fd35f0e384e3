#pragma once

#include "types/Failure.hpp"
#include "types/TransferUnit.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>

namespace bh::storage { class Volume; }

namespace bh::engine {

using CancelToken = std::shared_ptr<std::atomic<bool>>;

struct TransferRequest {
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t length{0};          // bytes expected from the source
    uint64_t chunk_size{0};
    uint64_t resume_offset{0};   // destination must already hold exactly this many bytes
    bool checksum{false};
    std::size_t file_index{0};
};

// Copies one file as a lazy sequence of chunks. Each call to next() moves at
// most one chunk and returns the unit describing it. The sequence ends with
// std::nullopt once the file is complete, cancelled or failed; inspect state()
// and failure() to tell which. Not restartable: a new attempt builds a new engine.
class TransferEngine {
public:
    enum class State { IDLE, ACTIVE, COMPLETE, FAILED, CANCELLED };

    TransferEngine(std::shared_ptr<storage::Volume> volume, TransferRequest request, CancelToken cancelToken);

    [[nodiscard]] std::optional<types::TransferUnit> next();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool done() const noexcept { return state_ == State::COMPLETE; }
    [[nodiscard]] bool cancelled() const noexcept { return state_ == State::CANCELLED; }

    // Bytes known to be written and flushed to the destination, in file offsets
    [[nodiscard]] uint64_t flushedOffset() const noexcept { return flushedOffset_; }

    [[nodiscard]] const std::optional<types::Failure>& failure() const noexcept { return failure_; }

    [[nodiscard]] const TransferRequest& request() const noexcept { return request_; }

private:
    std::shared_ptr<storage::Volume> volume_;
    TransferRequest request_;
    CancelToken cancelToken_;

    State state_{State::IDLE};
    uint64_t offset_{0};
    uint64_t flushedOffset_{0};
    std::optional<types::Failure> failure_;

    std::unique_ptr<std::istream> in_;
    std::unique_ptr<std::ostream> out_;
    std::vector<char> buffer_;

    bool open();
    void fail(types::Failure::Kind kind, std::string message);
    [[nodiscard]] bool cancelRequested() const noexcept;
};

}
