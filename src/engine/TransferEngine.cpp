#include "engine/TransferEngine.hpp"
#include "storage/Volume.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <boost/crc.hpp>
#include <fmt/core.h>

using namespace bh::engine;
using namespace bh::types;
using namespace bh::logging;

TransferEngine::TransferEngine(std::shared_ptr<storage::Volume> volume, TransferRequest request, CancelToken cancelToken)
    : volume_(std::move(volume)), request_(std::move(request)), cancelToken_(std::move(cancelToken)) {
    if (!volume_) throw std::invalid_argument("TransferEngine requires a volume");
    if (request_.chunk_size == 0) throw std::invalid_argument("Chunk size must be greater than zero");
    offset_ = flushedOffset_ = request_.resume_offset;
}

bool TransferEngine::cancelRequested() const noexcept {
    return cancelToken_ && cancelToken_->load();
}

void TransferEngine::fail(const Failure::Kind kind, std::string message) {
    LogRegistry::transfer()->error("[TransferEngine] {} -> {} failed at offset {}: {}",
                                   request_.source.string(), request_.destination.string(), flushedOffset_, message);
    failure_ = Failure{kind, std::move(message)};
    state_ = State::FAILED;
    in_.reset();
    out_.reset();
}

bool TransferEngine::open() {
    const auto resume = request_.resume_offset;

    if (resume > request_.length) {
        fail(Failure::Kind::RESUME_MISMATCH,
             fmt::format("Resume offset {} is beyond the source length {}", resume, request_.length));
        return false;
    }

    if (resume > 0) {
        const auto existing = volume_->existingSize(request_.destination);
        if (!existing || *existing != resume) {
            fail(Failure::Kind::RESUME_MISMATCH,
                 fmt::format("Destination holds {} bytes, expected {} to resume",
                             existing ? std::to_string(*existing) : std::string("no"), resume));
            return false;
        }
    }

    try {
        in_ = volume_->openSource(request_.source, resume);
    } catch (const std::filesystem::filesystem_error& e) {
        fail(Failure::Kind::TRANSFER_IO, fmt::format("Failed to open source: {}", e.what()));
        return false;
    }

    try {
        out_ = volume_->openDestination(request_.destination, resume);
    } catch (const std::filesystem::filesystem_error& e) {
        const auto kind = e.code() == std::errc::permission_denied
                              ? Failure::Kind::PERMISSION_DENIED
                              : Failure::Kind::TRANSFER_IO;
        fail(kind, fmt::format("Failed to open destination: {}", e.what()));
        return false;
    }

    buffer_.resize(static_cast<std::size_t>(std::min(request_.chunk_size, std::max<uint64_t>(request_.length, 1))));
    state_ = State::ACTIVE;

    if (resume > 0)
        LogRegistry::transfer()->debug("[TransferEngine] Resuming {} at offset {}", request_.source.string(), resume);

    return true;
}

std::optional<TransferUnit> TransferEngine::next() {
    if (state_ == State::COMPLETE || state_ == State::FAILED || state_ == State::CANCELLED) return std::nullopt;

    if (cancelRequested()) {
        state_ = State::CANCELLED;
        in_.reset();
        out_.reset();
        return std::nullopt;
    }

    if (state_ == State::IDLE && !open()) return std::nullopt;

    if (offset_ >= request_.length) {
        out_->flush();
        if (!*out_) {
            fail(Failure::Kind::TRANSFER_IO, "Failed to flush destination");
            return std::nullopt;
        }
        state_ = State::COMPLETE;
        in_.reset();
        out_.reset();
        return std::nullopt;
    }

    const auto want = std::min<uint64_t>(request_.chunk_size, request_.length - offset_);

    TransferUnit unit;
    unit.offset = offset_;
    unit.length = want;
    unit.file_index = request_.file_index;

    in_->read(buffer_.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<uint64_t>(in_->gcount());
    if (got != want) {
        unit.success = false;
        fail(Failure::Kind::TRANSFER_IO,
             fmt::format("Short read from source: got {} of {} bytes at offset {}", got, want, offset_));
        return unit;
    }

    out_->write(buffer_.data(), static_cast<std::streamsize>(want));
    out_->flush();
    if (!*out_) {
        unit.success = false;
        fail(Failure::Kind::TRANSFER_IO, fmt::format("Write to destination failed at offset {}", offset_));
        return unit;
    }

    if (request_.checksum) {
        boost::crc_32_type crc;
        crc.process_bytes(buffer_.data(), static_cast<std::size_t>(want));
        unit.checksum = crc.checksum();
    }

    offset_ += want;
    flushedOffset_ = offset_;
    return unit;
}
