#include "types/Failure.hpp"

#include <nlohmann/json.hpp>

using namespace bh::types;

Failure::Category Failure::categoryOf(const Kind k) noexcept {
    switch (k) {
        case Kind::INSUFFICIENT_SPACE:
        case Kind::UNREACHABLE:
        case Kind::PERMISSION_DENIED: return Category::PREFLIGHT;
        case Kind::RESUME_MISMATCH: return Category::RESUME_MISMATCH;
        case Kind::TIMEOUT: return Category::TIMEOUT;
        case Kind::CANCELLED: return Category::CANCELLED;
        case Kind::TRANSFER_IO:
        default: return Category::TRANSFER;
    }
}

std::string_view Failure::toString(const Kind k) noexcept {
    switch (k) {
        case Kind::INSUFFICIENT_SPACE: return "insufficient_space";
        case Kind::UNREACHABLE: return "unreachable";
        case Kind::PERMISSION_DENIED: return "permission_denied";
        case Kind::TRANSFER_IO: return "transfer_io";
        case Kind::RESUME_MISMATCH: return "resume_mismatch";
        case Kind::TIMEOUT: return "timeout";
        case Kind::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::string_view Failure::toString(const Category c) noexcept {
    switch (c) {
        case Category::PREFLIGHT: return "PreflightFailure";
        case Category::TRANSFER: return "TransferFailure";
        case Category::RESUME_MISMATCH: return "ResumeMismatch";
        case Category::TIMEOUT: return "Timeout";
        case Category::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

void bh::types::to_json(nlohmann::json& j, const Failure& f) {
    j = {
        {"kind", std::string(Failure::toString(f.category()))},
        {"cause", std::string(Failure::toString(f.kind))},
        {"message", f.message}
    };
}
