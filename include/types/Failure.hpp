#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <nlohmann/json_fwd.hpp>

namespace bh::types {

// Typed failure handed from preflight/transfer back to the execution worker.
struct Failure {
    enum class Kind : uint8_t {
        INSUFFICIENT_SPACE,
        UNREACHABLE,
        PERMISSION_DENIED,
        TRANSFER_IO,
        RESUME_MISMATCH,
        TIMEOUT,
        CANCELLED
    };

    // Machine-readable class reported with every terminal outcome
    enum class Category : uint8_t {
        PREFLIGHT,
        TRANSFER,
        RESUME_MISMATCH,
        TIMEOUT,
        CANCELLED
    };

    Kind kind{Kind::TRANSFER_IO};
    std::string message;

    Failure() = default;
    Failure(const Kind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] Category category() const noexcept { return categoryOf(kind); }

    static Category categoryOf(Kind k) noexcept;

    static std::string_view toString(Kind k) noexcept;
    static std::string_view toString(Category c) noexcept;
};

void to_json(nlohmann::json& j, const Failure& f);

}
