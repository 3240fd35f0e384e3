#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace bh::types {

// Recurrence for scheduled jobs. All wall-clock values are UTC.
struct Schedule {
    using time_point = std::chrono::system_clock::time_point;

    enum class Type : uint8_t {
        ONCE,
        DAILY,
        MONTHLY
    };

    static constexpr unsigned int MAX_MONTH_DAY = 28;

    Type type{Type::ONCE};
    unsigned int hour{0};
    unsigned int minute{0};
    unsigned int day{1};         // MONTHLY only, clamped to MAX_MONTH_DAY
    std::optional<time_point> at; // ONCE only; unset means "as soon as registered"
    std::vector<std::chrono::weekday> weekdays; // DAILY only; empty means every day

    void validate() const;

    // First due time for a freshly registered schedule
    [[nodiscard]] std::optional<time_point> firstRun(time_point now) const;

    // Next due time strictly after t, or nullopt when the schedule is exhausted
    [[nodiscard]] std::optional<time_point> nextAfter(time_point t) const;

    static std::string_view toString(Type t) noexcept;
    static bool tryParseType(std::string_view in, Type& out) noexcept;

    static std::string_view weekdayName(std::chrono::weekday d) noexcept;
    static bool tryParseWeekday(std::string_view in, std::chrono::weekday& out) noexcept;

private:
    [[nodiscard]] bool runsOn(std::chrono::sys_days d) const;
};

void to_json(nlohmann::json& j, const Schedule& s);

}
