#include "types/Schedule.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace bh::types;
using namespace std::chrono;

void Schedule::validate() const {
    if (hour > 23) throw std::invalid_argument("schedule hour must be in [0, 23]");
    if (minute > 59) throw std::invalid_argument("schedule minute must be in [0, 59]");
    if (type == Type::MONTHLY && day == 0) throw std::invalid_argument("schedule day must be >= 1");
    if (type != Type::DAILY && !weekdays.empty())
        throw std::invalid_argument("schedule days only apply to daily schedules");
    for (const auto& d : weekdays)
        if (!d.ok()) throw std::invalid_argument("schedule day of week is out of range");
}

bool Schedule::runsOn(const sys_days d) const {
    if (weekdays.empty()) return true;
    return std::ranges::find(weekdays, weekday{d}) != weekdays.end();
}

std::optional<Schedule::time_point> Schedule::firstRun(const time_point now) const {
    if (type == Type::ONCE) return at && *at > now ? *at : now;
    return nextAfter(now);
}

std::optional<Schedule::time_point> Schedule::nextAfter(const time_point t) const {
    const auto timeOfDay = hours(hour) + minutes(minute);
    const sys_days today = floor<days>(t);

    switch (type) {
        case Type::ONCE:
            return std::nullopt;

        case Type::DAILY: {
            sys_days date = today;
            if (date + timeOfDay <= t) date += days(1);
            // At most a week ahead when only some weekdays are selected
            for (int i = 0; i < 7 && !runsOn(date); ++i) date += days(1);
            return date + timeOfDay;
        }

        case Type::MONTHLY: {
            const year_month_day ymd{today};
            const auto d = std::chrono::day{std::min(day, MAX_MONTH_DAY)};
            year_month ym{ymd.year(), ymd.month()};

            time_point candidate = sys_days{ym / d} + timeOfDay;
            if (candidate <= t) {
                ym += months(1);
                candidate = sys_days{ym / d} + timeOfDay;
            }
            return candidate;
        }
    }

    return std::nullopt;
}

std::string_view Schedule::toString(const Type t) noexcept {
    switch (t) {
        case Type::ONCE: return "once";
        case Type::DAILY: return "daily";
        case Type::MONTHLY: return "monthly";
        default: return "unknown";
    }
}

bool Schedule::tryParseType(const std::string_view in, Type& out) noexcept {
    if (in == "once") out = Type::ONCE;
    else if (in == "daily") out = Type::DAILY;
    else if (in == "monthly") out = Type::MONTHLY;
    else return false;
    return true;
}

std::string_view Schedule::weekdayName(const weekday d) noexcept {
    static constexpr std::string_view names[] = {
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
    };
    return d.ok() ? names[d.c_encoding()] : "unknown";
}

bool Schedule::tryParseWeekday(const std::string_view in, weekday& out) noexcept {
    for (unsigned int i = 0; i < 7; ++i) {
        if (weekdayName(weekday{i}) == in) {
            out = weekday{i};
            return true;
        }
    }
    return false;
}

void bh::types::to_json(nlohmann::json& j, const Schedule& s) {
    j = {
        {"type", std::string(Schedule::toString(s.type))},
        {"hour", s.hour},
        {"minute", s.minute}
    };
    if (s.type == Schedule::Type::MONTHLY) j["day"] = std::min(s.day, Schedule::MAX_MONTH_DAY);
    if (s.at) j["at"] = bh::util::timestampToString(*s.at);
    if (!s.weekdays.empty()) {
        std::vector<std::string> days;
        for (const auto& d : s.weekdays) days.emplace_back(Schedule::weekdayName(d));
        j["days"] = days;
    }
}
