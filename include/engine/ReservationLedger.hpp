#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bh::engine {

// Space promised to running executions that has not been written yet.
// Shared by every execution in a pool; an out-of-process implementation can
// be injected when several pools share a host.
class ReservationLedger {
public:
    virtual ~ReservationLedger() = default;

    [[nodiscard]] virtual uintmax_t queryConcurrentReservations() const = 0;

    // Atomically checks freeBytes against everything already reserved by other
    // executions plus bytes plus minFree, and records the reservation on
    // success. A second call for the same execution replaces its reservation.
    [[nodiscard]] virtual bool reserveSpace(const std::string& executionId, uintmax_t bytes,
                                            uintmax_t freeBytes, uintmax_t minFree) = 0;

    virtual void releaseSpace(const std::string& executionId) = 0;
};

class InProcessReservationLedger final : public ReservationLedger {
public:
    [[nodiscard]] uintmax_t queryConcurrentReservations() const override;

    [[nodiscard]] bool reserveSpace(const std::string& executionId, uintmax_t bytes,
                                    uintmax_t freeBytes, uintmax_t minFree) override;

    void releaseSpace(const std::string& executionId) override;

    [[nodiscard]] uintmax_t reservedBy(const std::string& executionId) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uintmax_t> reservations_;
    uintmax_t total_{0};
};

}
