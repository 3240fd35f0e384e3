#include "engine/ReservationLedger.hpp"

using namespace bh::engine;

uintmax_t InProcessReservationLedger::queryConcurrentReservations() const {
    std::scoped_lock lock(mutex_);
    return total_;
}

bool InProcessReservationLedger::reserveSpace(const std::string& executionId, const uintmax_t bytes,
                                              const uintmax_t freeBytes, const uintmax_t minFree) {
    std::scoped_lock lock(mutex_);

    const auto it = reservations_.find(executionId);
    const uintmax_t own = it != reservations_.end() ? it->second : 0;
    const uintmax_t others = total_ - own;

    // free - others - bytes >= minFree, written to avoid unsigned wraparound
    if (freeBytes < others) return false;
    const uintmax_t available = freeBytes - others;
    if (available < bytes || available - bytes < minFree) return false;

    total_ = others + bytes;
    reservations_[executionId] = bytes;
    return true;
}

void InProcessReservationLedger::releaseSpace(const std::string& executionId) {
    std::scoped_lock lock(mutex_);
    const auto it = reservations_.find(executionId);
    if (it == reservations_.end()) return;
    total_ -= it->second;
    reservations_.erase(it);
}

uintmax_t InProcessReservationLedger::reservedBy(const std::string& executionId) const {
    std::scoped_lock lock(mutex_);
    const auto it = reservations_.find(executionId);
    return it != reservations_.end() ? it->second : 0;
}
