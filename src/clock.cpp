#include "coordguard/clock.hpp"

#include <chrono>

namespace coordguard {

Timestamp SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
}

void ManualClock::advance(Seconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

} // namespace coordguard
