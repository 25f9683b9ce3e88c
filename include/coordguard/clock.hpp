#pragma once

#include "coordguard/types.hpp"

#include <mutex>

namespace coordguard {

// Source of wall-clock time for event timestamps and cache expiry
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Manually driven clock for deterministic tests
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 1'700'000'000.0);

    Timestamp now() const override;
    void set(Timestamp t);
    void advance(Seconds delta);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace coordguard
