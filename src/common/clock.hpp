#pragma once

#include <chrono>

namespace funtable {

// ── Clock ────────────────────────────────────────────────────────────────────
//
// Monotonic time source consulted by ReadCache when an entry is stored and
// again when it is looked up.  Only differences between two now() values are
// meaningful.

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SteadyClock ──────────────────────────────────────────────────────────────
//
// Default cache clock.  Monotonic, so expiry is unaffected by wall-clock jumps.

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Frozen until advance() is called; lets cache tests step past a TTL without
// sleeping.  Not synchronised: advance it only while no table is in use on
// another thread.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

private:
    time_point now_{};
};

// Wall-clock seconds since the Unix epoch, used for created_at / updated_at.
[[nodiscard]] inline double unix_now() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace funtable
