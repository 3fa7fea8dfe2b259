#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace crosslock {

/**
 * @brief Source of the chain timestamp used for timelock checks
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now() const = 0;  // Unix seconds
};

class SystemClock : public Clock {
public:
    uint64_t now() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
    }
};

/**
 * @brief Manually advanced clock for simulations and tests
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start = 0) : now_(start) {}

    uint64_t now() const override { return now_; }
    void set(uint64_t t) { now_ = t; }
    void advance(uint64_t seconds) { now_ += seconds; }

private:
    std::atomic<uint64_t> now_;
};

} // namespace crosslock
