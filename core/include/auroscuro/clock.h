#pragma once

/**
 * @file clock.h
 * @brief Millisecond time sources for the frame pipeline
 *
 * Every component that needs "now" takes a Clock so the same pipeline can
 * run against wall time (live playback) or a stepped timeline (offline
 * rendering, tests).
 */

#include <atomic>
#include <chrono>

namespace auroscuro {

/// @brief Monotonic millisecond time source
class Clock {
public:
    virtual ~Clock() = default;

    /// @brief Current time in milliseconds (monotonic, arbitrary epoch)
    virtual double nowMs() const = 0;
};

/// @brief Wall clock backed by std::chrono::steady_clock, epoch at construction
class SteadyClock : public Clock {
public:
    SteadyClock() : m_start(std::chrono::steady_clock::now()) {}

    double nowMs() const override {
        auto elapsed = std::chrono::steady_clock::now() - m_start;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

private:
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief Clock that only moves when told to
 *
 * @par Example
 * @code
 * ManualClock clock;
 * clock.advance(1000.0 / 60.0);  // one 60 Hz frame
 * @endcode
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(double startMs = 0.0) : m_now(startMs) {}

    double nowMs() const override { return m_now.load(); }

    void set(double ms) { m_now.store(ms); }
    void advance(double ms) { m_now.store(m_now.load() + ms); }

private:
    std::atomic<double> m_now;
};

} // namespace auroscuro
