#pragma once

/**
 * @file scheduler.h
 * @brief Fixed-rate ticking task on a dedicated thread
 *
 * Stand-in for a display's per-frame callback. Each tick runs to completion
 * before the next is scheduled; there is never more than one loop.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace auroscuro {

class FrameScheduler {
public:
    /// Called once per tick with the tick's scheduled time in ms since start()
    using TickCallback = std::function<void(double elapsedMs)>;

    explicit FrameScheduler(double fps = 60.0);
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    /**
     * @brief Start ticking
     * @return false if a loop is already running (the callback is not replaced)
     */
    bool start(TickCallback callback);

    /**
     * @brief Stop ticking and release the thread
     *
     * Cancels the pending tick. When called from outside the loop, returns
     * after the loop has exited, so no tick runs afterwards. When called from
     * inside a tick, the loop exits after that tick returns. The scheduler
     * may also be destroyed from inside its own tick.
     */
    void stop();

    bool isRunning() const { return m_state && m_state->running.load(); }

    /// @brief Ticks executed since the last start()
    uint64_t tickCount() const { return m_state ? m_state->tickCount.load() : 0; }

    double fps() const { return m_fps; }

private:
    /// Everything the worker touches; shared so the loop can outlive the scheduler
    struct LoopState {
        TickCallback callback;
        std::mutex mutex;
        std::condition_variable wake;
        bool stopRequested = false;
        std::atomic<bool> running{false};
        std::atomic<uint64_t> tickCount{0};
    };

    static void loop(std::shared_ptr<LoopState> state, double fps);
    void joinWorker();

    double m_fps;
    std::thread m_thread;
    std::shared_ptr<LoopState> m_state;
};

} // namespace auroscuro
