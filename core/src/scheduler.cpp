#include <auroscuro/scheduler.h>
#include <chrono>
#include <iostream>

namespace auroscuro {

FrameScheduler::FrameScheduler(double fps)
    : m_fps(fps > 0.0 ? fps : 60.0) {
}

FrameScheduler::~FrameScheduler() {
    stop();
    // Destroyed from inside its own tick: the loop holds its own state and exits after the tick
    if (m_thread.joinable()) {
        m_thread.detach();
    }
}

bool FrameScheduler::start(TickCallback callback) {
    if (isRunning()) {
        return false;
    }

    // A loop that stopped itself from inside a tick leaves a finished thread
    joinWorker();

    auto state = std::make_shared<LoopState>();
    state->callback = std::move(callback);
    state->running = true;
    m_state = state;

    m_thread = std::thread(&FrameScheduler::loop, std::move(state), m_fps);
    return true;
}

void FrameScheduler::stop() {
    if (!m_state) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopRequested = true;
    }
    m_state->wake.notify_all();

    if (m_thread.joinable() && m_thread.get_id() == std::this_thread::get_id()) {
        return;
    }
    joinWorker();
}

void FrameScheduler::joinWorker() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

void FrameScheduler::loop(std::shared_ptr<LoopState> state, double fps) {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(1.0 / fps));
    const auto origin = clock::now();
    auto next = origin + period;

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->wake.wait_until(lock, next, [&state] { return state->stopRequested; });
            if (state->stopRequested) {
                break;
            }
        }

        double elapsedMs = std::chrono::duration<double, std::milli>(next - origin).count();
        try {
            state->callback(elapsedMs);
        } catch (const std::exception& e) {
            std::cerr << "[FrameScheduler] Tick failed: " << e.what() << std::endl;
        }
        state->tickCount++;

        // After an overrun, realign instead of firing a burst of late ticks
        next += period;
        auto now = clock::now();
        if (next < now) {
            next = now + period;
        }
    }

    state->running = false;
}

} // namespace auroscuro
