#pragma once

/**
 * @file async_resource.h
 * @brief Background loading with results consumed at tick boundaries
 *
 * A load runs on its own worker thread and publishes into a mailbox shared
 * with the owner. The owner only sees the result when it calls poll(), so the
 * render path never waits on I/O. Superseded loads and loads that finish
 * after the owner is gone are dropped.
 */

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace auroscuro {

/// @brief What a failed load does to the current value
enum class LoadFailurePolicy {
    KeepPrevious,  ///< Keep showing the last good value
    Clear          ///< Drop to "absent"
};

/**
 * @brief Single-value slot filled by asynchronous loads
 * @tparam T Loaded value type; must provide `bool valid() const`
 *
 * @par Example
 * @code
 * AsyncResource<io::ImageData> background(LoadFailurePolicy::KeepPrevious);
 * background.load([path] { return io::loadImage(path); });
 *
 * // once per tick:
 * background.poll();
 * if (auto img = background.current()) draw(*img);
 * @endcode
 */
template <typename T>
class AsyncResource {
public:
    using Producer = std::function<T()>;

    explicit AsyncResource(LoadFailurePolicy policy = LoadFailurePolicy::Clear)
        : m_policy(policy)
        , m_mailbox(std::make_shared<Mailbox>()) {}

    ~AsyncResource() {
        std::lock_guard<std::mutex> lock(m_mailbox->mutex);
        m_mailbox->alive = false;
        m_mailbox->ready = false;
        m_mailbox->result.reset();
    }

    AsyncResource(const AsyncResource&) = delete;
    AsyncResource& operator=(const AsyncResource&) = delete;

    /**
     * @brief Start a load on a worker thread
     *
     * Any earlier load still in flight is superseded and its result dropped.
     */
    void load(Producer producer) {
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(m_mailbox->mutex);
            generation = ++m_mailbox->generation;
            m_mailbox->ready = false;
            m_mailbox->result.reset();
            m_mailbox->pending = true;
        }

        // The worker holds only the mailbox, never the owner
        std::thread([mailbox = m_mailbox, generation, producer = std::move(producer)]() {
            std::shared_ptr<T> value;
            try {
                value = std::make_shared<T>(producer());
            } catch (const std::exception& e) {
                std::cerr << "[AsyncResource] Load failed: " << e.what() << std::endl;
                value = std::make_shared<T>();
            } catch (...) {
                std::cerr << "[AsyncResource] Load failed: unknown error" << std::endl;
                value = std::make_shared<T>();
            }

            std::lock_guard<std::mutex> lock(mailbox->mutex);
            if (!mailbox->alive || mailbox->generation != generation) {
                return;
            }
            mailbox->result = std::move(value);
            mailbox->ready = true;
        }).detach();
    }

    /// @brief Replace the current value immediately, cancelling pending loads
    void set(std::shared_ptr<const T> value) {
        cancelPending();
        m_current = std::move(value);
    }

    /// @brief Drop the current value and cancel pending loads
    void clear() {
        set(nullptr);
    }

    /**
     * @brief Adopt a finished load, if any
     * @return true if current() changed
     */
    bool poll() {
        std::shared_ptr<T> result;
        {
            std::lock_guard<std::mutex> lock(m_mailbox->mutex);
            if (!m_mailbox->ready) {
                return false;
            }
            result = std::move(m_mailbox->result);
            m_mailbox->ready = false;
            m_mailbox->pending = false;
        }

        if (result && result->valid()) {
            m_current = std::move(result);
            return true;
        }

        m_failures++;
        if (m_policy == LoadFailurePolicy::Clear && m_current) {
            m_current.reset();
            return true;
        }
        return false;
    }

    const std::shared_ptr<const T>& current() const { return m_current; }

    /// @brief A load was started and its result has not been polled yet
    bool pending() const {
        std::lock_guard<std::mutex> lock(m_mailbox->mutex);
        return m_mailbox->pending;
    }

    /// @brief Finished loads that produced an invalid value
    uint64_t failures() const { return m_failures; }

    LoadFailurePolicy policy() const { return m_policy; }

private:
    struct Mailbox {
        mutable std::mutex mutex;
        uint64_t generation = 0;
        bool alive = true;
        bool pending = false;
        bool ready = false;
        std::shared_ptr<T> result;
    };

    void cancelPending() {
        std::lock_guard<std::mutex> lock(m_mailbox->mutex);
        ++m_mailbox->generation;
        m_mailbox->ready = false;
        m_mailbox->pending = false;
        m_mailbox->result.reset();
    }

    LoadFailurePolicy m_policy;
    std::shared_ptr<Mailbox> m_mailbox;
    std::shared_ptr<const T> m_current;
    uint64_t m_failures = 0;
};

} // namespace auroscuro
