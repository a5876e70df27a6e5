/**
 * @file EventDispatcher.hpp
 * @brief Bounded channel drained by the single thread that owns all engine state.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

#include "domain/EngineEvents.hpp"

namespace assetbridge::application {

/**
 * @class EventDispatcher
 * @brief Serializes discovery events and commands onto one consumer thread.
 *
 * Producers block while the channel is full; nothing is ever dropped. Items
 * are applied strictly in arrival order, one at a time, which is what lets the
 * tracker, associations and selection run without locks.
 */
class EventDispatcher {
public:
    using EventHandler = std::function<void(const domain::DiscoveryEvent&)>;
    using Command = std::function<void()>;

    EventDispatcher(std::size_t capacity, EventHandler handler);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Queues a discovery event, blocking while the channel is full.
     * @return False if the dispatcher has been stopped.
     */
    bool post(domain::DiscoveryEvent event);

    /** @brief Queues a command without waiting for it. */
    bool submit(Command command);

    /**
     * @brief Runs fn on the dispatcher thread and returns its result.
     *
     * Exceptions thrown by fn are rethrown here. Called from the dispatcher
     * thread itself, fn runs inline.
     */
    template <typename F>
    auto call(F&& fn) -> std::invoke_result_t<F> {
        using Result = std::invoke_result_t<F>;
        if (isLoopThread()) {
            return fn();
        }
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        if (!submit([task] { (*task)(); })) {
            throw std::runtime_error("Event dispatcher is stopped");
        }
        return future.get();
    }

    /** @brief Waits until everything queued before this call has been applied. */
    void flush();

    /** @brief Drains the queue and joins the loop thread. */
    void stop();

    bool isLoopThread() const;
    std::size_t pending() const;
    std::size_t capacity() const { return m_capacity; }

private:
    using Item = std::variant<domain::DiscoveryEvent, Command>;

    bool enqueue(Item item);
    void loop();

    const std::size_t m_capacity;
    EventHandler m_handler;

    std::deque<Item> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;

    std::thread m_worker;
    std::thread::id m_workerId;
    std::atomic<bool> m_running;
};

} // namespace assetbridge::application
