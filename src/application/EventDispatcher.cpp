/**
 * @file EventDispatcher.cpp
 * @brief Implementation of EventDispatcher.
 */

#include "application/EventDispatcher.hpp"
#include <iostream>

namespace assetbridge::application {

EventDispatcher::EventDispatcher(std::size_t capacity, EventHandler handler)
    : m_capacity(capacity == 0 ? 1 : capacity), m_handler(std::move(handler)), m_running(true) {
    m_worker = std::thread(&EventDispatcher::loop, this);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workerId = m_worker.get_id();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();

    if (m_worker.joinable() && !isLoopThread()) {
        m_worker.join();
    }
}

bool EventDispatcher::post(domain::DiscoveryEvent event) {
    return enqueue(Item(std::move(event)));
}

bool EventDispatcher::submit(Command command) {
    return enqueue(Item(std::move(command)));
}

bool EventDispatcher::enqueue(Item item) {
    const bool fromLoop = isLoopThread();
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        // The loop thread never waits on itself: its own follow-up work may exceed the bound.
        if (!fromLoop) {
            m_notFull.wait(lock, [this] {
                return m_queue.size() < m_capacity || !m_running;
            });
        }
        if (!m_running) {
            return false;
        }
        m_queue.push_back(std::move(item));
    }
    m_notEmpty.notify_one();
    return true;
}

void EventDispatcher::flush() {
    if (isLoopThread()) return;
    call([] {});
}

bool EventDispatcher::isLoopThread() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::this_thread::get_id() == m_workerId;
}

std::size_t EventDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void EventDispatcher::loop() {
    while (true) {
        Item item;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            item = std::move(m_queue.front());
            m_queue.pop_front();
        }
        m_notFull.notify_one();

        try {
            if (auto* event = std::get_if<domain::DiscoveryEvent>(&item)) {
                if (m_handler) m_handler(*event);
            } else if (auto* command = std::get_if<Command>(&item)) {
                if (*command) (*command)();
            }
        } catch (const std::exception& e) {
            std::cerr << "[EventDispatcher] Error while dispatching: " << e.what() << std::endl;
        }
    }
}

} // namespace assetbridge::application
