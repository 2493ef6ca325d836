#pragma once

/**
 * @file event_dispatcher.hpp
 * @brief Delivers protocol events on a dedicated thread
 *
 * The connection reader pushes; a single worker pops and calls the handler.
 * A slow handler therefore never delays response processing. The queue is
 * bounded: on overflow the oldest event is dropped with a periodic warning.
 *
 * The worker only touches the shared queue state, never the dispatcher
 * itself, so a handler may stop (or destroy) the dispatcher's owner.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "messages.hpp"

namespace vibium {
namespace protocol {

constexpr size_t kDefaultEventQueueSize = 1000;

using EventHandler = std::function<void(const Event &event)>;

class EventDispatcher {
public:
    explicit EventDispatcher(size_t max_queue_size = kDefaultEventQueueSize);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher &) = delete;
    EventDispatcher &operator=(const EventDispatcher &) = delete;

    // Replaces the current handler; nullptr discards events
    void set_handler(EventHandler handler);

    /**
     * @brief Queue an event for delivery (never blocks)
     *
     * @return false if the queue was full and the oldest event was dropped
     */
    bool push(Event event);

    // Stop the worker; queued events are discarded. Idempotent.
    // Called from a handler, the join is deferred to the next stop() from
    // another thread or to the destructor.
    void stop();

    size_t queued() const;
    size_t dropped_count() const;
    size_t delivered_count() const;

private:
    struct State {
        explicit State(size_t max) : max_queue_size(max) {}

        const size_t max_queue_size;

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Event> queue;
        EventHandler handler;
        bool stopping = false;
        size_t dropped_count = 0;
        std::atomic<size_t> delivered_count{0};
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

}  // namespace protocol
}  // namespace vibium
