#include "event_dispatcher.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace vibium {
namespace protocol {

EventDispatcher::EventDispatcher(size_t max_queue_size)
    : state_(std::make_shared<State>(max_queue_size == 0 ? 1 : max_queue_size)) {
    worker_ = std::thread(&EventDispatcher::run, state_);
}

EventDispatcher::~EventDispatcher() {
    stop();
    if (worker_.joinable()) {
        // Destroyed from inside a handler. The worker holds its own reference
        // to the state and returns as soon as the handler does.
        worker_.detach();
    }
}

void EventDispatcher::set_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->handler = std::move(handler);
}

bool EventDispatcher::push(Event event) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return false;
        }

        if (state_->queue.size() >= state_->max_queue_size) {
            state_->queue.pop_front();
            state_->dropped_count++;
            dropped = true;

            // Log warning periodically (every 100 drops)
            if (state_->dropped_count % 100 == 1) {
                LOG_WARN("[EventDispatcher] Queue overflow, dropped " << state_->dropped_count << " events total");
            }
        }
        state_->queue.push_back(std::move(event));
    }
    state_->cv.notify_one();
    return !dropped;
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        state_->queue.clear();
    }
    state_->cv.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

size_t EventDispatcher::queued() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

size_t EventDispatcher::dropped_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->dropped_count;
}

size_t EventDispatcher::delivered_count() const { return state_->delivered_count.load(); }

void EventDispatcher::run(std::shared_ptr<State> state) {
    while (true) {
        Event event;
        EventHandler handler;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state] { return state->stopping || !state->queue.empty(); });
            if (state->stopping) {
                return;
            }
            event = std::move(state->queue.front());
            state->queue.pop_front();
            handler = state->handler;
        }

        if (!handler) {
            LOG_TRACE("[EventDispatcher] No handler, discarding " << event.method);
            continue;
        }

        try {
            handler(event);
            state->delivered_count++;
        } catch (const std::exception &e) {
            LOG_ERROR("[EventDispatcher] Handler for " << event.method << " threw: " << e.what());
        }
    }
}

}  // namespace protocol
}  // namespace vibium
