#pragma once

#include "attachq/log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace attachq {

/// Unsubscribes on destruction (or explicit unsubscribe()). Movable, not copyable.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
        : unsubscribe_(std::move(unsubscribe)) {}

    ~Subscription() { unsubscribe(); }

    Subscription(Subscription&& other) noexcept
        : unsubscribe_(std::exchange(other.unsubscribe_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            unsubscribe_ = std::exchange(other.unsubscribe_, nullptr);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void unsubscribe() {
        if (unsubscribe_) {
            auto fn = std::exchange(unsubscribe_, nullptr);
            fn();
        }
    }

    bool active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

/// Receiving end of an EventChannel. Each receiver buffers its own copy of
/// every event published after it subscribed. Dropping the last shared_ptr
/// unsubscribes it.
template <typename T>
class EventReceiver {
public:
    std::optional<T> try_recv() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    /// Wait up to `timeout` for an event. Returns nullopt on timeout or close.
    std::optional<T> recv_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return std::nullopt;
        T ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out(std::make_move_iterator(queue_.begin()),
                           std::make_move_iterator(queue_.end()));
        queue_.clear();
        return out;
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    void push(const T& ev) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            queue_.push_back(ev);
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

/// Broadcast channel for one kind of event.
///
/// publish() never blocks on subscribers: it copies the event into every live
/// receiver and into the listener outbox, so it is safe to call while the
/// publisher holds its own locks. Callback listeners run on the channel's
/// dispatcher thread, one event at a time, in publish order. A listener may
/// unsubscribe itself or call back into the publisher from inside a callback.
template <typename T>
class EventChannel {
public:
    using Callback = std::function<void(const T&)>;

    EventChannel() : state_(std::make_shared<State>()) {}
    ~EventChannel() { close(); }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// New receiver endpoint. The channel only holds it weakly.
    std::shared_ptr<EventReceiver<T>> subscribe() {
        auto receiver = std::make_shared<EventReceiver<T>>();
        std::lock_guard lock(state_->mutex);
        if (state_->closed) {
            receiver->close();
        } else {
            state_->receivers.push_back(receiver);
        }
        return receiver;
    }

    /// Register a callback. Delivery stops once the returned Subscription is
    /// released or unsubscribed.
    Subscription listen(Callback callback) {
        uint64_t id = 0;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return {};
            id = state_->next_listener_id++;
            state_->listeners.emplace(id, std::make_shared<Callback>(std::move(callback)));
            if (!state_->dispatcher.joinable()) {
                // The dispatcher keeps the state alive until it exits
                state_->dispatcher = std::thread([state = state_] { state->dispatch_loop(); });
            }
        }

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id] {
            if (auto state = weak.lock()) {
                std::lock_guard lock(state->mutex);
                state->listeners.erase(id);
            }
        });
    }

    void publish(const T& event) {
        std::vector<std::shared_ptr<EventReceiver<T>>> live;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return;

            auto& receivers = state_->receivers;
            for (auto it = receivers.begin(); it != receivers.end();) {
                if (auto r = it->lock()) {
                    live.push_back(std::move(r));
                    ++it;
                } else {
                    it = receivers.erase(it);
                }
            }

            if (!state_->listeners.empty()) {
                state_->outbox.push_back(event);
                state_->cv.notify_all();
            }
        }
        for (auto& r : live) r->push(event);
    }

    /// Block until every event published so far has been handed to listeners.
    /// Returns immediately when called from a listener callback.
    void flush() {
        std::unique_lock lock(state_->mutex);
        if (std::this_thread::get_id() == state_->dispatcher.get_id()) return;
        state_->idle_cv.wait(lock, [this] {
            return state_->closed || (state_->outbox.empty() && !state_->delivering);
        });
    }

    /// Drop all listeners, close all receivers and stop the dispatcher.
    void close() {
        std::vector<std::weak_ptr<EventReceiver<T>>> receivers;
        std::thread dispatcher;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return;
            state_->closed = true;
            state_->listeners.clear();
            state_->outbox.clear();
            receivers.swap(state_->receivers);
            if (state_->dispatcher.joinable() &&
                std::this_thread::get_id() != state_->dispatcher.get_id()) {
                dispatcher = std::move(state_->dispatcher);
            }
        }
        state_->cv.notify_all();
        state_->idle_cv.notify_all();
        if (dispatcher.joinable()) dispatcher.join();

        for (auto& weak : receivers) {
            if (auto r = weak.lock()) r->close();
        }
    }

    size_t listener_count() const {
        std::lock_guard lock(state_->mutex);
        return state_->listeners.size();
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::condition_variable idle_cv;
        std::vector<std::weak_ptr<EventReceiver<T>>> receivers;
        std::map<uint64_t, std::shared_ptr<Callback>> listeners;
        uint64_t next_listener_id = 1;
        std::deque<T> outbox;
        bool delivering = false;
        bool closed = false;
        std::thread dispatcher;

        ~State() {
            // Only reached on the dispatcher thread itself when close() ran from a callback
            if (dispatcher.joinable()) dispatcher.detach();
        }

        void dispatch_loop() {
            std::unique_lock lock(mutex);
            while (true) {
                cv.wait(lock, [this] { return closed || !outbox.empty(); });
                if (closed) break;

                T event = std::move(outbox.front());
                outbox.pop_front();
                std::vector<std::shared_ptr<Callback>> targets;
                targets.reserve(listeners.size());
                for (auto& [id, cb] : listeners) targets.push_back(cb);
                delivering = true;
                lock.unlock();

                for (auto& cb : targets) {
                    try {
                        (*cb)(event);
                    } catch (const std::exception& e) {
                        log_error("[events] listener threw: %s", e.what());
                    }
                }

                lock.lock();
                delivering = false;
                if (outbox.empty()) idle_cv.notify_all();
            }
            delivering = false;
            idle_cv.notify_all();
        }
    };

    std::shared_ptr<State> state_;
};

}  // namespace attachq
