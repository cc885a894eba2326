#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace trayhost {

namespace detail {

template<typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable available;
    std::deque<T> queue;
    int senders = 0;
    bool receiver_alive = true;
};

} // namespace detail

template<typename T> class Receiver;

/**
 * Sending half of an event channel.
 * Copies share the same queue. send() never blocks.
 */
template<typename T>
class Sender {
public:
    Sender() = default;

    Sender(const Sender& other) : state_(other.state_) {
        attach();
    }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() {
        if (!state_) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (--state_->senders == 0) {
            state_->available.notify_all();
        }
    }

    /**
     * Queue a value for the receiver.
     * @return false if the receiver was dropped (the value is discarded)
     */
    bool send(T value) {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->receiver_alive) {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->available.notify_one();
        return true;
    }

    bool is_connected() const {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->receiver_alive;
    }

    explicit operator bool() const { return state_ != nullptr; }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel();

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        attach();
    }

    void attach() {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->senders++;
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Receiving half of an event channel. Move-only.
 */
template<typename T>
class Receiver {
public:
    Receiver() = default;
    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            disconnect();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    ~Receiver() {
        disconnect();
    }

    // Blocks until a value arrives; empty once all senders are gone and the queue is drained
    std::optional<T> recv() {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->available.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    std::optional<T> try_recv() {
        if (!state_) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return pop_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> recv_for(const std::chrono::duration<Rep, Period>& timeout) {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->available.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    // True while at least one sender exists
    bool is_connected() const {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->senders > 0;
    }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    std::optional<T> pop_locked() {
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

    void disconnect() {
        if (!state_) {
            return;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace trayhost
