// Unbounded message channel between one worker thread and the UI loop.
// Senders may be copied; the receiver is unique and polled without blocking.
#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace opendir {

enum class RecvStatus { Ok, Empty, Disconnected };

namespace detail {

template <typename T> struct ChannelState {
    std::mutex mtx;
    std::deque<T> queue;
    int senders = 0;
    bool receiverAlive = true;
};

} // namespace detail

template <typename T> class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        attach();
    }
    Sender(const Sender &other) : state_(other.state_) { attach(); }
    Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}
    Sender &operator=(Sender other) noexcept {
        state_.swap(other.state_);
        return *this;
    }
    ~Sender() { release(); }

    // Returns false once the receiver is gone; the value is dropped.
    bool send(T value) const {
        if (!state_)
            return false;
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->receiverAlive)
            return false;
        state_->queue.push_back(std::move(value));
        return true;
    }

    bool valid() const { return static_cast<bool>(state_); }

private:
    void attach() {
        if (!state_)
            return;
        std::lock_guard<std::mutex> lk(state_->mtx);
        ++state_->senders;
    }
    void release() {
        if (!state_)
            return;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            --state_->senders;
        }
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T> class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}
    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;
    Receiver(Receiver &&other) noexcept : state_(std::move(other.state_)) {}
    Receiver &operator=(Receiver &&other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    ~Receiver() { close(); }

    // Non-blocking. Disconnected is reported only after the queue is drained
    // and every sender has been destroyed.
    RecvStatus tryRecv(T &out) {
        if (!state_)
            return RecvStatus::Disconnected;
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->queue.empty()) {
            out = std::move(state_->queue.front());
            state_->queue.pop_front();
            return RecvStatus::Ok;
        }
        return state_->senders == 0 ? RecvStatus::Disconnected
                                    : RecvStatus::Empty;
    }

    bool valid() const { return static_cast<bool>(state_); }

    void close() {
        if (!state_)
            return;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            state_->receiverAlive = false;
            state_->queue.clear();
        }
        state_.reset();
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T> std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace opendir
