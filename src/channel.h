#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace cloudrun {

// Multi-producer / multi-consumer FIFO. Once closed, pushes are refused and
// consumers drain whatever is left before seeing the end of the stream.
template <typename T>
class Channel {
public:
    enum class PopStatus { ITEM, TIMEOUT, CLOSED };

    // False when the channel is already closed
    bool push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(item));
        cv_.notify_one();
        return true;
    }

    // Blocks until an item arrives; nullopt once closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    PopStatus pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
            return PopStatus::TIMEOUT;
        }
        if (queue_.empty()) return PopStatus::CLOSED;
        out = std::move(queue_.front());
        queue_.pop_front();
        return PopStatus::ITEM;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

// One-shot cancellation signal shared between a caller and the execution it
// started. A single callback can be armed per suspension point; it fires once,
// immediately if the token is already cancelled.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (cancelled_) return;
            cancelled_ = true;
        }
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            auto callback = std::move(callback_);
            callback_ = nullptr;
            callback();
        }
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return cancelled_;
    }

    void set_callback(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (cancelled()) {
            callback();
            return;
        }
        callback_ = std::move(callback);
    }

    // Waits for a callback that is already running
    void clear_callback() {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = nullptr;
    }

private:
    mutable std::mutex state_mutex_;
    std::mutex callback_mutex_;
    std::function<void()> callback_;
    bool cancelled_ = false;
};

// Arms a token callback for the lifetime of a scope
class ScopedCancelCallback {
public:
    ScopedCancelCallback(CancellationToken& token, std::function<void()> callback)
        : token_(token) {
        token_.set_callback(std::move(callback));
    }
    ~ScopedCancelCallback() { token_.clear_callback(); }

    ScopedCancelCallback(const ScopedCancelCallback&) = delete;
    ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
    CancellationToken& token_;
};

} // namespace cloudrun
