// channel_queue.hpp
// Unbounded, strictly FIFO queue used to hand messages between the caller's
// thread and a background thread.
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace aircast {

template <typename T>
class ChannelQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lk(lock_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    // Blocks until an item is available.
    T pop() {
        std::unique_lock<std::mutex> lk(lock_);
        ready_.wait(lk, [this] { return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(lock_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(lock_);
        if (!ready_.wait_for(lk, timeout, [this] { return !items_.empty(); })) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(lock_);
        return items_.size();
    }

private:
    mutable std::mutex lock_;
    std::condition_variable ready_;
    std::deque<T> items_;
};

} // namespace aircast
