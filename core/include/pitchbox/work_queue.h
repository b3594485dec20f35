#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace pitchbox {

// Bounded FIFO handed from submitters to workers.
// - Thread-safe push/pop
// - try_push() refuses instead of blocking when full or shut down
// - Blocking pop with shutdown(); drain() hands back what never ran
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity) : capacity_(capacity) {}

    // False when the queue is full or shut down; the value is left untouched.
    bool try_push(T& value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || q_.size() >= capacity_) return false;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return true;
    }

    // Returns false when shut down and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    // Removes the first queued value matching pred. True if one was removed.
    template <typename Pred>
    bool remove_if(Pred pred) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = q_.begin(); it != q_.end(); ++it) {
            if (pred(*it)) {
                q_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        out.reserve(q_.size());
        for (auto& v : q_) out.push_back(std::move(v));
        q_.clear();
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

} // namespace pitchbox
