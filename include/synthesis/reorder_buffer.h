#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace subdub {
namespace synthesis {

// Index-keyed reordering queue: any number of producers push items tagged with
// their sequence position in any order; a single consumer pops them strictly in
// position order (0, 1, 2, ...).
template <typename T>
class ReorderBuffer {
   public:
    explicit ReorderBuffer(std::size_t expected) : expected_(expected) {}

    ReorderBuffer(const ReorderBuffer&) = delete;
    ReorderBuffer& operator=(const ReorderBuffer&) = delete;

    // Returns false if the position was already delivered, pushed, or out of range.
    bool push(std::size_t position, T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (position >= expected_ || position < next_ || pending_.count(position) != 0) {
                return false;
            }
            pending_.emplace(position, std::move(item));
        }
        cv_.notify_all();
        return true;
    }

    // Blocks until the next position is available. Returns std::nullopt once every
    // expected item was delivered, or when the producer side aborted.
    std::optional<std::pair<std::size_t, T>> popNext() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return aborted_ || closed_ || next_ >= expected_ || pending_.count(next_) != 0;
        });
        if (aborted_ || next_ >= expected_) {
            return std::nullopt;
        }
        auto it = pending_.find(next_);
        if (it == pending_.end()) {
            return std::nullopt;  // closed with a hole
        }
        std::pair<std::size_t, T> out(it->first, std::move(it->second));
        pending_.erase(it);
        ++next_;
        return out;
    }

    // No more pushes will come. Items already pushed can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Fatal producer error: wakes the consumer, which stops immediately.
    void abort(std::string reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_ = true;
            abortReason_ = std::move(reason);
        }
        cv_.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

    std::string abortReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abortReason_;
    }

    std::size_t delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_;
    }

    std::size_t expected() const {
        return expected_;
    }

   private:
    const std::size_t expected_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::size_t, T> pending_;
    std::size_t next_ = 0;
    bool closed_ = false;
    bool aborted_ = false;
    std::string abortReason_;
};

}  // namespace synthesis
}  // namespace subdub
