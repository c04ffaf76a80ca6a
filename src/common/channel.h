/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: channel.h

    Description:
        In-process publish/subscribe channel. Publishers push values; every
        live subscription receives its own copy in FIFO order and drains it
        from whichever thread owns it.

        Used for:
        - Leadership changes (LeaderElector -> DelayedSubmissionService)
        - Status snapshots (DelayedSubmissionService -> observers)

        Components talk through explicit messages instead of callbacks
        registered on each other, so a leadership transition can be produced
        by a test as easily as by the elector.

    Thread Safety:
        - Channel::mutex_ guards the subscriber list
        - Each Subscription has its own mutex + condition variable
        - publish() never blocks on a slow consumer (queues are unbounded)

*******************************************************************************/

#ifndef CHANNEL_H
#define CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace dss {

template <typename T>
class Subscription {
private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_;

public:
    Subscription() : closed_(false) {}

    void push(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            queue_.push_back(value);
        }
        cv_.notify_one();
    }

    // Blocks until a value arrives, the subscription is closed, or the
    // timeout passes. Returns false when nothing was popped.
    bool pop(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};

template <typename T>
class Channel {
private:
    std::vector<std::weak_ptr<Subscription<T>>> subscribers_;
    std::mutex mutex_;

public:
    std::shared_ptr<Subscription<T>> subscribe() {
        auto subscription = std::make_shared<Subscription<T>>();
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(subscription);
        return subscription;
    }

    void publish(const T& value) {
        std::vector<std::shared_ptr<Subscription<T>>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.begin();
            while (it != subscribers_.end()) {
                auto sub = it->lock();
                if (!sub || sub->is_closed()) {
                    it = subscribers_.erase(it);
                } else {
                    live.push_back(std::move(sub));
                    ++it;
                }
            }
        }
        for (auto& sub : live) {
            sub->push(value);
        }
    }

    size_t subscriber_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& weak : subscribers_) {
            auto sub = weak.lock();
            if (sub && !sub->is_closed()) count++;
        }
        return count;
    }
};

} // namespace dss

#endif // CHANNEL_H
