/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: delay_scheduler.cpp

*******************************************************************************/

#include "submission/delay_scheduler.h"
#include "submission/flush_policy.h"

namespace dss {

//==============================================================================
// REARMING TIMER
//==============================================================================

RearmingTimer::RearmingTimer(Callback callback)
    : callback_(std::move(callback)), running_(false), firing_(false) {}

RearmingTimer::~RearmingTimer() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RearmingTimer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || thread_.joinable()) return;
    running_ = true;
    thread_ = std::thread(&RearmingTimer::run, this);
}

void RearmingTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        deadline_.reset();
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void RearmingTimer::arm(std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = SteadyClock::now() + delay;
    }
    cv_.notify_all();
}

void RearmingTimer::disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
    }
    cv_.notify_all();
}

bool RearmingTimer::has_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

bool RearmingTimer::is_firing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return firing_;
}

void RearmingTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (!deadline_) {
            cv_.wait(lock, [this] { return !running_ || deadline_.has_value(); });
            continue;
        }

        auto deadline = *deadline_;
        if (cv_.wait_until(lock, deadline, [this, deadline] {
                return !running_ || !deadline_ || *deadline_ != deadline;
            })) {
            continue;  // stopped, disarmed or re-armed
        }

        deadline_.reset();
        firing_ = true;
        lock.unlock();
        callback_();
        lock.lock();
        firing_ = false;
    }
}

//==============================================================================
// DELAY SCHEDULER
//==============================================================================

DelayScheduler::DelayScheduler(const DssConfig& config, RearmingTimer::Callback on_fire,
                               uint32_t seed)
    : config_(config), timer_(std::move(on_fire)), rng_(seed), active_(false) {
    state_.current_percentage = config_.min_percentage;
}

void DelayScheduler::stop() {
    timer_.stop();
}

void DelayScheduler::arm_with(std::chrono::milliseconds delay) {
    active_ = true;
    state_.next_flush_time = Clock::now() + delay;
    timer_.arm(delay);
}

bool DelayScheduler::arm_if_idle() {
    if (active_) return false;
    arm_with(cold_delay(config_, rng_));
    return true;
}

void DelayScheduler::arm() {
    arm_with(active_ ? warm_delay(config_, rng_) : cold_delay(config_, rng_));
}

void DelayScheduler::rearm() {
    arm_with(warm_delay(config_, rng_));
}

void DelayScheduler::disarm() {
    active_ = false;
    state_.next_flush_time.reset();
    timer_.disarm();
}

void DelayScheduler::record_flush(int amount, TimePoint when) {
    state_.last_flush_amount = amount;
    state_.last_flush_time = when;
}

void DelayScheduler::advance_percentage() {
    state_.current_percentage = next_percentage(state_.current_percentage, config_, rng_);
}

void DelayScheduler::reset_percentage() {
    state_.current_percentage = config_.min_percentage;
}

} // namespace dss
