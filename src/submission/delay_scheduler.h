/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: delay_scheduler.h

    Description:
        Decides when the next flush cycle runs and tracks the adaptive flush
        percentage.

        State Machine:

            ┌──────┐  arm_if_idle()   ┌───────┐  deadline  ┌────────┐
            │ IDLE │────────────────→│ ARMED │──────────→│ FIRING │
            └──────┘  (long window)   └───────┘            └────────┘
               ↑                          ↑                    │
               │ disarm()                 │ rearm()            │
               │ (nothing submitted)      │ (short window)     │
               └──────────────────────────┴────────────────────┘

        Windows:
        - Long (cold) window when arming from IDLE: tens of minutes, so the
          first flush after a quiet period has no predictable cadence.
        - Short (warm) window for every re-arm while a backlog drains.

        The flush percentage starts at MinPercentage. After a cycle that
        submitted something it either resets to MinPercentage (with
        ResetChancePercentage probability) or grows by PercentageIncrement up
        to MaxPercentage. After a cycle that submitted nothing it resets.

    Thread Safety:
        RearmingTimer is internally synchronized and runs its callback on its
        own thread, one firing at a time; the callback may re-arm the timer.
        DelayScheduler's schedule state is NOT locked here. Its owner holds
        one mutex over queue and schedule state.

*******************************************************************************/

#ifndef DELAY_SCHEDULER_H
#define DELAY_SCHEDULER_H

#include "common/config.h"
#include "model/dss_status.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

namespace dss {

//==============================================================================
// REARMING TIMER
//==============================================================================

class RearmingTimer {
public:
    using Callback = std::function<void()>;

private:
    using SteadyClock = std::chrono::steady_clock;

    Callback callback_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<SteadyClock::time_point> deadline_;
    bool running_;
    bool firing_;

    void run();

public:
    explicit RearmingTimer(Callback callback);
    ~RearmingTimer();

    RearmingTimer(const RearmingTimer&) = delete;
    RearmingTimer& operator=(const RearmingTimer&) = delete;

    void start();

    // Stops the thread. Called from the timer thread itself it only marks
    // the timer stopped; the owner's destructor joins.
    void stop();

    // Replaces any pending deadline.
    void arm(std::chrono::milliseconds delay);
    void disarm();

    bool has_deadline() const;
    bool is_firing() const;
};

//==============================================================================
// DELAY SCHEDULER
//==============================================================================

struct ScheduleState {
    int current_percentage;
    std::optional<TimePoint> next_flush_time;
    TimePoint last_flush_time;
    int last_flush_amount;

    ScheduleState() : current_percentage(0), last_flush_amount(0) {}
};

class DelayScheduler {
private:
    DssConfig config_;
    RearmingTimer timer_;
    std::mt19937 rng_;
    ScheduleState state_;
    bool active_;       // ARMED or FIRING

    void arm_with(std::chrono::milliseconds delay);

public:
    DelayScheduler(const DssConfig& config, RearmingTimer::Callback on_fire, uint32_t seed);

    void start() { timer_.start(); }

    // Stops the timer thread only. Must not be called while holding the
    // lock the fire callback takes; clear the schedule with disarm() after.
    void stop();

    // IDLE -> ARMED with the long window. No effect when already active.
    // Returns true when it armed.
    bool arm_if_idle();

    // Long window from IDLE, short window otherwise. Used on promotion.
    void arm();

    // ARMED/FIRING -> ARMED with the short window.
    void rearm();

    // -> IDLE, no timer pending.
    void disarm();

    bool is_active() const { return active_; }
    bool is_firing() const { return timer_.is_firing(); }

    void record_flush(int amount, TimePoint when);
    void advance_percentage();
    void reset_percentage();

    const ScheduleState& state() const { return state_; }
    std::mt19937& rng() { return rng_; }
};

} // namespace dss

#endif // DELAY_SCHEDULER_H
