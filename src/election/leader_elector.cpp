/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: leader_elector.cpp

    Description:
        Lease-based election over a SettingsStore.

        State Transitions:

            ┌──────────┐  claim / take over expired lease  ┌────────┐
            │ FOLLOWER │─────────────────────────────────→│ LEADER │
            │          │←─────────────────────────────────│        │
            └──────────┘  superseded / store failure /    └────────┘
                          lost claim / stop()

        Timing:
        - check_interval_ms between checks while the store answers
        - retry_backoff_initial_ms doubling up to retry_backoff_max_ms after
          a store failure
        - lease_timeout_ms without a renewal lets another instance take over

*******************************************************************************/

#include "election/leader_elector.h"
#include "common/logger.h"

#include <algorithm>
#include <chrono>

namespace dss {

ElectionConfig ElectionConfig::from_instance(const InstanceConfig& config) {
    ElectionConfig election;
    election.instance_id = config.instance_id();
    election.scale_out = config.scale_out;
    election.lease_timeout_ms = config.lease_timeout_ms;
    election.check_interval_ms = config.check_interval_ms;
    election.retry_backoff_initial_ms = config.retry_backoff_initial_ms;
    election.retry_backoff_max_ms = config.retry_backoff_max_ms;
    return election;
}

LeaderElector::LeaderElector(const ElectionConfig& config,
                             std::shared_ptr<SettingsStore> store,
                             LeadershipChannel& channel)
    : config_(config),
      store_(std::move(store)),
      channel_(channel),
      is_leader_(false),
      is_ready_(false),
      running_(false) {}

LeaderElector::~LeaderElector() {
    stop();
}

//==============================================================================
// LIFECYCLE
//==============================================================================

bool LeaderElector::start() {
    if (running_) return true;

    if (!config_.scale_out) {
        Logger::info("Starting leader election in single-instance mode. This instance (" +
                     config_.instance_id + ") is the leader");
        set_observed_leader(config_.instance_id);
        set_leader_status(true);
        is_ready_ = true;
        running_ = true;
        return true;
    }

    if (!store_) {
        Logger::error("Scale-out leader election requires a coordination store");
        return false;
    }

    Logger::info("Starting leader election with instance ID: " + config_.instance_id +
                 ", check interval: " + std::to_string(config_.check_interval_ms) + "ms");

    running_ = true;
    check_leadership();
    loop_thread_ = std::thread(&LeaderElector::election_loop, this);
    return true;
}

void LeaderElector::stop() {
    if (!running_.exchange(false)) return;

    loop_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    if (!config_.scale_out) return;

    if (is_leader_) {
        relinquish_leadership();
    }
}

void LeaderElector::relinquish_leadership() {
    std::lock_guard<std::mutex> lock(check_mutex_);
    const std::string self = config_.instance_id;
    try {
        bool cleared = store_->compare_and_set(kLeaderIdKey, "",
            [&self](const std::string& current) { return current == self; });
        if (cleared) {
            Logger::info("Instance " + self + " has relinquished leadership");
        }
    } catch (const StoreError& e) {
        Logger::error("Error relinquishing leadership for instance " + self + ": " + e.what());
    }
    set_observed_leader("");
    set_leader_status(false);
}

void LeaderElector::election_loop() {
    int backoff_ms = config_.retry_backoff_initial_ms;
    int wait_ms = config_.check_interval_ms;

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(loop_mutex_);
            loop_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                              [this] { return !running_; });
        }
        if (!running_) break;

        if (check_leadership()) {
            backoff_ms = config_.retry_backoff_initial_ms;
            wait_ms = config_.check_interval_ms;
        } else {
            wait_ms = backoff_ms;
            backoff_ms = std::min(backoff_ms * 2, config_.retry_backoff_max_ms);
            Logger::debug("Next leadership check in " + std::to_string(wait_ms) + "ms");
        }
    }
}

//==============================================================================
// LEASE PROTOCOL
//==============================================================================

int64_t LeaderElector::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool LeaderElector::check_leadership() {
    if (!config_.scale_out) return true;

    std::lock_guard<std::mutex> lock(check_mutex_);
    const std::string self = config_.instance_id;
    bool store_ok = true;

    try {
        std::string holder = store_->get(kLeaderIdKey);
        std::string heartbeat = store_->get(kLeaderHeartbeatKey);

        if (holder == self) {
            store_->set(kLeaderHeartbeatKey, std::to_string(now_ms()));
            set_observed_leader(self);
            if (!is_leader_) {
                set_leader_status(true);
                Logger::info("Instance " + self + " confirming leadership status");
            }
        } else if (holder.empty()) {
            Logger::info("No active leader found. Attempting to claim leadership");
            // Heartbeat first: a holder is never visible without a fresh one.
            store_->set(kLeaderHeartbeatKey, std::to_string(now_ms()));
            bool claimed = store_->compare_and_set(kLeaderIdKey, self,
                [](const std::string& current) { return current.empty(); });
            if (claimed) {
                set_observed_leader(self);
                set_leader_status(true);
                Logger::info("Instance " + self + " has been elected as the new leader");
            } else {
                set_observed_leader(store_->get(kLeaderIdKey));
                set_leader_status(false);
            }
        } else {
            bool expired = true;
            int64_t last_heartbeat = 0;
            try {
                size_t consumed = 0;
                last_heartbeat = std::stoll(heartbeat, &consumed);
                expired = consumed != heartbeat.size() ||
                          now_ms() - last_heartbeat > config_.lease_timeout_ms;
            } catch (const std::exception&) {
                expired = true;
            }

            if (expired) {
                Logger::warning("Previous leader " + holder + " has expired (last heartbeat: " +
                                (heartbeat.empty() ? std::string("none") : heartbeat) + ")");
                store_->set(kLeaderHeartbeatKey, std::to_string(now_ms()));
                bool claimed = store_->compare_and_set(kLeaderIdKey, self,
                    [&holder](const std::string& current) { return current == holder; });
                if (claimed) {
                    set_observed_leader(self);
                    set_leader_status(true);
                    Logger::info("Instance " + self + " has taken over from expired leader");
                } else {
                    set_observed_leader(store_->get(kLeaderIdKey));
                    set_leader_status(false);
                }
            } else if (is_leader_) {
                Logger::warning("Instance " + self + " was leader but has been superseded by " + holder);
                set_observed_leader(holder);
                set_leader_status(false);
            } else {
                set_observed_leader(holder);
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                if (acknowledged_leader_id_ != holder) {
                    Logger::info("Accepting " + holder + " as current leader");
                    acknowledged_leader_id_ = holder;
                }
            }
        }
    } catch (const StoreError& e) {
        store_ok = false;
        Logger::error("Error during leader election for instance " + self + ": " + e.what());
        set_observed_leader("");
        set_leader_status(false);
    }

    if (!is_ready_.exchange(true)) {
        Logger::info("Leader election initialization completed");
    }
    return store_ok;
}

//==============================================================================
// STATE
//==============================================================================

void LeaderElector::set_leader_status(bool is_leader) {
    if (is_leader_.exchange(is_leader) == is_leader) return;

    if (is_leader) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        acknowledged_leader_id_.clear();
    }
    channel_.publish(LeadershipEvent(is_leader, config_.instance_id));
}

void LeaderElector::set_observed_leader(const std::string& leader_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    leader_id_ = leader_id;
}

std::string LeaderElector::leader_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return leader_id_;
}

} // namespace dss
