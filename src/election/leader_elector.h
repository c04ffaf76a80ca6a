/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: leader_elector.h

    Description:
        Lease-based leader election across the instances of one deployment.
        Exactly one instance holds the lease at any settled moment; only that
        instance flushes queued responses to durable storage.

        Lease Protocol (one check):
        - LeaderId == self          -> renew LeaderHeartbeat, confirm leadership
        - LeaderId empty            -> claim with compare_and_set(empty)
        - heartbeat older than the
          lease timeout (or garbage) -> take over with compare_and_set(== holder)
        - otherwise                 -> follower of the current holder
        - store unreachable         -> follower (never leader under uncertainty)

        Modes:
        - Single instance (scale-out off): leader and ready at start(), the
          store is never touched.
        - Scale-out: start() runs the first check synchronously, then a
          background thread re-checks every check interval. After a store
          failure the next check uses exponential backoff.

        Leadership flips are published on a LeadershipChannel. Consumers
        subscribe instead of registering callbacks on the elector.

    Thread Safety:
        - is_leader_ / is_ready_ are atomics, readable from any thread
        - check_mutex_ serializes checks (loop thread, start(), tests)
        - state_mutex_ guards leader_id_ and acknowledged_leader_id_

*******************************************************************************/

#ifndef LEADER_ELECTOR_H
#define LEADER_ELECTOR_H

#include "common/channel.h"
#include "common/config.h"
#include "election/settings_store.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dss {

struct LeadershipEvent {
    bool is_leader;
    std::string instance_id;

    LeadershipEvent() : is_leader(false) {}
    LeadershipEvent(bool leader, std::string id) : is_leader(leader), instance_id(std::move(id)) {}
};

using LeadershipChannel = Channel<LeadershipEvent>;

// Read-only leadership state as seen by the rest of the service.
class LeadershipView {
public:
    virtual ~LeadershipView() = default;

    virtual bool is_leader() const = 0;
    virtual bool is_ready() const = 0;
    virtual std::string instance_id() const = 0;

    // Last observed lease holder; empty when unknown.
    virtual std::string leader_id() const = 0;
};

struct ElectionConfig {
    std::string instance_id;
    bool scale_out;
    int lease_timeout_ms;
    int check_interval_ms;
    int retry_backoff_initial_ms;
    int retry_backoff_max_ms;

    ElectionConfig()
        : scale_out(false),
          lease_timeout_ms(120000),
          check_interval_ms(30000),
          retry_backoff_initial_ms(500),
          retry_backoff_max_ms(30000) {}

    static ElectionConfig from_instance(const InstanceConfig& config);
};

class LeaderElector : public LeadershipView {
private:
    ElectionConfig config_;
    std::shared_ptr<SettingsStore> store_;
    LeadershipChannel& channel_;

    std::atomic<bool> is_leader_;
    std::atomic<bool> is_ready_;
    std::atomic<bool> running_;

    mutable std::mutex state_mutex_;
    std::string leader_id_;
    std::string acknowledged_leader_id_;

    std::mutex check_mutex_;

    std::thread loop_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    void election_loop();
    void set_leader_status(bool is_leader);
    void set_observed_leader(const std::string& leader_id);
    void relinquish_leadership();

    static int64_t now_ms();

public:
    // `store` may be null in single-instance mode.
    LeaderElector(const ElectionConfig& config,
                  std::shared_ptr<SettingsStore> store,
                  LeadershipChannel& channel);
    ~LeaderElector() override;

    LeaderElector(const LeaderElector&) = delete;
    LeaderElector& operator=(const LeaderElector&) = delete;

    // Returns false if scale-out is enabled without a store.
    bool start();

    // Stops the loop and, when leader in scale-out mode, clears LeaderId if
    // it still names this instance.
    void stop();

    // One pass of the lease protocol. Returns false when the store failed.
    bool check_leadership();

    bool is_leader() const override { return is_leader_; }
    bool is_ready() const override { return is_ready_; }
    std::string instance_id() const override { return config_.instance_id; }
    std::string leader_id() const override;

    bool is_running() const { return running_; }
    bool is_single_instance() const { return !config_.scale_out; }
};

} // namespace dss

#endif // LEADER_ELECTOR_H
