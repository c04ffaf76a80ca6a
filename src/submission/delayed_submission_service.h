/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: delayed_submission_service.h

    Description:
        Decouples the moment a participant submits answers from the moment
        they become durable. Records wait in memory on the leader and are
        flushed in randomly sized, randomly composed, randomly timed batches.

        Roles:
        - Leader:   queue_responses() appends to the local queue and arms the
                    delay scheduler; flush cycles persist eligible records.
        - Follower: queue_responses() forwards the batch (plus anything still
                    retained from a failed transfer) to the leader at once;
                    a follower never arms a scheduler.

        Flush Cycle (leader, timer thread):
        1. Count pending records per survey
        2. minimum = question_count * MinimumSurveySubmissions per survey
        3. Take amount_to_submit(pending, minimum, percentage) records of
           each eligible survey, chosen uniformly at random
        4. Anonymize free-text answers (failures keep the original text)
        5. Persist
        6. Submitted something -> re-arm short window, advance percentage
           Submitted nothing   -> disarm, reset percentage

        Leadership Transitions (LeadershipChannel):
        - Promotion: arm the scheduler unconditionally
        - Demotion:  disarm, drain the whole queue to the new leader in one
                     transfer (retained on failure)

        Shutdown:
        - Follower: one best-effort drain to the leader
        - Leader:   no flush. Queued records are dropped; operators drain
                    with an administrative flush before a planned stop.

    Thread Safety:
        mutex_ guards queue_ and scheduler_ state. Records are copied out
        under the lock and every slow call (question counts, anonymization,
        persistence, transfer) runs after it is released.

    Usage:
        DelayedSubmissionService dss(config, elector, elector_channel,
                                     gateway, anonymizer, transfer_client);
        dss.start();
        dss.queue_responses(batch);
        auto result = dss.flush_pending_responses(survey_id);
        dss.stop();

*******************************************************************************/

#ifndef DELAYED_SUBMISSION_SERVICE_H
#define DELAYED_SUBMISSION_SERVICE_H

#include "common/channel.h"
#include "common/config.h"
#include "common/service_result.h"
#include "election/leader_elector.h"
#include "model/dss_status.h"
#include "model/pending_response.h"
#include "persistence/persistence_gateway.h"
#include "persistence/text_anonymizer.h"
#include "submission/delay_scheduler.h"
#include "submission/submission_queue.h"
#include "transfer/transfer_client.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace dss {

using StatusChannel = Channel<DssStatus>;

class DelayedSubmissionService {
private:
    DssConfig config_;
    const LeadershipView& leadership_;
    LeadershipChannel& leadership_channel_;
    PersistenceGateway& persistence_;
    TextAnonymizer& anonymizer_;
    TransferClient& transfer_;

    mutable std::mutex mutex_;
    SubmissionQueue queue_;
    DelayScheduler scheduler_;
    bool has_transferred_responses_;
    uint64_t appended_total_;     // records ever appended; detects enqueue during a cycle
    bool stopped_;                // leader intake refused once stop() begins

    StatusChannel status_channel_;

    std::atomic<bool> running_;
    std::shared_ptr<Subscription<LeadershipEvent>> leadership_events_;
    std::thread event_thread_;

    void event_loop();

    // Caller holds mutex_.
    DssStatus build_status() const;
    void publish_status();

    // Takes everything retained plus `extra`, sends it, and restores the
    // whole set on failure. Returns the transfer result.
    ServiceResult<int> transfer_to_leader(ResponseBatch extra);

    // Anonymizes TEXT answers in place; never throws.
    void anonymize_text_answers(ResponseBatch& batch);

public:
    DelayedSubmissionService(const DssConfig& config,
                             const LeadershipView& leadership,
                             LeadershipChannel& leadership_channel,
                             PersistenceGateway& persistence,
                             TextAnonymizer& anonymizer,
                             TransferClient& transfer,
                             uint32_t seed = std::random_device{}());
    ~DelayedSubmissionService();

    DelayedSubmissionService(const DelayedSubmissionService&) = delete;
    DelayedSubmissionService& operator=(const DelayedSubmissionService&) = delete;

    // Waits for the election to become ready, subscribes to leadership
    // changes and arms the scheduler when already leader. Returns false if
    // the election is not ready within `ready_timeout`.
    bool start(std::chrono::milliseconds ready_timeout = std::chrono::seconds(30));
    void stop();

    // Fire-and-forget intake. Derives Discrepancy, then queues (leader) or
    // forwards (follower).
    void queue_responses(ResponseBatch batch);

    // Leader-side intake of a batch forwarded by a follower. Discrepancy
    // travels with the records and is not recomputed. Fails when this
    // instance is no longer leader.
    ServiceResult<int> accept_transferred(const ResponseBatch& batch);

    // Administrative flush of one survey: leader only, random order, no
    // percentage throttle and no minimum threshold.
    ServiceResult<int> flush_pending_responses(const std::string& survey_id);

#ifdef DSS_ENABLE_FORCE_FLUSH
    // Debug builds only. Persists the whole queue ignoring every threshold.
    int force_flush_all();
#endif

    // One throttled cycle. Runs on the scheduler thread; callable directly.
    void run_flush_cycle();

    void handle_leadership_changed(bool is_leader);

    // Re-sends records retained after a failed follower transfer.
    bool retry_transfer();

    DssStatus get_status() const;
    StatusChannel& status_channel() { return status_channel_; }

    size_t pending_count() const;
    bool is_scheduler_armed() const;
    int current_percentage() const;
};

} // namespace dss

#endif // DELAYED_SUBMISSION_SERVICE_H
