/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: delayed_submission_service.cpp

    Description:
        Queueing, throttled flushing, follower transfer and leadership
        hand-over for delayed submission.

    SHIELD Logging Rule:
        Log lines here carry counts, survey ids and instance ids. A failure
        inside the flush/anonymize/persist pipeline logs a fixed message;
        exception text from those paths is never written.

*******************************************************************************/

#include "submission/delayed_submission_service.h"
#include "submission/flush_policy.h"
#include "common/logger.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>

namespace dss {

namespace {

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

DelayedSubmissionService::DelayedSubmissionService(const DssConfig& config,
                                                   const LeadershipView& leadership,
                                                   LeadershipChannel& leadership_channel,
                                                   PersistenceGateway& persistence,
                                                   TextAnonymizer& anonymizer,
                                                   TransferClient& transfer,
                                                   uint32_t seed)
    : config_(config),
      leadership_(leadership),
      leadership_channel_(leadership_channel),
      persistence_(persistence),
      anonymizer_(anonymizer),
      transfer_(transfer),
      scheduler_(config, [this]() { run_flush_cycle(); }, seed),
      has_transferred_responses_(false),
      appended_total_(0),
      stopped_(false),
      running_(false) {}

DelayedSubmissionService::~DelayedSubmissionService() {
    stop();
}

//==============================================================================
// LIFECYCLE
//==============================================================================

bool DelayedSubmissionService::start(std::chrono::milliseconds ready_timeout) {
    if (running_) return true;

    auto deadline = std::chrono::steady_clock::now() + ready_timeout;
    if (!leadership_.is_ready()) {
        Logger::info("Waiting for leader election..");
    }
    while (!leadership_.is_ready()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::error("Leader election did not become ready; delayed submission not started");
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    leadership_events_ = leadership_channel_.subscribe();
    running_ = true;
    scheduler_.start();
    event_thread_ = std::thread(&DelayedSubmissionService::event_loop, this);

    if (leadership_.is_leader()) {
        handle_leadership_changed(true);
    } else {
        Logger::info("Standing by..");
    }
    return true;
}

void DelayedSubmissionService::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }

    if (leadership_events_) {
        leadership_events_->close();
    }
    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    // Joins the timer thread; an in-flight cycle finishes first.
    scheduler_.stop();

    bool leader = leadership_.is_leader();
    size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler_.disarm();
        pending = queue_.size();
    }

    if (pending == 0) return;

    if (!leader) {
        Logger::info("Attempting final transfer of " + std::to_string(pending) +
                     " responses to leader");
        transfer_to_leader(ResponseBatch());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = queue_.take_all().size();
    }
    Logger::warning("Leader shutting down with " + std::to_string(pending) +
                    " unflushed responses; they are not persisted");
}

void DelayedSubmissionService::event_loop() {
    while (running_) {
        LeadershipEvent event;
        if (leadership_events_->pop(event, std::chrono::milliseconds(200))) {
            handle_leadership_changed(event.is_leader);
        }
    }
}

//==============================================================================
// INTAKE
//==============================================================================

void DelayedSubmissionService::queue_responses(ResponseBatch batch) {
    if (batch.empty()) return;

    analyze_responses(batch);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (leadership_.is_leader()) {
            if (stopped_) {
                Logger::warning("Delayed submission stopped; " + std::to_string(batch.size()) +
                                " responses not queued");
                return;
            }
            queue_.append(batch);
            appended_total_ += batch.size();
            if (scheduler_.arm_if_idle()) {
                Logger::debug("Delayed submission timer armed");
            }
            publish_status();
            return;
        }
    }

    transfer_to_leader(std::move(batch));
}

ServiceResult<int> DelayedSubmissionService::accept_transferred(const ResponseBatch& batch) {
    if (batch.empty()) {
        return ServiceResult<int>::success(0, "No responses to transfer");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!leadership_.is_leader()) {
        return ServiceResult<int>::failure("This instance is not the leader");
    }
    if (stopped_) {
        return ServiceResult<int>::failure("Delayed submission is shutting down");
    }

    queue_.append(batch);
    appended_total_ += batch.size();
    scheduler_.arm_if_idle();
    publish_status();
    return ServiceResult<int>::success(static_cast<int>(batch.size()),
                                       "Responses transferred successfully");
}

//==============================================================================
// FOLLOWER TRANSFER
//==============================================================================

ServiceResult<int> DelayedSubmissionService::transfer_to_leader(ResponseBatch extra) {
    ResponseBatch batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch = queue_.take_all();
    }
    batch.insert(batch.end(),
                 std::make_move_iterator(extra.begin()),
                 std::make_move_iterator(extra.end()));

    if (batch.empty()) {
        return ServiceResult<int>::success(0, "No responses to transfer");
    }

    const int count = static_cast<int>(batch.size());

    // Promoted in the meantime: the records stay here for our own scheduler.
    if (leadership_.is_leader()) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.restore(std::move(batch));
        appended_total_ += static_cast<uint64_t>(count);
        scheduler_.arm_if_idle();
        publish_status();
        return ServiceResult<int>::success(count, "Responses kept on the leader");
    }

    Logger::debug("Attempting to transfer " + std::to_string(count) + " responses to leader");
    ServiceResult<int> result = transfer_.transfer_responses(batch);

    std::lock_guard<std::mutex> lock(mutex_);
    if (result.successful) {
        has_transferred_responses_ = true;
        Logger::info("Successfully transferred " + std::to_string(count) + " responses to leader");
    } else {
        queue_.restore(std::move(batch));
        Logger::warning("Failed to transfer " + std::to_string(count) +
                        " responses to leader (" + result.message + "); retained for retry");
    }
    publish_status();
    return result;
}

bool DelayedSubmissionService::retry_transfer() {
    if (leadership_.is_leader()) return true;
    return transfer_to_leader(ResponseBatch()).successful;
}

//==============================================================================
// FLUSHING
//==============================================================================

void DelayedSubmissionService::anonymize_text_answers(ResponseBatch& batch) {
    int failures = 0;
    for (auto& response : batch) {
        if (response.question_type != QuestionType::TEXT || is_blank(response.answer)) {
            continue;
        }
        try {
            response.answer = anonymizer_.anonymize(response.answer);
        } catch (const std::exception&) {
            failures++;
        }
    }

    if (failures > 0) {
        Logger::warning("Text anonymization failed for " + std::to_string(failures) +
                        " responses, proceeding with original text");
    }
}

void DelayedSubmissionService::run_flush_cycle() {
    if (!leadership_.is_leader()) {
        Logger::debug("Instance " + leadership_.instance_id() +
                      " skipping processing as it's not the leader");
        return;
    }

    Logger::debug("Leader instance " + leadership_.instance_id() + " processing pending submissions");

    std::map<std::string, int> counts;
    uint64_t appended_before = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counts = queue_.count_by_survey();
        appended_before = appended_total_;
    }

    // Question counts come from storage; fetched without holding the lock.
    std::map<std::string, int> minimums;
    for (const auto& [survey_id, pending] : counts) {
        try {
            int questions = persistence_.question_count(survey_id);
            minimums[survey_id] = minimum_eligible(questions, config_.minimum_survey_submissions);
        } catch (const std::exception&) {
            Logger::error("Cannot read question count for survey " + survey_id +
                          "; survey skipped this cycle");
        }
    }

    ResponseBatch selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!leadership_.is_leader()) return;

        int percentage = scheduler_.state().current_percentage;
        std::map<std::string, int> current = queue_.count_by_survey();
        std::map<std::string, int> amounts;
        for (const auto& [survey_id, minimum] : minimums) {
            auto it = current.find(survey_id);
            if (it == current.end()) continue;
            int amount = amount_to_submit(it->second, minimum, percentage);
            if (amount > 0) {
                amounts[survey_id] = amount;
            }
        }
        selected = queue_.take_random(amounts, scheduler_.rng());
    }

    const int submitted = static_cast<int>(selected.size());
    if (submitted > 0) {
        anonymize_text_answers(selected);
        try {
            persistence_.persist(selected);
        } catch (const std::exception&) {
            Logger::error("Exception in delayed submission (details omitted due to SHIELD compliance)");
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.restore(std::move(selected));
            if (leadership_.is_leader()) {
                scheduler_.rearm();
            }
            publish_status();
            return;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (submitted > 0) {
        scheduler_.record_flush(submitted, Clock::now());
        scheduler_.advance_percentage();
        if (leadership_.is_leader()) {
            scheduler_.rearm();
        }
        Logger::info("Delayed submission persisted " + std::to_string(submitted) + " responses");
    } else {
        scheduler_.disarm();
        scheduler_.reset_percentage();
        // A batch that arrived while this cycle ran starts a fresh cold window.
        if (appended_total_ != appended_before && !queue_.empty() && leadership_.is_leader()) {
            scheduler_.arm_if_idle();
        }
    }
    publish_status();
}

ServiceResult<int> DelayedSubmissionService::flush_pending_responses(const std::string& survey_id) {
    if (!leadership_.is_leader()) {
        Logger::warning("Non-leader instance " + leadership_.instance_id() +
                        " attempted to flush responses for survey " + survey_id);
        return ServiceResult<int>::failure("This instance (" + leadership_.instance_id() +
                                           ") is not the leader");
    }

    ResponseBatch selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        selected = queue_.take_survey(survey_id, scheduler_.rng());
    }

    if (selected.empty()) {
        return ServiceResult<int>::success(0, "No pending responses found for survey ID " + survey_id);
    }

    const int count = static_cast<int>(selected.size());
    anonymize_text_answers(selected);
    try {
        persistence_.persist(selected);
    } catch (const std::exception&) {
        Logger::error("Error flushing responses for survey ID " + survey_id +
                      " (details omitted due to SHIELD compliance)");
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.restore(std::move(selected));
        publish_status();
        return ServiceResult<int>::failure("Error flushing responses for survey ID " + survey_id);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler_.record_flush(count, Clock::now());
        publish_status();
    }

    Logger::info("Flushed " + std::to_string(count) + " responses for survey ID " + survey_id);
    return ServiceResult<int>::success(count, "Successfully flushed " + std::to_string(count) +
                                              " responses for survey ID " + survey_id);
}

#ifdef DSS_ENABLE_FORCE_FLUSH
int DelayedSubmissionService::force_flush_all() {
    if (!leadership_.is_leader()) {
        Logger::warning("Non-leader instance " + leadership_.instance_id() +
                        " attempted to force flush all responses");
        return 0;
    }

    Logger::warning("DEVELOPER NOTICE: Force flushing all pending responses - "
                    "THIS SHOULD NEVER HAPPEN IN PRODUCTION!");

    ResponseBatch all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all = queue_.take_all();
    }

    const int count = static_cast<int>(all.size());
    if (count > 0) {
        anonymize_text_answers(all);
        try {
            persistence_.persist(all);
        } catch (const std::exception&) {
            Logger::error("Exception in forced flush (details omitted due to SHIELD compliance)");
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.restore(std::move(all));
            publish_status();
            return 0;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (count > 0) {
        scheduler_.record_flush(count, Clock::now());
    }
    publish_status();
    return count;
}
#endif

//==============================================================================
// LEADERSHIP
//==============================================================================

void DelayedSubmissionService::handle_leadership_changed(bool is_leader) {
    if (is_leader) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduler_.arm();
            publish_status();
        }
        Logger::info("Started processing timer");
        return;
    }

    Logger::info("This instance is now a follower");

    size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler_.disarm();
        pending = queue_.size();
        publish_status();
    }

    if (pending > 0) {
        Logger::info("Transferring " + std::to_string(pending) + " existing responses to new leader");
        transfer_to_leader(ResponseBatch());
    }
}

//==============================================================================
// STATUS
//==============================================================================

DssStatus DelayedSubmissionService::build_status() const {
    const ScheduleState& state = scheduler_.state();

    DssStatus status;
    status.pending = static_cast<int>(queue_.size());
    status.last_flush_time = state.last_flush_time;
    status.last_flush_amount = state.last_flush_amount;
    status.current_percentage = state.current_percentage;
    status.next_flush_time = state.next_flush_time;
    status.is_leader = leadership_.is_leader();
    status.is_ready = leadership_.is_ready();
    status.instance_id = leadership_.instance_id();
    status.has_transferred_responses = has_transferred_responses_;
    return status;
}

void DelayedSubmissionService::publish_status() {
    status_channel_.publish(build_status());
}

DssStatus DelayedSubmissionService::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_status();
}

size_t DelayedSubmissionService::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool DelayedSubmissionService::is_scheduler_armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_.is_active();
}

int DelayedSubmissionService::current_percentage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_.state().current_percentage;
}

} // namespace dss
