/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: test_delayed_submission.cpp

    Description:
        Tests for DelayedSubmissionService with in-process collaborators.
        The default delay windows (minutes) keep the timer from ever firing
        during a test; flush cycles are driven with run_flush_cycle().

        Test Coverage:
        - Test 1: Worked example flushes exactly three records
        - Test 2: Cycles drain down to the minimum, then reset the percentage
        - Test 3: Follower forwards a batch in exactly one call
        - Test 4: Failed transfers retain records without duplication
        - Test 5: Demotion drains the whole queue in one call
        - Test 6: Promotion arms the scheduler for an inherited queue
        - Test 7: Administrative flush
        - Test 8: Text anonymization and its failure path
        - Test 9: Persistence failure restores the selected records
        - Test 10: Leader-side intake of transferred batches
        - Test 11: Status snapshot and status stream
        - Test 12: Leadership events and shutdown drain
        - Test 13: Forced flush (debug builds)
        - Test 14: Logs never carry answer content
        - Test 15: Unexpected storage exceptions do not escape the timer
        - Test 16: Intake racing a flush cycle lands exactly once

    Exit Codes:
        0: All tests passed
        1: One or more tests failed

*******************************************************************************/

#include "submission/delayed_submission_service.h"
#include "common/logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dss;

namespace {

const char* kSecretAnswer = "my manager is the problem";

class FakeLeadership : public LeadershipView {
public:
    std::atomic<bool> leader{true};
    std::atomic<bool> ready{true};

    bool is_leader() const override { return leader; }
    bool is_ready() const override { return ready; }
    std::string instance_id() const override { return "web-1:8080"; }
    std::string leader_id() const override { return leader ? "web-1:8080" : "web-2:8080"; }
};

class FakePersistence : public PersistenceGateway {
public:
    std::mutex mutex;
    std::map<std::string, int> question_counts;
    std::vector<ResponseBatch> persisted;
    int persist_calls = 0;
    bool fail = false;
    bool fail_unexpectedly = false;
    bool count_fails_unexpectedly = false;
    std::function<void(const std::string&)> on_count;

    int question_count(const std::string& survey_id) override {
        if (on_count) on_count(survey_id);
        if (count_fails_unexpectedly) throw std::runtime_error(std::string("lookup failed: ") + kSecretAnswer);
        std::lock_guard<std::mutex> lock(mutex);
        auto it = question_counts.find(survey_id);
        return it == question_counts.end() ? 0 : it->second;
    }

    void persist(const ResponseBatch& responses) override {
        std::lock_guard<std::mutex> lock(mutex);
        persist_calls++;
        if (fail) throw PersistenceError(std::string("disk full while writing ") + kSecretAnswer);
        if (fail_unexpectedly) throw std::runtime_error(std::string("connection reset: ") + kSecretAnswer);
        persisted.push_back(responses);
    }

    size_t persisted_total() {
        std::lock_guard<std::mutex> lock(mutex);
        size_t total = 0;
        for (const auto& batch : persisted) total += batch.size();
        return total;
    }
};

class FakeAnonymizer : public TextAnonymizer {
public:
    bool fail = false;
    int calls = 0;

    std::string anonymize(const std::string& text) override {
        calls++;
        if (fail) throw AnonymizationError("anonymizer down");
        return "[redacted:" + std::to_string(text.size()) + "]";
    }
};

class FakeTransfer : public TransferClient {
public:
    std::mutex mutex;
    std::vector<ResponseBatch> calls;
    std::atomic<bool> reachable{true};

    ServiceResult<int> transfer_responses(const ResponseBatch& batch) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(batch);
        if (!reachable) {
            return ServiceResult<int>::failure("Leader unreachable: connection refused");
        }
        return ServiceResult<int>::success(static_cast<int>(batch.size()),
                                           "Responses transferred successfully");
    }

    ServiceResult<bool> verify_communication() override {
        return ServiceResult<bool>::success(true, "Communication test successful");
    }

    ServiceResult<bool> close_survey(const std::string&) override {
        return ServiceResult<bool>::success(true, "Survey closed successfully");
    }

    size_t call_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls.size();
    }
};

struct Fixture {
    DssConfig config;
    FakeLeadership leadership;
    LeadershipChannel channel;
    FakePersistence persistence;
    FakeAnonymizer anonymizer;
    FakeTransfer transfer;

    Fixture() {
        config.reset_chance_percentage = 0;
    }
};

ResponseBatch make_batch(const std::string& survey, int count,
                         QuestionType type = QuestionType::SINGLE_CHOICE,
                         const std::string& answer = "2") {
    ResponseBatch batch;
    for (int i = 0; i < count; i++) {
        PendingResponse response;
        response.survey_id = survey;
        response.question_id = i;
        response.question_type = type;
        response.answer = answer;
        batch.push_back(response);
    }
    return batch;
}

template <typename Pred>
bool wait_for(Pred pred, int timeout_ms = 2000) {
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

int main() {
    Logger::set_level(LogLevel::WARNING);

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Worked example flushes three records... ";
        try {
            Fixture f;
            f.persistence.question_counts["survey-a"] = 3;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 17);

            service.queue_responses(make_batch("survey-a", 12));
            assert(service.pending_count() == 12);
            assert(service.is_scheduler_armed());
            assert(service.current_percentage() == 30);

            service.run_flush_cycle();

            assert(f.persistence.persist_calls == 1);
            assert(f.persistence.persisted_total() == 3);
            assert(service.pending_count() == 9);
            assert(service.current_percentage() == 32);
            assert(service.is_scheduler_armed());

            DssStatus status = service.get_status();
            assert(status.last_flush_amount == 3);
            assert(status.next_flush_time.has_value());
            assert(f.transfer.call_count() == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Drain to the minimum, then reset... ";
        try {
            Fixture f;
            f.persistence.question_counts["survey-a"] = 3;
            f.persistence.question_counts["survey-b"] = 10;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 23);

            service.queue_responses(make_batch("survey-a", 20));
            service.queue_responses(make_batch("survey-b", 25));   // below 30

            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 6);
            assert(service.current_percentage() == 32);

            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 11);
            assert(service.current_percentage() == 34);

            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 11);
            assert(f.persistence.persist_calls == 2);
            assert(service.current_percentage() == f.config.min_percentage);
            assert(!service.is_scheduler_armed());
            assert(service.pending_count() == 9 + 25);

            for (const auto& batch : f.persistence.persisted) {
                for (const auto& r : batch) {
                    assert(r.survey_id == "survey-a");
                }
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Follower forwards in one call... ";
        try {
            Fixture f;
            f.leadership.leader = false;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 1);

            service.queue_responses(make_batch("survey-a", 5));

            assert(f.transfer.call_count() == 1);
            assert(f.transfer.calls[0].size() == 5);
            assert(service.pending_count() == 0);
            assert(!service.is_scheduler_armed());
            assert(service.get_status().has_transferred_responses);

            // Followers never flush
            service.run_flush_cycle();
            assert(f.persistence.persist_calls == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Failed transfers retain without duplication... ";
        try {
            Fixture f;
            f.leadership.leader = false;
            f.transfer.reachable = false;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 1);

            service.queue_responses(make_batch("survey-a", 5));
            assert(service.pending_count() == 5);
            assert(!service.is_scheduler_armed());
            assert(!service.get_status().has_transferred_responses);

            assert(!service.retry_transfer());
            assert(!service.retry_transfer());
            assert(service.pending_count() == 5);

            // Retained records ride along with the next batch
            service.queue_responses(make_batch("survey-a", 2));
            assert(service.pending_count() == 7);
            assert(f.transfer.calls.back().size() == 7);

            f.transfer.reachable = true;
            assert(service.retry_transfer());
            assert(f.transfer.calls.back().size() == 7);
            assert(service.pending_count() == 0);
            assert(f.transfer.call_count() == 5);

            // Nothing retained: no outbound call
            assert(service.retry_transfer());
            assert(f.transfer.call_count() == 5);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Demotion drains the queue in one call... ";
        try {
            Fixture f;
            f.persistence.question_counts["survey-a"] = 50;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 5);

            service.queue_responses(make_batch("survey-a", 7));
            assert(service.is_scheduler_armed());

            f.leadership.leader = false;
            service.handle_leadership_changed(false);

            assert(f.transfer.call_count() == 1);
            assert(f.transfer.calls[0].size() == 7);
            assert(service.pending_count() == 0);
            assert(!service.is_scheduler_armed());
            assert(!service.get_status().next_flush_time.has_value());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Promotion arms for an inherited queue... ";
        try {
            Fixture f;
            f.leadership.leader = false;
            f.transfer.reachable = false;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 9);

            service.queue_responses(make_batch("survey-a", 10));
            assert(service.pending_count() == 10);
            assert(!service.is_scheduler_armed());

            f.leadership.leader = true;
            service.handle_leadership_changed(true);
            assert(service.is_scheduler_armed());

            // No questions registered: minimum is 0, 30% of 10 flushes
            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 3);
            assert(service.pending_count() == 7);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Administrative flush... ";
        try {
            Fixture f;
            f.persistence.question_counts["survey-a"] = 100;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 31);

            auto empty = service.flush_pending_responses("survey-a");
            assert(empty.successful);
            assert(empty.data == 0);
            assert(empty.message == "No pending responses found for survey ID survey-a");
            assert(f.persistence.persist_calls == 0);

            service.queue_responses(make_batch("survey-a", 4));
            service.queue_responses(make_batch("survey-b", 6));

            // Ignores both the percentage and the minimum threshold
            auto result = service.flush_pending_responses("survey-a");
            assert(result.successful);
            assert(result.data == 4);
            assert(result.message == "Successfully flushed 4 responses for survey ID survey-a");
            assert(f.persistence.persisted_total() == 4);
            assert(service.pending_count() == 6);
            assert(service.get_status().last_flush_amount == 4);

            f.leadership.leader = false;
            auto rejected = service.flush_pending_responses("survey-b");
            assert(!rejected.successful);
            assert(rejected.message == "This instance (web-1:8080) is not the leader");
            assert(service.pending_count() == 6);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Text anonymization... ";
        try {
            Fixture f;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 2);

            ResponseBatch batch = make_batch("survey-a", 2, QuestionType::TEXT, "hello there");
            batch.push_back(make_batch("survey-a", 1, QuestionType::TEXT, "   ")[0]);
            batch.push_back(make_batch("survey-a", 1, QuestionType::RATING, "4")[0]);
            service.queue_responses(batch);

            service.flush_pending_responses("survey-a");
            assert(f.anonymizer.calls == 2);

            int redacted = 0;
            for (const auto& r : f.persistence.persisted[0]) {
                if (r.question_type == QuestionType::TEXT && r.answer == "[redacted:11]") redacted++;
                if (r.question_type == QuestionType::RATING) assert(r.answer == "4");
                if (r.answer == "   ") assert(r.question_type == QuestionType::TEXT);
            }
            assert(redacted == 2);

            // Anonymizer down: the original text is persisted, flush succeeds
            f.anonymizer.fail = true;
            service.queue_responses(make_batch("survey-a", 3, QuestionType::TEXT, "original"));
            auto result = service.flush_pending_responses("survey-a");
            assert(result.successful);
            assert(result.data == 3);
            for (const auto& r : f.persistence.persisted[1]) {
                assert(r.answer == "original");
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: Persistence failure restores records... ";
        try {
            Fixture f;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 4);

            service.queue_responses(make_batch("survey-a", 10));
            f.persistence.fail = true;

            service.run_flush_cycle();
            assert(f.persistence.persist_calls == 1);
            assert(service.pending_count() == 10);
            assert(service.current_percentage() == 30);
            assert(service.is_scheduler_armed());

            auto result = service.flush_pending_responses("survey-a");
            assert(!result.successful);
            assert(service.pending_count() == 10);

            f.persistence.fail = false;
            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 3);
            assert(service.pending_count() == 7);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 10: Leader intake of transferred batches... ";
        try {
            Fixture f;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 6);

            auto none = service.accept_transferred(ResponseBatch());
            assert(none.successful && none.data == 0);
            assert(!service.is_scheduler_armed());

            ResponseBatch batch = make_batch("survey-a", 2, QuestionType::RATING, "5");
            batch[0].discrepancy = 1.5;
            batch[1].discrepancy = -1.5;
            auto accepted = service.accept_transferred(batch);
            assert(accepted.successful);
            assert(accepted.data == 2);
            assert(accepted.message == "Responses transferred successfully");
            assert(service.pending_count() == 2);
            assert(service.is_scheduler_armed());

            // Discrepancy travels with the record
            service.flush_pending_responses("survey-a");
            double sum = 0;
            for (const auto& r : f.persistence.persisted[0]) sum += std::fabs(r.discrepancy);
            assert(std::fabs(sum - 3.0) < 1e-9);

            f.leadership.leader = false;
            auto rejected = service.accept_transferred(batch);
            assert(!rejected.successful);
            assert(rejected.message == "This instance is not the leader");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 11: Status snapshot and stream... ";
        try {
            Fixture f;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 8);
            auto statuses = service.status_channel().subscribe();

            service.queue_responses(make_batch("survey-a", 4));

            DssStatus update;
            assert(statuses->try_pop(update));
            assert(update.pending == 4);
            assert(update.is_leader);
            assert(update.instance_id == "web-1:8080");

            JsonValue json = service.get_status().to_json();
            assert(json.get_int("pending") == 4);
            assert(json.get_int("currentPercentage") == 30);
            assert(json.get_bool("isLeader"));
            assert(json.get_bool("isReady"));
            assert(json.get_string("instanceId") == "web-1:8080");
            assert(json.find("nextTime") != nullptr && json.find("nextTime")->is_string());
            assert(json.has("lastTime"));
            assert(json.has("lastAmount"));
            assert(json.has("hasTransferredResponses"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 12: Leadership events and shutdown drain... ";
        try {
            Fixture f;
            f.leadership.leader = false;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 12);

            // Election not ready: start gives up
            f.leadership.ready = false;
            assert(!service.start(std::chrono::milliseconds(300)));

            f.leadership.ready = true;
            assert(service.start(std::chrono::milliseconds(1000)));
            assert(!service.is_scheduler_armed());

            f.leadership.leader = true;
            f.channel.publish(LeadershipEvent(true, "web-1:8080"));
            assert(wait_for([&] { return service.is_scheduler_armed(); }));

            f.transfer.reachable = false;
            f.leadership.leader = false;
            service.queue_responses(make_batch("survey-a", 3));   // transfer fails
            f.channel.publish(LeadershipEvent(false, "web-1:8080"));
            assert(wait_for([&] { return !service.is_scheduler_armed(); }));
            // The drain takes the records out while the call is in flight
            assert(wait_for([&] {
                return f.transfer.call_count() >= 2 && service.pending_count() == 3;
            }));

            // Follower shutdown: one final attempt carrying everything
            f.transfer.reachable = true;
            size_t calls_before = f.transfer.call_count();
            service.stop();
            assert(f.transfer.call_count() == calls_before + 1);
            assert(f.transfer.calls.back().size() == 3);
            assert(service.pending_count() == 0);

            // Leader shutdown: nothing persisted, nothing transferred
            Fixture g;
            DelayedSubmissionService leader(g.config, g.leadership, g.channel,
                                            g.persistence, g.anonymizer, g.transfer, 13);
            assert(leader.start(std::chrono::milliseconds(1000)));
            leader.queue_responses(make_batch("survey-a", 5));
            leader.stop();
            assert(g.persistence.persist_calls == 0);
            assert(g.transfer.call_count() == 0);
            assert(leader.pending_count() == 0);

            // Intake after shutdown is refused instead of silently dropped
            leader.queue_responses(make_batch("survey-a", 4));
            assert(leader.pending_count() == 0);
            assert(!leader.is_scheduler_armed());
            auto late = leader.accept_transferred(make_batch("survey-a", 2));
            assert(!late.successful);
            assert(leader.pending_count() == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 13: Forced flush... ";
        try {
#ifdef DSS_ENABLE_FORCE_FLUSH
            Fixture f;
            f.persistence.question_counts["survey-a"] = 100;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 14);
            service.queue_responses(make_batch("survey-a", 4));
            service.queue_responses(make_batch("survey-b", 2));

            assert(service.force_flush_all() == 6);
            assert(service.pending_count() == 0);
            assert(f.persistence.persisted_total() == 6);

            f.leadership.leader = false;
            assert(service.force_flush_all() == 0);
#endif
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 14: Logs never carry answer content... ";
        std::ostringstream captured;
        try {
            Logger::set_level(LogLevel::DEBUG);
            Logger::set_output(&captured);

            Fixture f;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 15);

            service.queue_responses(make_batch("survey-a", 4, QuestionType::TEXT, kSecretAnswer));
            f.anonymizer.fail = true;
            f.persistence.fail = true;
            service.run_flush_cycle();
            service.flush_pending_responses("survey-a");

            f.persistence.fail = false;
            service.run_flush_cycle();
            service.flush_pending_responses("survey-a");

            f.leadership.leader = false;
            f.transfer.reachable = false;
            service.queue_responses(make_batch("survey-b", 2, QuestionType::TEXT, kSecretAnswer));
            service.handle_leadership_changed(false);

            Logger::set_output(&std::cout);
            Logger::set_level(LogLevel::WARNING);

            std::string logs = captured.str();
            assert(!logs.empty());
            assert(logs.find(kSecretAnswer) == std::string::npos);
            assert(logs.find("details omitted") != std::string::npos);
            assert(logs.find("Text anonymization failed") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            Logger::set_output(&std::cout);
            Logger::set_level(LogLevel::WARNING);
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 15: Unexpected storage exceptions... ";
        std::ostringstream captured;
        try {
            Logger::set_output(&captured);

            Fixture f;
            f.config.cold_delay_min_sec = 0;
            f.config.cold_delay_max_sec = 0;
            f.persistence.fail_unexpectedly = true;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 21);
            assert(service.start(std::chrono::milliseconds(1000)));

            // The timer fires on its own thread with a zero cold window.
            service.queue_responses(make_batch("survey-a", 10, QuestionType::TEXT, kSecretAnswer));
            assert(wait_for([&] {
                std::lock_guard<std::mutex> lock(f.persistence.mutex);
                return f.persistence.persist_calls >= 1;
            }));
            assert(wait_for([&] { return service.pending_count() == 10; }));
            assert(service.is_scheduler_armed());
            assert(service.current_percentage() == 30);

            auto result = service.flush_pending_responses("survey-a");
            assert(!result.successful);
            assert(service.pending_count() == 10);

            f.persistence.fail_unexpectedly = false;
            f.persistence.count_fails_unexpectedly = true;
            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 0);
            assert(service.pending_count() == 10);

            service.stop();
            Logger::set_output(&std::cout);

            std::string logs = captured.str();
            assert(logs.find("details omitted") != std::string::npos);
            assert(logs.find(kSecretAnswer) == std::string::npos);
            assert(logs.find("connection reset") == std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            Logger::set_output(&std::cout);
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 16: Intake racing a flush cycle... ";
        try {
            // A new survey arrives while question counts are read: nothing is
            // eligible this cycle, so the timer must be armed for the new batch.
            Fixture f;
            f.persistence.question_counts["survey-a"] = 3;
            f.persistence.question_counts["survey-b"] = 1;
            DelayedSubmissionService service(f.config, f.leadership, f.channel,
                                             f.persistence, f.anonymizer, f.transfer, 23);

            std::atomic<bool> entered{false};
            std::atomic<bool> release{false};
            f.persistence.on_count = [&](const std::string&) {
                entered = true;
                while (!release) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            };

            service.queue_responses(make_batch("survey-a", 2));
            std::thread cycle([&] { service.run_flush_cycle(); });
            assert(wait_for([&] { return entered.load(); }));
            service.queue_responses(make_batch("survey-b", 10));
            release = true;
            cycle.join();

            assert(f.persistence.persist_calls == 0);
            assert(service.pending_count() == 12);
            assert(service.is_scheduler_armed());
            assert(service.current_percentage() == 30);

            f.persistence.on_count = nullptr;
            service.run_flush_cycle();
            assert(f.persistence.persisted_total() == 3);
            assert(service.pending_count() == 9);
            for (const auto& response : f.persistence.persisted[0]) {
                assert(response.survey_id == "survey-b");
            }

            // Same survey mid-cycle: the cycle sees the whole batch at selection.
            Fixture g;
            g.persistence.question_counts["survey-a"] = 3;
            DelayedSubmissionService second(g.config, g.leadership, g.channel,
                                            g.persistence, g.anonymizer, g.transfer, 29);
            entered = false;
            release = false;
            g.persistence.on_count = [&](const std::string&) {
                entered = true;
                while (!release) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            };

            second.queue_responses(make_batch("survey-a", 2));
            std::thread racing([&] { second.run_flush_cycle(); });
            assert(wait_for([&] { return entered.load(); }));
            second.queue_responses(make_batch("survey-a", 10));
            release = true;
            racing.join();

            assert(g.persistence.persisted_total() == 3);
            assert(second.pending_count() == 9);
            assert(g.persistence.persisted_total() + second.pending_count() == 12);
            assert(second.is_scheduler_armed());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return failed > 0 ? 1 : 0;
}
