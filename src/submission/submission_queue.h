/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: submission_queue.h

    Description:
        In-memory holding area for response records that are not yet durable.
        Records are grouped implicitly by survey id.

        Selection is always random: take_random() and take_survey() never
        return records in arrival order, so the order in which records reach
        storage says nothing about the order in which they were submitted.

    Thread Safety:
        SubmissionQueue does no locking of its own. Its owner
        (DelayedSubmissionService) guards the queue and the schedule state
        with a single mutex so that a batch lands entirely in one flush cycle.

*******************************************************************************/

#ifndef SUBMISSION_QUEUE_H
#define SUBMISSION_QUEUE_H

#include "model/pending_response.h"

#include <map>
#include <random>
#include <string>
#include <vector>

namespace dss {

class SubmissionQueue {
private:
    std::vector<PendingResponse> records_;

public:
    void append(const ResponseBatch& batch);

    // Puts back records that were taken but could not be delivered.
    void restore(ResponseBatch batch);

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // survey id -> pending record count
    std::map<std::string, int> count_by_survey() const;

    // Removes `amounts[survey]` records of each listed survey, chosen
    // uniformly at random, and returns them shuffled. Amounts larger than a
    // survey's pending count take everything of that survey.
    ResponseBatch take_random(const std::map<std::string, int>& amounts, std::mt19937& rng);

    // Removes every record of one survey, in random order.
    ResponseBatch take_survey(const std::string& survey_id, std::mt19937& rng);

    // Removes everything, in queue order.
    ResponseBatch take_all();
};

} // namespace dss

#endif // SUBMISSION_QUEUE_H
