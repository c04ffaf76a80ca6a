/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: submission_queue.cpp

*******************************************************************************/

#include "submission/submission_queue.h"

#include <algorithm>
#include <iterator>

namespace dss {

void SubmissionQueue::append(const ResponseBatch& batch) {
    records_.insert(records_.end(), batch.begin(), batch.end());
}

void SubmissionQueue::restore(ResponseBatch batch) {
    records_.insert(records_.end(),
                    std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
}

std::map<std::string, int> SubmissionQueue::count_by_survey() const {
    std::map<std::string, int> counts;
    for (const auto& record : records_) {
        counts[record.survey_id]++;
    }
    return counts;
}

ResponseBatch SubmissionQueue::take_random(const std::map<std::string, int>& amounts,
                                           std::mt19937& rng) {
    // Index positions per requested survey
    std::map<std::string, std::vector<size_t>> positions;
    for (size_t i = 0; i < records_.size(); ++i) {
        auto it = amounts.find(records_[i].survey_id);
        if (it != amounts.end() && it->second > 0) {
            positions[records_[i].survey_id].push_back(i);
        }
    }

    std::vector<bool> selected(records_.size(), false);
    for (auto& [survey_id, indices] : positions) {
        size_t wanted = static_cast<size_t>(amounts.at(survey_id));
        std::shuffle(indices.begin(), indices.end(), rng);
        size_t take = std::min(wanted, indices.size());
        for (size_t k = 0; k < take; ++k) {
            selected[indices[k]] = true;
        }
    }

    ResponseBatch taken;
    std::vector<PendingResponse> remaining;
    remaining.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        if (selected[i]) {
            taken.push_back(std::move(records_[i]));
        } else {
            remaining.push_back(std::move(records_[i]));
        }
    }
    records_.swap(remaining);

    std::shuffle(taken.begin(), taken.end(), rng);
    return taken;
}

ResponseBatch SubmissionQueue::take_survey(const std::string& survey_id, std::mt19937& rng) {
    ResponseBatch taken;
    auto split = std::stable_partition(records_.begin(), records_.end(),
        [&survey_id](const PendingResponse& record) { return record.survey_id != survey_id; });

    taken.assign(std::make_move_iterator(split), std::make_move_iterator(records_.end()));
    records_.erase(split, records_.end());

    std::shuffle(taken.begin(), taken.end(), rng);
    return taken;
}

ResponseBatch SubmissionQueue::take_all() {
    ResponseBatch taken;
    taken.swap(records_);
    return taken;
}

} // namespace dss
