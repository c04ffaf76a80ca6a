/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: flush_policy.h

    Description:
        Arithmetic of the throttled flush cycle. Stateless; the delay
        scheduler and the submission service call these with their own state
        and random engine.

        Worked example (MinimumSurveySubmissions = 3, percentage = 30):
            survey with 3 questions, 12 pending
            minimum_eligible = 3 * 3 = 9
            amount_to_submit = min(ceil(12 * 0.30), 12 - 9) = min(4, 3) = 3

*******************************************************************************/

#ifndef FLUSH_POLICY_H
#define FLUSH_POLICY_H

#include "common/config.h"

#include <chrono>
#include <random>

namespace dss {

// Records of a survey that always stay back.
int minimum_eligible(int question_count, int minimum_survey_submissions);

// 0 while pending <= minimum; otherwise
// min(ceil(pending * percentage / 100), pending - minimum).
int amount_to_submit(int pending, int minimum, int percentage);

// With reset_chance_percentage probability returns min_percentage,
// otherwise current + increment capped at max_percentage. The result always
// lies within [min_percentage, max_percentage].
int next_percentage(int current, const DssConfig& config, std::mt19937& rng);

// Uniform draw from the long window (first arming after an empty queue).
std::chrono::milliseconds cold_delay(const DssConfig& config, std::mt19937& rng);

// Uniform draw from the short window (re-arm after a non-empty cycle).
std::chrono::milliseconds warm_delay(const DssConfig& config, std::mt19937& rng);

} // namespace dss

#endif // FLUSH_POLICY_H
