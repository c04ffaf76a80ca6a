/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: flush_policy.cpp

*******************************************************************************/

#include "submission/flush_policy.h"

#include <algorithm>

namespace dss {

int minimum_eligible(int question_count, int minimum_survey_submissions) {
    return std::max(0, question_count) * std::max(0, minimum_survey_submissions);
}

int amount_to_submit(int pending, int minimum, int percentage) {
    if (pending <= minimum) return 0;

    // Integer ceil(pending * percentage / 100)
    long long scaled = static_cast<long long>(pending) * std::max(0, percentage);
    int by_percentage = static_cast<int>((scaled + 99) / 100);
    return std::min(by_percentage, pending - minimum);
}

int next_percentage(int current, const DssConfig& config, std::mt19937& rng) {
    std::uniform_int_distribution<int> roll(0, 99);
    if (roll(rng) < config.reset_chance_percentage) {
        return config.min_percentage;
    }
    int next = std::min(current + config.percentage_increment, config.max_percentage);
    return std::max(next, config.min_percentage);
}

namespace {

std::chrono::milliseconds draw_seconds(int min_sec, int max_sec, std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(min_sec, std::max(min_sec, max_sec));
    return std::chrono::seconds(dist(rng));
}

} // namespace

std::chrono::milliseconds cold_delay(const DssConfig& config, std::mt19937& rng) {
    return draw_seconds(config.cold_delay_min_sec, config.cold_delay_max_sec, rng);
}

std::chrono::milliseconds warm_delay(const DssConfig& config, std::mt19937& rng) {
    return draw_seconds(config.warm_delay_min_sec, config.warm_delay_max_sec, rng);
}

} // namespace dss
