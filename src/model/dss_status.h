/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: dss_status.h

    Description:
        Read-only observability snapshot of one instance: queue size,
        schedule state and leadership. Counts and timestamps only; a status
        never contains response content.

*******************************************************************************/

#ifndef DSS_STATUS_H
#define DSS_STATUS_H

#include "common/json.h"

#include <chrono>
#include <optional>
#include <string>

namespace dss {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct DssStatus {
    int pending;
    TimePoint last_flush_time;          // epoch when nothing was flushed yet
    int last_flush_amount;
    int current_percentage;
    std::optional<TimePoint> next_flush_time;
    bool is_leader;
    bool is_ready;
    std::string instance_id;
    bool has_transferred_responses;

    DssStatus()
        : pending(0), last_flush_amount(0), current_percentage(0),
          is_leader(false), is_ready(false), has_transferred_responses(false) {}

    JsonValue to_json() const;
};

// ISO-8601 UTC with milliseconds, e.g. "2026-10-19T14:32:15.123Z"
std::string format_utc(TimePoint time);

} // namespace dss

#endif // DSS_STATUS_H
