/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: dss_status.cpp

*******************************************************************************/

#include "model/dss_status.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dss {

std::string format_utc(TimePoint time) {
    auto seconds = Clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm utc_tm;
    gmtime_r(&seconds, &utc_tm);

    std::stringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

JsonValue DssStatus::to_json() const {
    JsonValue json = JsonValue::object();
    json["pending"] = pending;
    json["lastTime"] = format_utc(last_flush_time);
    json["lastAmount"] = last_flush_amount;
    json["currentPercentage"] = current_percentage;
    json["nextTime"] = next_flush_time ? JsonValue(format_utc(*next_flush_time)) : JsonValue();
    json["isLeader"] = is_leader;
    json["isReady"] = is_ready;
    json["instanceId"] = instance_id;
    json["hasTransferredResponses"] = has_transferred_responses;
    return json;
}

} // namespace dss
