/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: instance_message.h

    Description:
        Wire format of the inter-instance channel. A follower sends one
        InstanceMessage per HTTP request to the leader and receives a
        ServiceResult envelope back.

        Message Types:
        - NO_OP:              reachability probe, acknowledged only
        - TRANSFER_RESPONSES: batch of PendingResponse to enqueue on the leader
        - CLOSE_SURVEY:       ask the leader to close a survey

        Request body:
            {"sourceInstanceId": "web-2:8080",
             "communicationType": "TransferResponses",
             "responses": [ ... ],
             "surveyId": null}

        Reply body:
            {"successful": true, "message": "...", "data": 5}

*******************************************************************************/

#ifndef INSTANCE_MESSAGE_H
#define INSTANCE_MESSAGE_H

#include "common/json.h"
#include "common/service_result.h"
#include "model/pending_response.h"

#include <cstdint>
#include <string>

namespace dss {

enum class CommunicationType : uint8_t {
    NO_OP = 0,
    TRANSFER_RESPONSES = 1,
    CLOSE_SURVEY = 2
};

std::string communication_type_to_string(CommunicationType type);
CommunicationType communication_type_from_json(const JsonValue& value);

struct InstanceMessage {
    std::string source_instance_id;
    CommunicationType type;
    ResponseBatch responses;
    std::string survey_id;           // empty when absent

    InstanceMessage() : type(CommunicationType::TRANSFER_RESPONSES) {}

    std::string serialize() const;

    // Throws JsonParseError on malformed input.
    static InstanceMessage deserialize(const std::string& body);
};

// Envelope codec shared by both ends of the channel. The reply decoder
// treats a missing "successful" field as a failure.
std::string serialize_result(bool successful, const std::string& message, const JsonValue& data);
ServiceResult<JsonValue> deserialize_result(const std::string& body);

template <typename T>
std::string serialize_result(const ServiceResult<T>& result) {
    return serialize_result(result.successful, result.message, JsonValue(result.data));
}

} // namespace dss

#endif // INSTANCE_MESSAGE_H
