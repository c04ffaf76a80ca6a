/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: instance_message.cpp

    Description:
        JSON encoding of InstanceMessage and of the reply envelope.

*******************************************************************************/

#include "model/instance_message.h"

namespace dss {

std::string communication_type_to_string(CommunicationType type) {
    switch (type) {
        case CommunicationType::NO_OP:
            return "NoOp";
        case CommunicationType::TRANSFER_RESPONSES:
            return "TransferResponses";
        case CommunicationType::CLOSE_SURVEY:
            return "CloseSurvey";
        default:
            return "NoOp";
    }
}

CommunicationType communication_type_from_json(const JsonValue& value) {
    if (value.is_number()) {
        int64_t raw = value.as_int();
        if (raw < 0 || raw > 2) throw JsonParseError("Unknown communication type");
        return static_cast<CommunicationType>(raw);
    }

    const std::string& name = value.as_string();
    if (name == "NoOp") return CommunicationType::NO_OP;
    if (name == "TransferResponses") return CommunicationType::TRANSFER_RESPONSES;
    if (name == "CloseSurvey") return CommunicationType::CLOSE_SURVEY;
    throw JsonParseError("Unknown communication type");
}

std::string InstanceMessage::serialize() const {
    JsonValue json = JsonValue::object();
    json["sourceInstanceId"] = source_instance_id;
    json["communicationType"] = communication_type_to_string(type);
    json["responses"] = batch_to_json(responses);
    json["surveyId"] = survey_id.empty() ? JsonValue() : JsonValue(survey_id);
    return json.dump();
}

InstanceMessage InstanceMessage::deserialize(const std::string& body) {
    JsonValue json = JsonValue::parse(body);
    if (!json.is_object()) {
        throw JsonParseError("Instance message is not an object");
    }

    InstanceMessage message;
    message.source_instance_id = json.get_string("sourceInstanceId");
    if (const JsonValue* type = json.find("communicationType")) {
        message.type = communication_type_from_json(*type);
    }
    if (const JsonValue* responses = json.find("responses")) {
        message.responses = batch_from_json(*responses);
    }
    message.survey_id = json.get_string("surveyId");
    return message;
}

std::string serialize_result(bool successful, const std::string& message, const JsonValue& data) {
    JsonValue json = JsonValue::object();
    json["successful"] = successful;
    json["message"] = message;
    json["data"] = data;
    return json.dump();
}

ServiceResult<JsonValue> deserialize_result(const std::string& body) {
    JsonValue json = JsonValue::parse(body);
    if (!json.is_object()) {
        throw JsonParseError("Reply envelope is not an object");
    }

    ServiceResult<JsonValue> result;
    result.successful = json.get_bool("successful", false);
    result.message = json.get_string("message");
    if (const JsonValue* data = json.find("data")) {
        result.data = *data;
    }
    return result;
}

} // namespace dss
