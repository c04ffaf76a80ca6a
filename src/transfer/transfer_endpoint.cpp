/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: transfer_endpoint.cpp

*******************************************************************************/

#include "transfer/transfer_endpoint.h"
#include "transfer/transfer_client.h"
#include "common/logger.h"
#include "model/instance_message.h"

namespace dss {

namespace {

HttpResponse envelope(int status, bool successful, const std::string& message,
                      const JsonValue& data = JsonValue()) {
    return HttpResponse(status, serialize_result(successful, message, data));
}

HttpResponse unauthorized() {
    return envelope(401, false, "Unauthorized");
}

} // namespace

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); i++) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

bool StaticTokenAuthorizer::authorize(const HttpRequest& request) const {
    if (token_.empty()) return false;
    return constant_time_equals(request.header("Authorization"), "Bearer " + token_);
}

InstanceApi::InstanceApi(DelayedSubmissionService& service,
                         const LeadershipView& leadership,
                         SurveyCloser& closer,
                         const AdminAuthorizer& authorizer,
                         std::string instance_secret,
                         std::string machine_name)
    : service_(service),
      leadership_(leadership),
      closer_(closer),
      authorizer_(authorizer),
      instance_secret_(std::move(instance_secret)),
      machine_name_(std::move(machine_name)) {}

//==============================================================================
// INTER-INSTANCE CHANNEL
//==============================================================================

HttpResponse InstanceApi::handle_transfer(const HttpRequest& request) {
    std::string presented = request.header(kInstanceAuthHeader);
    if (presented.empty() || !constant_time_equals(presented, instance_secret_)) {
        Logger::warning("Rejected inter-instance request with missing or invalid secret");
        return unauthorized();
    }

    InstanceMessage message;
    try {
        message = InstanceMessage::deserialize(request.body);
    } catch (const JsonParseError&) {
        Logger::warning("Rejected malformed inter-instance request");
        return envelope(400, false, "Malformed inter-instance request");
    }

    Logger::debug("Received " + communication_type_to_string(message.type) +
                  " from instance " + message.source_instance_id);

    if (!leadership_.is_leader()) {
        return envelope(200, false, "This instance is not the leader");
    }

    switch (message.type) {
        case CommunicationType::NO_OP:
            return envelope(200, true, "Communication test successful", JsonValue(true));

        case CommunicationType::TRANSFER_RESPONSES: {
            ServiceResult<int> result = service_.accept_transferred(message.responses);
            if (result.successful && result.data > 0) {
                Logger::info("Accepted " + std::to_string(result.data) +
                             " responses from instance " + message.source_instance_id);
            }
            return HttpResponse(200, serialize_result(result));
        }

        case CommunicationType::CLOSE_SURVEY: {
            if (message.survey_id.empty()) {
                return envelope(200, false, "No survey ID provided for close operation");
            }
            ServiceResult<bool> result = closer_.close_survey(message.survey_id);
            return HttpResponse(200, serialize_result(result));
        }
    }

    return envelope(400, false, "Unknown communication type");
}

//==============================================================================
// ADMINISTRATION
//==============================================================================

HttpResponse InstanceApi::handle_instance_info(const HttpRequest& request) {
    if (!authorizer_.authorize(request)) {
        return unauthorized();
    }

    JsonValue body = JsonValue::object();
    body["machineName"] = machine_name_;
    body["timestamp"] = format_utc(Clock::now());
    body["dssStatus"] = service_.get_status().to_json();
    return HttpResponse(200, body.dump());
}

HttpResponse InstanceApi::handle_flush(const HttpRequest& request) {
    if (!authorizer_.authorize(request)) {
        return unauthorized();
    }

    std::string survey_id = request.query_param("surveyId");
    if (survey_id.empty()) {
        return envelope(400, false, "No survey ID provided");
    }

    ServiceResult<int> result = service_.flush_pending_responses(survey_id);
    return HttpResponse(200, serialize_result(result));
}

//==============================================================================
// INTAKE AND LIVENESS
//==============================================================================

HttpResponse InstanceApi::handle_intake(const HttpRequest& request) {
    ResponseBatch batch;
    try {
        JsonValue body = JsonValue::parse(request.body);
        const JsonValue* responses = body.find("responses");
        if (responses == nullptr) {
            return envelope(400, false, "Request has no responses field");
        }
        batch = batch_from_json(*responses);
    } catch (const JsonParseError&) {
        return envelope(400, false, "Malformed responses payload");
    }

    const int count = static_cast<int>(batch.size());
    service_.queue_responses(std::move(batch));
    return envelope(202, true, "Responses accepted", JsonValue(count));
}

HttpResponse InstanceApi::handle_health(const HttpRequest&) {
    JsonValue body = JsonValue::object();
    body["status"] = "ok";
    body["instanceId"] = leadership_.instance_id();
    body["isLeader"] = leadership_.is_leader();
    return HttpResponse(200, body.dump());
}

void InstanceApi::register_routes(HttpServer& server) {
    server.add_handler("POST", kTransferPath,
                       [this](const HttpRequest& r) { return handle_transfer(r); });
    server.add_handler("GET", "/admin/instance-info",
                       [this](const HttpRequest& r) { return handle_instance_info(r); });
    server.add_handler("POST", "/admin/surveys/flush",
                       [this](const HttpRequest& r) { return handle_flush(r); });
    server.add_handler("POST", "/api/responses",
                       [this](const HttpRequest& r) { return handle_intake(r); });
    server.add_handler("GET", "/health",
                       [this](const HttpRequest& r) { return handle_health(r); });
}

} // namespace dss
