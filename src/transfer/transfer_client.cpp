/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: transfer_client.cpp

*******************************************************************************/

#include "transfer/transfer_client.h"
#include "transfer/http.h"
#include "common/logger.h"

namespace dss {

HttpTransferClient::HttpTransferClient(const LeadershipView& leadership,
                                       std::shared_ptr<SettingsStore> store,
                                       std::string instance_secret,
                                       int timeout_ms)
    : leadership_(leadership),
      store_(std::move(store)),
      instance_secret_(std::move(instance_secret)),
      timeout_ms_(timeout_ms) {}

ServiceResult<std::string> HttpTransferClient::resolve_leader_url() {
    if (!store_) {
        return ServiceResult<std::string>::failure("No leader is currently known");
    }

    std::string leader_id;
    try {
        leader_id = store_->get(kLeaderIdKey);
    } catch (const StoreError& e) {
        Logger::warning("Cannot resolve leader address: " + std::string(e.what()));
        return ServiceResult<std::string>::failure("Leader address unavailable");
    }

    if (leader_id.empty()) {
        return ServiceResult<std::string>::failure("No leader is currently known");
    }
    if (leader_id == leadership_.instance_id()) {
        return ServiceResult<std::string>::failure("This instance is recorded as the leader");
    }
    return ServiceResult<std::string>::success("http://" + leader_id + kTransferPath, leader_id);
}

ServiceResult<JsonValue> HttpTransferClient::send(const InstanceMessage& message) {
    auto leader = resolve_leader_url();
    if (!leader.successful) {
        return ServiceResult<JsonValue>::failure(leader.message);
    }

    Logger::debug("Sending " + communication_type_to_string(message.type) + " to leader " +
                  leader.message);

    HttpResponse response;
    try {
        response = http_request("POST", leader.data,
                                {{kInstanceAuthHeader, instance_secret_}},
                                message.serialize(), timeout_ms_);
    } catch (const HttpError& e) {
        return ServiceResult<JsonValue>::failure("Leader unreachable: " + std::string(e.what()));
    }

    if (response.status == 401) {
        return ServiceResult<JsonValue>::failure("Leader rejected the instance secret");
    }
    if (response.status != 200) {
        return ServiceResult<JsonValue>::failure("Leader replied with status " +
                                                 std::to_string(response.status));
    }

    try {
        return deserialize_result(response.body);
    } catch (const JsonParseError&) {
        return ServiceResult<JsonValue>::failure("Leader reply is not a valid envelope");
    }
}

ServiceResult<int> HttpTransferClient::transfer_responses(const ResponseBatch& batch) {
    InstanceMessage message;
    message.source_instance_id = leadership_.instance_id();
    message.type = CommunicationType::TRANSFER_RESPONSES;
    message.responses = batch;

    auto reply = send(message);
    if (!reply.successful) {
        return ServiceResult<int>::failure(reply.message);
    }

    int accepted = static_cast<int>(batch.size());
    if (reply.data.is_number()) {
        try {
            accepted = reply.data.as_int32();
        } catch (const JsonParseError&) {
            Logger::warning("Leader reply carried an invalid accepted count");
        }
    }
    return ServiceResult<int>::success(accepted, reply.message);
}

ServiceResult<bool> HttpTransferClient::verify_communication() {
    InstanceMessage message;
    message.source_instance_id = leadership_.instance_id();
    message.type = CommunicationType::NO_OP;

    auto reply = send(message);
    if (!reply.successful) {
        return ServiceResult<bool>::failure(reply.message);
    }
    return ServiceResult<bool>::success(true, reply.message);
}

ServiceResult<bool> HttpTransferClient::close_survey(const std::string& survey_id) {
    InstanceMessage message;
    message.source_instance_id = leadership_.instance_id();
    message.type = CommunicationType::CLOSE_SURVEY;
    message.survey_id = survey_id;

    auto reply = send(message);
    if (!reply.successful) {
        return ServiceResult<bool>::failure(reply.message);
    }
    return ServiceResult<bool>::success(true, reply.message);
}

ServiceResult<bool> verify_startup_communication(const LeadershipView& leadership,
                                                 TransferClient& client) {
    std::string leader_id = leadership.leader_id();
    if (leadership.is_leader() || leader_id.empty() || leader_id == leadership.instance_id()) {
        return ServiceResult<bool>::success(true, "No inter-instance probe required");
    }

    Logger::info("Verifying inter-instance communication with leader " + leader_id);
    auto result = client.verify_communication();
    if (!result.successful) {
        Logger::error("Inter-instance communication test failed: " + result.message +
                      ". Instance cannot start safely as responses would get lost");
        return result;
    }

    Logger::info("Inter-instance communication verified successfully");
    return result;
}

} // namespace dss
