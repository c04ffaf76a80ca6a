/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: transfer_client.h

    Description:
        Sending side of the inter-instance channel. A follower uses it to
        hand its queued records to the current leader.

        Leader address resolution: the LeaderId entry of the coordination
        store names the lease holder as "host:port", which is also where its
        HTTP server listens:

            http://<LeaderId>/api/internal/responses/transfer

        Every request carries the shared instance secret in X-Instance-Auth.

    Error Handling:
        Nothing here throws. Network errors, timeouts, 401s, non-leader
        replies and malformed replies all come back as a failed
        ServiceResult whose message contains no record content.

*******************************************************************************/

#ifndef TRANSFER_CLIENT_H
#define TRANSFER_CLIENT_H

#include "common/service_result.h"
#include "election/leader_elector.h"
#include "election/settings_store.h"
#include "model/instance_message.h"

#include <memory>
#include <string>

namespace dss {

constexpr const char* kTransferPath = "/api/internal/responses/transfer";
constexpr const char* kInstanceAuthHeader = "X-Instance-Auth";

class TransferClient {
public:
    virtual ~TransferClient() = default;

    // data = number of records the leader accepted
    virtual ServiceResult<int> transfer_responses(const ResponseBatch& batch) = 0;

    // NoOp round trip to the leader
    virtual ServiceResult<bool> verify_communication() = 0;

    virtual ServiceResult<bool> close_survey(const std::string& survey_id) = 0;
};

class HttpTransferClient : public TransferClient {
private:
    const LeadershipView& leadership_;
    std::shared_ptr<SettingsStore> store_;
    std::string instance_secret_;
    int timeout_ms_;

    // Fails when no leader is recorded or the store is unreachable.
    ServiceResult<std::string> resolve_leader_url();
    ServiceResult<JsonValue> send(const InstanceMessage& message);

public:
    // `store` may be null (single-instance mode): every send then fails
    // with "No leader is currently known".
    HttpTransferClient(const LeadershipView& leadership,
                       std::shared_ptr<SettingsStore> store,
                       std::string instance_secret,
                       int timeout_ms);

    ServiceResult<int> transfer_responses(const ResponseBatch& batch) override;
    ServiceResult<bool> verify_communication() override;
    ServiceResult<bool> close_survey(const std::string& survey_id) override;
};

// Start-up probe: a follower that knows a leader other than itself must be
// able to reach it, otherwise transferred responses would get lost.
// Succeeds without a request when this instance leads or no leader is known.
ServiceResult<bool> verify_startup_communication(const LeadershipView& leadership,
                                                 TransferClient& client);

} // namespace dss

#endif // TRANSFER_CLIENT_H
