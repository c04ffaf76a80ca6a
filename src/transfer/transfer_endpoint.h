/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: transfer_endpoint.h

    Description:
        Receiving side of the instance's HTTP surface.

        Routes:
        - POST /api/internal/responses/transfer   inter-instance channel
        - GET  /admin/instance-info               admin status snapshot
        - POST /admin/surveys/flush?surveyId=<id> admin flush of one survey
        - POST /api/responses                     intake, {"responses": [...]}
        - GET  /health                            liveness

        Inter-instance replies:
        - Missing or wrong X-Instance-Auth   -> 401
        - Body is not a valid message        -> 400, failure envelope
        - This instance is not the leader    -> 200, failure envelope
        - NoOp                               -> acknowledgment only
        - TransferResponses                  -> count accepted
        - CloseSurvey                        -> result of the SurveyCloser

        Admin routes are guarded by an AdminAuthorizer; a rejected request
        gets 401 and no status data.

*******************************************************************************/

#ifndef TRANSFER_ENDPOINT_H
#define TRANSFER_ENDPOINT_H

#include "election/leader_elector.h"
#include "persistence/persistence_gateway.h"
#include "submission/delayed_submission_service.h"
#include "transfer/http.h"

#include <string>

namespace dss {

class AdminAuthorizer {
public:
    virtual ~AdminAuthorizer() = default;
    virtual bool authorize(const HttpRequest& request) const = 0;
};

// Accepts "Authorization: Bearer <token>". An empty token rejects everything.
class StaticTokenAuthorizer : public AdminAuthorizer {
private:
    std::string token_;

public:
    explicit StaticTokenAuthorizer(std::string token) : token_(std::move(token)) {}

    bool authorize(const HttpRequest& request) const override;
};

// Comparison time depends on the lengths only, not on where the inputs differ.
bool constant_time_equals(const std::string& a, const std::string& b);

class InstanceApi {
private:
    DelayedSubmissionService& service_;
    const LeadershipView& leadership_;
    SurveyCloser& closer_;
    const AdminAuthorizer& authorizer_;
    std::string instance_secret_;
    std::string machine_name_;

public:
    InstanceApi(DelayedSubmissionService& service,
                const LeadershipView& leadership,
                SurveyCloser& closer,
                const AdminAuthorizer& authorizer,
                std::string instance_secret,
                std::string machine_name);

    HttpResponse handle_transfer(const HttpRequest& request);
    HttpResponse handle_instance_info(const HttpRequest& request);
    HttpResponse handle_flush(const HttpRequest& request);
    HttpResponse handle_intake(const HttpRequest& request);
    HttpResponse handle_health(const HttpRequest& request);

    void register_routes(HttpServer& server);
};

} // namespace dss

#endif // TRANSFER_ENDPOINT_H
