/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: text_anonymizer.cpp

*******************************************************************************/

#include "persistence/text_anonymizer.h"
#include "common/json.h"
#include "transfer/http.h"

namespace dss {

std::string HttpTextAnonymizer::anonymize(const std::string& text) {
    JsonValue request = JsonValue::object();
    request["text"] = text;

    HttpResponse response;
    try {
        response = http_request("POST", url_, {}, request.dump(), timeout_ms_);
    } catch (const HttpError& e) {
        throw AnonymizationError(std::string("Anonymization service unreachable: ") + e.what());
    }

    if (response.status != 200) {
        throw AnonymizationError("Anonymization service returned status " +
                                 std::to_string(response.status));
    }

    try {
        JsonValue reply = JsonValue::parse(response.body);
        const JsonValue* anonymized = reply.find("text");
        if (anonymized == nullptr || !anonymized->is_string()) {
            throw AnonymizationError("Anonymization reply has no text field");
        }
        return anonymized->as_string();
    } catch (const JsonParseError&) {
        throw AnonymizationError("Anonymization reply is not valid JSON");
    }
}

} // namespace dss
