/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: pending_response.h

    Description:
        The response record held between submission and durable persistence.

        A PendingResponse carries the survey, the question, the answer and a
        derived Discrepancy statistic. It has no participant field. Nothing
        that identifies who answered is ever attached to a record, queued,
        transferred or logged.

        Discrepancy is computed once, at intake, over the rating answers of a
        single submission batch and travels with the record afterwards.

*******************************************************************************/

#ifndef PENDING_RESPONSE_H
#define PENDING_RESPONSE_H

#include "common/json.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dss {

enum class QuestionType : uint8_t {
    TEXT = 0,
    RATING = 1,
    SINGLE_CHOICE = 2,
    MULTIPLE_CHOICE = 3
};

// "Text", "Rating", "SingleChoice", "MultipleChoice"
std::string question_type_to_string(QuestionType type);

// Accepts the names above or their numeric values; throws JsonParseError.
QuestionType question_type_from_json(const JsonValue& value);

struct PendingResponse {
    std::string survey_id;
    int question_id;
    QuestionType question_type;
    std::string answer;
    double discrepancy;

    PendingResponse()
        : question_id(0), question_type(QuestionType::TEXT), discrepancy(0.0) {}

    JsonValue to_json() const;

    // Throws JsonParseError when a required field is missing or mistyped.
    static PendingResponse from_json(const JsonValue& value);
};

using ResponseBatch = std::vector<PendingResponse>;

JsonValue batch_to_json(const ResponseBatch& batch);
ResponseBatch batch_from_json(const JsonValue& value);

//------------------------------------------------------------------------------
// Discrepancy
//------------------------------------------------------------------------------
//
// For every RATING record whose answer parses as an integer, sets
// discrepancy = round(answer - mean, 2), where mean is taken over the
// integer-parsable rating answers of this batch only. Other records keep 0.
//
void analyze_responses(ResponseBatch& batch);

// Strict base-10 integer parse with optional sign and surrounding spaces.
bool parse_rating(const std::string& answer, int& out);

} // namespace dss

#endif // PENDING_RESPONSE_H
