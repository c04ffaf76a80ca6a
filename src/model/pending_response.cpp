/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: pending_response.cpp

    Description:
        JSON mapping and discrepancy analysis for PendingResponse.

        Wire field names: surveyId, questionId, questionType, answer,
        discrepancy.

*******************************************************************************/

#include "model/pending_response.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace dss {

std::string question_type_to_string(QuestionType type) {
    switch (type) {
        case QuestionType::TEXT:
            return "Text";
        case QuestionType::RATING:
            return "Rating";
        case QuestionType::SINGLE_CHOICE:
            return "SingleChoice";
        case QuestionType::MULTIPLE_CHOICE:
            return "MultipleChoice";
        default:
            return "Text";
    }
}

QuestionType question_type_from_json(const JsonValue& value) {
    if (value.is_number()) {
        int64_t raw = value.as_int();
        if (raw < 0 || raw > 3) throw JsonParseError("Unknown question type");
        return static_cast<QuestionType>(raw);
    }

    const std::string& name = value.as_string();
    if (name == "Text") return QuestionType::TEXT;
    if (name == "Rating") return QuestionType::RATING;
    if (name == "SingleChoice") return QuestionType::SINGLE_CHOICE;
    if (name == "MultipleChoice") return QuestionType::MULTIPLE_CHOICE;
    throw JsonParseError("Unknown question type");
}

JsonValue PendingResponse::to_json() const {
    JsonValue json = JsonValue::object();
    json["surveyId"] = survey_id;
    json["questionId"] = question_id;
    json["questionType"] = question_type_to_string(question_type);
    json["answer"] = answer;
    json["discrepancy"] = discrepancy;
    return json;
}

PendingResponse PendingResponse::from_json(const JsonValue& value) {
    if (!value.is_object()) {
        throw JsonParseError("Response record is not an object");
    }

    const JsonValue* survey = value.find("surveyId");
    const JsonValue* question = value.find("questionId");
    if (survey == nullptr || question == nullptr) {
        throw JsonParseError("Response record is missing surveyId or questionId");
    }

    PendingResponse response;
    response.survey_id = survey->as_string();
    response.question_id = question->as_int32();
    if (const JsonValue* type = value.find("questionType")) {
        response.question_type = question_type_from_json(*type);
    }
    response.answer = value.get_string("answer");
    response.discrepancy = value.get_number("discrepancy", 0.0);
    return response;
}

JsonValue batch_to_json(const ResponseBatch& batch) {
    JsonValue array = JsonValue::array();
    for (const auto& response : batch) {
        array.push_back(response.to_json());
    }
    return array;
}

ResponseBatch batch_from_json(const JsonValue& value) {
    ResponseBatch batch;
    if (value.is_null()) return batch;

    const auto& items = value.as_array();
    batch.reserve(items.size());
    for (const auto& item : items) {
        batch.push_back(PendingResponse::from_json(item));
    }
    return batch;
}

bool parse_rating(const std::string& answer, int& out) {
    size_t begin = 0;
    size_t end = answer.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(answer[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(answer[end - 1]))) end--;
    if (begin == end) return false;

    std::string trimmed = answer.substr(begin, end - begin);
    size_t digits_from = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
    if (digits_from == trimmed.size()) return false;
    for (size_t i = digits_from; i < trimmed.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) return false;
    }

    errno = 0;
    long value = std::strtol(trimmed.c_str(), nullptr, 10);
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) return false;

    out = static_cast<int>(value);
    return true;
}

void analyze_responses(ResponseBatch& batch) {
    long long sum = 0;
    int count = 0;
    int rating = 0;

    for (const auto& response : batch) {
        if (response.question_type == QuestionType::RATING && parse_rating(response.answer, rating)) {
            sum += rating;
            count++;
        }
    }
    if (count == 0) return;

    double average = static_cast<double>(sum) / count;
    for (auto& response : batch) {
        if (response.question_type == QuestionType::RATING && parse_rating(response.answer, rating)) {
            response.discrepancy = std::round((rating - average) * 100.0) / 100.0;
        }
    }
}

} // namespace dss
