/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: persistence_gateway.h

    Description:
        Boundary to durable storage. The delayed submission service asks it
        how many questions a survey has (threshold math) and hands it the
        records selected by a flush cycle.

        JsonlPersistenceGateway is the file-backed implementation used by the
        instance binary:

            <data_dir>/surveys.json          {"<survey id>": <question count>}
            <data_dir>/responses.jsonl       one persisted record per line
            <data_dir>/closed_surveys.txt    one closed survey id per line

        Appends are written with a single write(2) and fsync'd before
        persist() returns.

*******************************************************************************/

#ifndef PERSISTENCE_GATEWAY_H
#define PERSISTENCE_GATEWAY_H

#include "common/service_result.h"
#include "model/pending_response.h"

#include <mutex>
#include <stdexcept>
#include <string>

namespace dss {

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

class PersistenceGateway {
public:
    virtual ~PersistenceGateway() = default;

    // Throws PersistenceError.
    virtual int question_count(const std::string& survey_id) = 0;

    // All-or-nothing from the caller's view. Throws PersistenceError.
    virtual void persist(const ResponseBatch& responses) = 0;
};

// Receiver of CloseSurvey requests forwarded between instances.
class SurveyCloser {
public:
    virtual ~SurveyCloser() = default;
    virtual ServiceResult<bool> close_survey(const std::string& survey_id) = 0;
};

class JsonlPersistenceGateway : public PersistenceGateway, public SurveyCloser {
private:
    std::string data_dir_;
    std::mutex mutex_;

    std::string surveys_path() const { return data_dir_ + "/surveys.json"; }
    std::string responses_path() const { return data_dir_ + "/responses.jsonl"; }
    std::string closed_path() const { return data_dir_ + "/closed_surveys.txt"; }

    JsonValue load_surveys() const;
    void append_durably(const std::string& path, const std::string& content) const;

public:
    // Creates data_dir if it does not exist. Throws PersistenceError.
    explicit JsonlPersistenceGateway(const std::string& data_dir);

    int question_count(const std::string& survey_id) override;
    void persist(const ResponseBatch& responses) override;
    ServiceResult<bool> close_survey(const std::string& survey_id) override;
};

} // namespace dss

#endif // PERSISTENCE_GATEWAY_H
