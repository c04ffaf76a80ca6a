/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: persistence_gateway.cpp

    Description:
        File-backed persistence. Error messages name files and errno text
        only; record content never appears in an exception or a log line.

*******************************************************************************/

#include "persistence/persistence_gateway.h"
#include "common/logger.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dss {

JsonlPersistenceGateway::JsonlPersistenceGateway(const std::string& data_dir)
    : data_dir_(data_dir) {
    struct stat st;
    if (stat(data_dir_.c_str(), &st) != 0) {
        if (mkdir(data_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
            throw PersistenceError("Failed to create data directory " + data_dir_ + ": " +
                                   std::strerror(errno));
        }
    }
}

JsonValue JsonlPersistenceGateway::load_surveys() const {
    std::ifstream file(surveys_path());
    if (!file.is_open()) {
        return JsonValue::object();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        JsonValue surveys = JsonValue::parse(buffer.str());
        if (!surveys.is_object()) {
            throw PersistenceError("Survey catalog " + surveys_path() + " is not an object");
        }
        return surveys;
    } catch (const JsonParseError& e) {
        throw PersistenceError("Survey catalog " + surveys_path() + " is malformed: " + e.what());
    }
}

void JsonlPersistenceGateway::append_durably(const std::string& path,
                                             const std::string& content) const {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistenceError("Cannot open " + path + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw PersistenceError("Cannot write " + path + ": " + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw PersistenceError("Cannot sync " + path + ": " + std::strerror(err));
    }
    ::close(fd);
}

int JsonlPersistenceGateway::question_count(const std::string& survey_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    JsonValue surveys = load_surveys();
    const JsonValue* count = surveys.find(survey_id);
    if (count == nullptr) {
        return 0;
    }
    try {
        return count->as_int32();
    } catch (const JsonParseError&) {
        throw PersistenceError("Question count for survey " + survey_id + " is not an integer");
    }
}

void JsonlPersistenceGateway::persist(const ResponseBatch& responses) {
    if (responses.empty()) return;

    std::string content;
    for (const auto& response : responses) {
        content += response.to_json().dump();
        content.push_back('\n');
    }

    std::lock_guard<std::mutex> lock(mutex_);
    append_durably(responses_path(), content);
}

ServiceResult<bool> JsonlPersistenceGateway::close_survey(const std::string& survey_id) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        JsonValue surveys = load_surveys();
        if (!surveys.has(survey_id)) {
            return ServiceResult<bool>::failure("Survey " + survey_id + " not found");
        }
        append_durably(closed_path(), survey_id + "\n");
    } catch (const PersistenceError& e) {
        Logger::error("Failed to close survey " + survey_id + ": " + e.what());
        return ServiceResult<bool>::failure("Error closing survey " + survey_id);
    }

    Logger::info("Closed survey " + survey_id);
    return ServiceResult<bool>::success(true, "Survey closed successfully");
}

} // namespace dss
