/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: logger.cpp

    Description:
        Static member definitions for Logger plus the level-name parser used
        by configuration loading. Compiled once into dss_core so every
        component shares one level, one sink and one output mutex.

*******************************************************************************/

#include "common/logger.h"

#include <algorithm>
#include <cctype>

namespace dss {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::output_ = &std::cout;
std::mutex Logger::mutex_;

bool Logger::set_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        current_level_ = LogLevel::DEBUG;
    } else if (lowered == "info") {
        current_level_ = LogLevel::INFO;
    } else if (lowered == "warning" || lowered == "warn") {
        current_level_ = LogLevel::WARNING;
    } else if (lowered == "error") {
        current_level_ = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

} // namespace dss
