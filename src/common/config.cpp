/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: config.cpp

    Description:
        Flag and environment parsing for AppConfig. Every option is described
        once in a table (flag, environment variable, setter); environment
        values are applied first and flags override them.

*******************************************************************************/

#include "common/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <vector>

namespace dss {

namespace {

struct OptionSpec {
    const char* flag;
    const char* env;
    const char* help;
    std::function<void(AppConfig&, const std::string&)> apply;
};

int parse_int(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + name);
    }
    if (consumed != value.size()) {
        throw ConfigError("Invalid integer for " + name);
    }
    return result;
}

bool parse_bool(const std::string& name, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes") return true;
    if (lowered == "false" || lowered == "0" || lowered == "no") return false;
    throw ConfigError("Invalid boolean for " + name);
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

const std::vector<OptionSpec>& option_table() {
    static const std::vector<OptionSpec> options = {
        {"--host", "HOSTNAME", "Instance host name (part of the instance id)",
         [](AppConfig& c, const std::string& v) { c.instance.hostname = v; }},
        {"--port", "PORT", "HTTP listen port (default: 8080)",
         [](AppConfig& c, const std::string& v) {
             int port = parse_int("port", v);
             if (port <= 0 || port > 65535) throw ConfigError("Port out of range");
             c.instance.port = static_cast<uint16_t>(port);
         }},
        {"--secret", "IS_INSTANCE_SECRET", "Shared inter-instance secret (required)",
         [](AppConfig& c, const std::string& v) { c.instance.instance_secret = v; }},
        {"--scale-out", "IS_SCALE_OUT", "Enable leader election across instances (true/false)",
         [](AppConfig& c, const std::string& v) { c.instance.scale_out = parse_bool("scale-out", v); }},
        {"--store", "DSS_STORE_PATH", "Shared coordination store file (scale-out)",
         [](AppConfig& c, const std::string& v) { c.instance.store_path = v; }},
        {"--data-dir", "DSS_DATA_DIR", "Persistence directory (default: ./dss_data)",
         [](AppConfig& c, const std::string& v) { c.instance.data_dir = v; }},
        {"--lease-timeout-ms", "DSS_LEASE_TIMEOUT_MS", "Leader lease timeout (default: 120000)",
         [](AppConfig& c, const std::string& v) { c.instance.lease_timeout_ms = parse_int("lease-timeout-ms", v); }},
        {"--check-interval-ms", "DSS_CHECK_INTERVAL_MS", "Leadership check interval (default: 30000)",
         [](AppConfig& c, const std::string& v) { c.instance.check_interval_ms = parse_int("check-interval-ms", v); }},
        {"--retry-backoff-initial-ms", "DSS_RETRY_BACKOFF_INITIAL_MS", "Store failure backoff start (default: 500)",
         [](AppConfig& c, const std::string& v) {
             c.instance.retry_backoff_initial_ms = parse_int("retry-backoff-initial-ms", v);
         }},
        {"--retry-backoff-max-ms", "DSS_RETRY_BACKOFF_MAX_MS", "Store failure backoff cap (default: 30000)",
         [](AppConfig& c, const std::string& v) {
             c.instance.retry_backoff_max_ms = parse_int("retry-backoff-max-ms", v);
         }},
        {"--transfer-timeout-ms", "DSS_TRANSFER_TIMEOUT_MS", "Outbound transfer timeout (default: 2000)",
         [](AppConfig& c, const std::string& v) {
             c.instance.transfer_timeout_ms = parse_int("transfer-timeout-ms", v);
         }},
        {"--admin-token", "DSS_ADMIN_TOKEN", "Bearer token for /admin endpoints",
         [](AppConfig& c, const std::string& v) { c.instance.admin_token = v; }},
        {"--anonymizer-url", "DSS_ANONYMIZER_URL", "Text anonymization service URL",
         [](AppConfig& c, const std::string& v) { c.instance.anonymizer_url = v; }},
        {"--log-level", "DSS_LOG_LEVEL", "debug, info, warning or error (default: info)",
         [](AppConfig& c, const std::string& v) { c.instance.log_level = v; }},
        {"--min-percentage", "DSS_MIN_PERCENTAGE", "Minimum flush percentage (default: 30)",
         [](AppConfig& c, const std::string& v) { c.dss.min_percentage = parse_int("min-percentage", v); }},
        {"--max-percentage", "DSS_MAX_PERCENTAGE", "Maximum flush percentage (default: 70)",
         [](AppConfig& c, const std::string& v) { c.dss.max_percentage = parse_int("max-percentage", v); }},
        {"--percentage-increment", "DSS_PERCENTAGE_INCREMENT", "Percentage step per cycle (default: 2)",
         [](AppConfig& c, const std::string& v) {
             c.dss.percentage_increment = parse_int("percentage-increment", v);
         }},
        {"--reset-chance", "DSS_RESET_CHANCE_PERCENTAGE", "Chance of resetting to minimum (default: 5)",
         [](AppConfig& c, const std::string& v) {
             c.dss.reset_chance_percentage = parse_int("reset-chance", v);
         }},
        {"--min-submissions", "DSS_MINIMUM_SURVEY_SUBMISSIONS", "Submissions per question kept back (default: 3)",
         [](AppConfig& c, const std::string& v) {
             c.dss.minimum_survey_submissions = parse_int("min-submissions", v);
         }},
    };
    return options;
}

} // namespace

//==============================================================================
// VALIDATION
//==============================================================================

void DssConfig::validate() const {
    if (min_percentage < 0 || min_percentage > 100) {
        throw ConfigError("min_percentage must be within [0, 100]");
    }
    if (max_percentage < min_percentage || max_percentage > 100) {
        throw ConfigError("max_percentage must be within [min_percentage, 100]");
    }
    if (percentage_increment < 0) {
        throw ConfigError("percentage_increment must not be negative");
    }
    if (reset_chance_percentage < 0 || reset_chance_percentage > 100) {
        throw ConfigError("reset_chance_percentage must be within [0, 100]");
    }
    if (minimum_survey_submissions < 0) {
        throw ConfigError("minimum_survey_submissions must not be negative");
    }
    if (cold_delay_min_sec < 0 || cold_delay_max_sec < cold_delay_min_sec) {
        throw ConfigError("cold delay window is invalid");
    }
    if (warm_delay_min_sec < 0 || warm_delay_max_sec < warm_delay_min_sec) {
        throw ConfigError("warm delay window is invalid");
    }
}

//==============================================================================
// USAGE
//==============================================================================

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n";
    for (const auto& option : option_table()) {
        std::cout << "  " << option.flag << " <value>\n"
                  << "      " << option.help << " [env: " << option.env << "]\n";
    }
    std::cout << "  --help\n      Show this help\n";
}

//==============================================================================
// LOADING
//==============================================================================

AppConfig load_config(int argc, char* argv[]) {
    AppConfig config;
    const auto& options = option_table();

    for (const auto& option : options) {
        const char* value = std::getenv(option.env);
        if (value != nullptr && *value != '\0') {
            option.apply(config, value);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            config.show_help = true;
            return config;
        }

        auto it = std::find_if(options.begin(), options.end(),
                               [&arg](const OptionSpec& option) { return arg == option.flag; });
        if (it == options.end()) {
            throw ConfigError("Unknown option: " + arg);
        }
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + arg);
        }
        it->apply(config, argv[++i]);
    }

    if (is_blank(config.instance.instance_secret)) {
        throw ConfigError("Instance secret is not configured (IS_INSTANCE_SECRET)");
    }
    if (config.instance.scale_out && config.instance.store_path.empty()) {
        throw ConfigError("Scale-out requires a coordination store path (DSS_STORE_PATH)");
    }
    if (config.instance.lease_timeout_ms <= 0 || config.instance.check_interval_ms <= 0 ||
        config.instance.transfer_timeout_ms <= 0) {
        throw ConfigError("Election and transfer timings must be positive");
    }
    // A lease must survive at least one missed renewal.
    if (static_cast<long long>(config.instance.check_interval_ms) * 2 >
        config.instance.lease_timeout_ms) {
        throw ConfigError("check_interval_ms must be at most half of lease_timeout_ms");
    }
    if (config.instance.retry_backoff_initial_ms <= 0 ||
        config.instance.retry_backoff_max_ms < config.instance.retry_backoff_initial_ms) {
        throw ConfigError("Retry backoff window is invalid");
    }
    config.dss.validate();
    return config;
}

} // namespace dss
