/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: config.h

    Description:
        Configuration for one service instance.

        DssConfig holds the throttling parameters of the delayed submission
        algorithm. InstanceConfig holds identity, the shared instance secret,
        election timing and the locations of the collaborators.

        Sources, highest priority first:
        1. Command-line flags (--flag value)
        2. Environment variables (IS_INSTANCE_SECRET, IS_SCALE_OUT, HOSTNAME,
           PORT and DSS_* for the rest)
        3. Built-in defaults

        The instance secret has no default. load_config() throws ConfigError
        instead of starting an instance that could not authenticate transfers.

*******************************************************************************/

#ifndef CONFIG_H
#define CONFIG_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dss {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

//==============================================================================
// DELAYED SUBMISSION PARAMETERS
//==============================================================================

struct DssConfig {
    int min_percentage;
    int max_percentage;
    int percentage_increment;
    int reset_chance_percentage;
    int minimum_survey_submissions;

    // First arming after an empty queue
    int cold_delay_min_sec;
    int cold_delay_max_sec;

    // Re-arming after a cycle that submitted something
    int warm_delay_min_sec;
    int warm_delay_max_sec;

    DssConfig()
        : min_percentage(30),
          max_percentage(70),
          percentage_increment(2),
          reset_chance_percentage(5),
          minimum_survey_submissions(3),
          cold_delay_min_sec(900),
          cold_delay_max_sec(3540),
          warm_delay_min_sec(30),
          warm_delay_max_sec(90) {}

    // Throws ConfigError naming the first invalid field.
    void validate() const;
};

//==============================================================================
// INSTANCE PARAMETERS
//==============================================================================

struct InstanceConfig {
    std::string hostname;
    uint16_t port;
    std::string instance_secret;
    bool scale_out;

    std::string store_path;   // shared coordination store (scale-out only)
    std::string data_dir;     // persistence gateway directory

    int lease_timeout_ms;
    int check_interval_ms;
    int retry_backoff_initial_ms;
    int retry_backoff_max_ms;
    int transfer_timeout_ms;

    std::string admin_token;
    std::string anonymizer_url;
    std::string log_level;

    InstanceConfig()
        : hostname("localhost"),
          port(8080),
          scale_out(false),
          data_dir("./dss_data"),
          lease_timeout_ms(120000),
          check_interval_ms(30000),
          retry_backoff_initial_ms(500),
          retry_backoff_max_ms(30000),
          transfer_timeout_ms(2000),
          log_level("info") {}

    // "host:port"; doubles as the address other instances use to reach us.
    std::string instance_id() const {
        return hostname + ":" + std::to_string(port);
    }
};

struct AppConfig {
    DssConfig dss;
    InstanceConfig instance;
    bool show_help;

    AppConfig() : show_help(false) {}
};

void print_usage(const char* program_name);

// Parses flags and environment. Sets show_help (and returns without
// validating) on --help. Throws ConfigError on unknown flags, malformed
// numbers, a missing instance secret, scale-out without a store path, or
// invalid DSS parameters.
AppConfig load_config(int argc, char* argv[]);

} // namespace dss

#endif // CONFIG_H
