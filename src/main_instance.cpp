/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: main_instance.cpp

    Description:
        Entry point of one service instance. An instance accepts survey
        responses, takes part in leader election and, when it is leader,
        flushes queued responses to storage on a randomized schedule.

        Deployment:
        ┌──────────────────────────────────────────┐
        │ web-1:8080   dss_instance --scale-out   │
        │              --store /shared/dss.json   │
        ├──────────────────────────────────────────┤
        │ web-2:8080   dss_instance --scale-out   │
        │              --store /shared/dss.json   │
        └──────────────────────────────────────────┘
                         ↓
        One instance holds the lease in the shared store and flushes;
        the others forward everything they receive to it.

    Lifecycle Stages:

        1. STARTUP:
           - Load configuration (flags, then environment, then defaults);
             a missing instance secret aborts here
           - Start the HTTP server (inter-instance + admin + intake routes)
           - Start leader election (first check is synchronous)
           - Follower with a known leader: NoOp probe, abort on failure
           - Start the delayed submission service

        2. RUNNING:
           - Status line every 30 seconds (counts only)
           - Wait for SIGINT/SIGTERM

        3. SHUTDOWN (reverse order):
           - Delayed submission service (follower drains once)
           - Leader election (relinquishes the lease)
           - HTTP server

    Exit Codes:
        0: Clean shutdown
        1: Configuration or start-up failure

*******************************************************************************/

#include "common/config.h"
#include "common/logger.h"
#include "election/leader_elector.h"
#include "election/settings_store.h"
#include "persistence/persistence_gateway.h"
#include "persistence/text_anonymizer.h"
#include "submission/delayed_submission_service.h"
#include "transfer/http.h"
#include "transfer/transfer_client.h"
#include "transfer/transfer_endpoint.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include <signal.h>
#include <unistd.h>

using namespace dss;

//==============================================================================
// SIGNAL HANDLING
//==============================================================================

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

namespace {

std::string machine_name() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

void log_status(const DssStatus& status) {
    Logger::info("Status: " + std::string(status.is_leader ? "leader" : "follower") +
                 ", pending=" + std::to_string(status.pending) +
                 ", percentage=" + std::to_string(status.current_percentage) +
                 ", last flush=" + std::to_string(status.last_flush_amount));
}

} // namespace

//==============================================================================
// MAIN
//==============================================================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    AppConfig config;
    try {
        config = load_config(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!Logger::set_level(config.instance.log_level)) {
        std::cerr << "Unknown log level: " << config.instance.log_level << "\n";
        return 1;
    }

    const InstanceConfig& instance = config.instance;
    Logger::info("=== SHIELD Delayed Submission Service (" + instance.instance_id() + ") ===");

    std::shared_ptr<SettingsStore> store;
    if (instance.scale_out) {
        store = std::make_shared<FileSettingsStore>(instance.store_path);
    }

    LeadershipChannel leadership_channel;
    LeaderElector elector(ElectionConfig::from_instance(instance), store, leadership_channel);

    std::unique_ptr<JsonlPersistenceGateway> gateway;
    try {
        gateway = std::make_unique<JsonlPersistenceGateway>(instance.data_dir);
    } catch (const PersistenceError& e) {
        Logger::error("Cannot open data directory: " + std::string(e.what()));
        return 1;
    }

    std::unique_ptr<TextAnonymizer> anonymizer;
    if (instance.anonymizer_url.empty()) {
        anonymizer = std::make_unique<PassthroughAnonymizer>();
    } else {
        anonymizer = std::make_unique<HttpTextAnonymizer>(instance.anonymizer_url,
                                                          instance.transfer_timeout_ms);
    }

    HttpTransferClient transfer_client(elector, store, instance.instance_secret,
                                       instance.transfer_timeout_ms);

    DelayedSubmissionService service(config.dss, elector, leadership_channel,
                                     *gateway, *anonymizer, transfer_client);

    StaticTokenAuthorizer authorizer(instance.admin_token);
    if (instance.admin_token.empty()) {
        Logger::warning("No admin token configured; administrative endpoints reject every request");
    }

    InstanceApi api(service, elector, *gateway, authorizer,
                    instance.instance_secret, machine_name());

    HttpServer server(instance.port);
    api.register_routes(server);
    if (!server.start()) {
        Logger::error("Failed to start HTTP server on port " + std::to_string(instance.port));
        return 1;
    }

    if (!elector.start()) {
        Logger::error("Failed to start leader election");
        server.stop();
        return 1;
    }

    auto probe = verify_startup_communication(elector, transfer_client);
    if (!probe.successful) {
        elector.stop();
        server.stop();
        return 1;
    }

    if (!service.start()) {
        elector.stop();
        server.stop();
        return 1;
    }

    Logger::info("Instance running. Press Ctrl+C to stop.");

    auto last_report = std::chrono::steady_clock::now();
    while (!shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(30)) {
            log_status(service.get_status());
            last_report = now;
        }
    }

    Logger::info("Shutting down...");

    // Intake closes before the queue is drained or discarded.
    server.stop();
    service.stop();
    elector.stop();

    Logger::info("Instance shutdown complete");
    return 0;
}
