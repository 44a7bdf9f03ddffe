#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include "../../coordination/include/instance_manager.hpp"
#include "../../coordination/include/rules.hpp"

using std::string;

// local: single-shot, never touches the lock or the service port.
// service: long-running, always goes through election.
enum class RunMode : uint8_t { SERVICE, LOCAL };

struct ServerOptions {
    RunMode  mode{RunMode::SERVICE};
    uint16_t port{SERVICE_PORT};
    uint16_t proxyPort{PROXY_PORT};
    string   lockPath;  // empty: default_lock_path(port)
    int      bindRetries{BIND_RETRIES};
    int      backoffMs{BIND_BACKOFF_MS};
    int      handoverTimeoutMs{HANDOVER_TIMEOUT_MS};
    int      pollIntervalMs{PORT_POLL_INTERVAL_MS};
    int      controlTimeoutMs{CONTROL_TIMEOUT_MS};
    int      shutdownDelayMs{SHUTDOWN_EXIT_DELAY_MS};
    bool     showVersion{false};
    bool     showHelp{false};
};

/**
 * Parses --key=value flags into out.
 * @param error - set to a one-line reason when false is returned
 */
bool parse_options(int argc, char** argv, ServerOptions& out, string& error);

void print_usage(std::ostream& os);

CoordinatorConfig to_coordinator_config(const ServerOptions& options);
