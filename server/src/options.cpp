#include "../include/options.hpp"
#include "../../coordination/include/common.hpp"

#include <climits>
#include <ostream>
#include <stdexcept>

// Whole-string integer in [minValue, maxValue].
static bool parse_int(const string& text, long minValue, long maxValue, long& out) {
  if (text.empty()) {
    return false;
  }
  size_t used = 0;
  long value = 0;
  try {
    value = std::stol(text, &used);
  } catch (const std::exception&) {
    return false;
  }
  if (used != text.size() || value < minValue || value > maxValue) {
    return false;
  }
  out = value;
  return true;
}

bool parse_options(int argc, char** argv, ServerOptions& out, string& error) {
  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      out.showHelp = true;
      continue;
    }
    if (arg == "--version" || arg == "-v") {
      out.showVersion = true;
      continue;
    }

    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == string::npos) {
      error = "unrecognized argument: " + arg;
      return false;
    }
    string key   = arg.substr(2, eq - 2);
    string value = arg.substr(eq + 1);
    long number = 0;

    if (key == "mode") {
      if (value == "service") {
        out.mode = RunMode::SERVICE;
      } else if (value == "local") {
        out.mode = RunMode::LOCAL;
      } else {
        error = "--mode must be 'service' or 'local', got '" + value + "'";
        return false;
      }
    } else if (key == "port") {
      if (!parse_int(value, 1, Consts::MAX_PORT_NUMBER, number)) {
        error = "--port must be in 1.." + std::to_string(Consts::MAX_PORT_NUMBER);
        return false;
      }
      out.port = static_cast<uint16_t>(number);
    } else if (key == "proxy-port") {
      if (!parse_int(value, 0, Consts::MAX_PORT_NUMBER, number)) {
        error = "--proxy-port must be in 0.." + std::to_string(Consts::MAX_PORT_NUMBER);
        return false;
      }
      out.proxyPort = static_cast<uint16_t>(number);
    } else if (key == "lock-path") {
      if (value.empty()) {
        error = "--lock-path must not be empty";
        return false;
      }
      out.lockPath = value;
    } else {
      int* target = nullptr;
      long minValue = 0;
      if (key == "bind-retries") {
        target = &out.bindRetries;
        minValue = 1;
      } else if (key == "backoff-ms") {
        target = &out.backoffMs;
      } else if (key == "handover-timeout-ms") {
        target = &out.handoverTimeoutMs;
      } else if (key == "poll-interval-ms") {
        target = &out.pollIntervalMs;
        minValue = 1;
      } else if (key == "control-timeout-ms") {
        target = &out.controlTimeoutMs;
        minValue = 1;
      } else if (key == "shutdown-delay-ms") {
        target = &out.shutdownDelayMs;
      }

      if (target == nullptr) {
        error = "unknown option --" + key;
        return false;
      }
      if (!parse_int(value, minValue, INT_MAX, number)) {
        error = "--" + key + " expects an integer >= " + std::to_string(minValue);
        return false;
      }
      *target = static_cast<int>(number);
    }
  }
  return true;
}

void print_usage(std::ostream& os) {
  os << "Usage: taskpilot [options]\n"
     << "  --mode=service|local        service (default) joins election, local never does\n"
     << "  --port=N                    service port (default " << SERVICE_PORT << ")\n"
     << "  --proxy-port=N              proxy listener port, 0 = ephemeral (default " << PROXY_PORT << ")\n"
     << "  --lock-path=PATH            lock file (default <tmp>/" << LOCK_FILE_PREFIX << "<port>.lock)\n"
     << "  --bind-retries=N            election attempts without a lock record (default " << BIND_RETRIES << ")\n"
     << "  --backoff-ms=N              backoff step between attempts (default " << BIND_BACKOFF_MS << ")\n"
     << "  --handover-timeout-ms=N     wait for the old main to free the port (default " << HANDOVER_TIMEOUT_MS << ")\n"
     << "  --poll-interval-ms=N        port poll interval during handover (default " << PORT_POLL_INTERVAL_MS << ")\n"
     << "  --control-timeout-ms=N      control-plane call timeout (default " << CONTROL_TIMEOUT_MS << ")\n"
     << "  --shutdown-delay-ms=N       exit delay after a shutdown request (default " << SHUTDOWN_EXIT_DELAY_MS << ")\n"
     << "  --version                   print the build version\n"
     << "  --help                      print this help\n";
}

CoordinatorConfig to_coordinator_config(const ServerOptions& options) {
  CoordinatorConfig config;
  config.version           = TASKPILOT_VERSION;
  config.bindRetries       = options.bindRetries;
  config.backoffMs         = options.backoffMs;
  config.handoverTimeoutMs = options.handoverTimeoutMs;
  return config;
}
