#pragma once

#include <cstdint>

// Build version, injected by CMake. Compared verbatim against the running main.
#ifndef TASKPILOT_VERSION
#define TASKPILOT_VERSION "0.1.0"
#endif

// Fixed service port every candidate main binds. Owning it is owning the instance.
static constexpr uint16_t SERVICE_PORT = 8989;

// Proxy listener port, 0 = let the OS pick one.
static constexpr uint16_t PROXY_PORT = 0;

// Loopback address used for every peer-to-peer call on this host.
static constexpr const char* LOCAL_HOST = "127.0.0.1";

// Control-plane paths served by the main instance.
static constexpr const char* VERSION_PATH  = "/__version";
static constexpr const char* SHUTDOWN_PATH = "/__shutdown";

// Timing parameters (ms).
static constexpr int BIND_RETRIES         = 5;      // election attempts while the lock is missing
static constexpr int BIND_BACKOFF_MS      = 200;    // multiplied by the attempt number
static constexpr int HANDOVER_TIMEOUT_MS  = 10000;  // wait for the old main to free the port
static constexpr int PORT_POLL_INTERVAL_MS = 300;
static constexpr int CONTROL_TIMEOUT_MS   = 2000;   // connect + read budget of a control-plane call
static constexpr int SHUTDOWN_EXIT_DELAY_MS = 250;  // lets the shutdown ack reach the caller

// Lock file name prefix inside the temp directory: taskpilot-<port>.lock
static constexpr const char* LOCK_FILE_PREFIX = "taskpilot-";
