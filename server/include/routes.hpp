#pragma once
#include <cstdint>
#include <lithium_http_server.hh>
#include "symbols.hh"
#include "../../coordination/include/common.hpp"
#include "../../coordination/include/rules.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using namespace li;

/**
 * AppContext - what the main instance's routes need to know about the process
 *
 * exitProcess is called after a shutdown request has been answered; the
 * server binary passes _exit(0), since lithium has no clean stop API.
 */
struct AppContext {
    std::string version;
    uint16_t port{SERVICE_PORT};
    int shutdownDelayMs{SHUTDOWN_EXIT_DELAY_MS};
    uint64_t startedAtMs{0};
    std::function<void()> exitProcess;
    std::atomic<bool> shutdownScheduled{false};
};

// Runs ctx->exitProcess once, shutdownDelayMs after the call, off the request thread.
inline void schedule_exit(const std::shared_ptr<AppContext>& ctx) {
  if (ctx->shutdownScheduled.exchange(true)) {
    return;
  }

  std::thread([ctx]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(ctx->shutdownDelayMs));
    log_line(LogLevel::INFO, "Main instance exiting after shutdown request");
    if (ctx->exitProcess) {
      ctx->exitProcess();
    }
  }).detach();
}

// Body of GET /__version; starting instances read it with parse_version_body().
inline auto version_payload(const AppContext& ctx) {
  return mmm(s::version = ctx.version);
}

// Accepts a control-plane shutdown: schedules the exit and returns the acknowledgement body.
inline auto accept_shutdown(const std::shared_ptr<AppContext>& ctx) {
  log_line(LogLevel::WARN, "Shutdown requested over the control-plane");
  schedule_exit(ctx);
  return mmm(s::status = std::string("shutting_down"), s::pid = static_cast<int64_t>(::getpid()));
}

inline auto make_routes(std::shared_ptr<AppContext> ctx) {
  http_api api;

  // Control-plane: version query used by starting instances to decide proxy vs handover.
  api.get(VERSION_PATH) = [ctx](http_request& req, http_response& res) {
    res.write_json(version_payload(*ctx));
  };

  // Control-plane: the exit is delayed so the acknowledgement is delivered first.
  api.post(SHUTDOWN_PATH) = [ctx](http_request& req, http_response& res) {
    res.write_json(accept_shutdown(ctx));
  };

  // GET /health - liveness and identity of the main instance
  api.get("/health") = [ctx](http_request& req, http_response& res) {
    res.write_json(s::status = "healthy",
                   s::version = ctx->version,
                   s::mode = "service",
                   s::port = static_cast<int>(ctx->port),
                   s::pid = static_cast<int64_t>(::getpid()),
                   s::uptime_ms = static_cast<int64_t>(now_ms() - ctx->startedAtMs));
  };

  // GET / - API discovery
  api.get("/") = [ctx](http_request& req, http_response& res) {
    res.write_json(s::message = "TaskPilot Backend API",
                   s::version = ctx->version,
                   s::endpoints = mmm(s::health = "/health",
                                      s::version = std::string(VERSION_PATH),
                                      s::shutdown = std::string(SHUTDOWN_PATH)));
  };

  return api;
}
