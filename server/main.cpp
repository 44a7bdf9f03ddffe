#include "include/routes.hpp"
#include "include/options.hpp"
#include "include/local_mode.hpp"
#include "include/handoff.hpp"
#include "../coordination/include/instance_manager.hpp"
#include "../coordination/include/proxy.hpp"
#include <csignal>
#include <iostream>
#include <memory>

using namespace li;

void signal_handler(int) {
  // Lithium doesn't have a clean shutdown API; exit right away so the port is released.
  _exit(0);
}

int main(int argc, char** argv) {
  try {
    ServerOptions options;
    string error;
    if (!parse_options(argc, argv, options, error)) {
      std::cerr << "taskpilot: " << error << "\n";
      print_usage(std::cerr);
      return 1;
    }
    if (options.showHelp) {
      print_usage(std::cout);
      return 0;
    }
    if (options.showVersion) {
      std::cout << TASKPILOT_VERSION << "\n";
      return 0;
    }

    if (options.mode == RunMode::LOCAL) {
      return run_local_mode(std::cin, std::cout, TASKPILOT_VERSION);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    fs::path lockPath = options.lockPath.empty() ? default_lock_path(options.port) : fs::path(options.lockPath);
    log_line(LogLevel::INFO, "taskpilot " + string(TASKPILOT_VERSION) + " starting, service port " +
             std::to_string(options.port) + ", lock " + lockPath.string());

    FileLockStore           lockStore(lockPath);
    TcpServicePort          servicePort(options.port);
    ProcessLivenessChecker  liveness;
    HttpVersionNegotiator   negotiator(options.controlTimeoutMs);
    HttpShutdownCoordinator shutdownCoordinator(servicePort, options.controlTimeoutMs, options.pollIntervalMs);

    InstanceManager manager(to_coordinator_config(options), servicePort, lockStore, liveness,
                            negotiator, shutdownCoordinator);

    if (manager.Negotiate() == InstanceRole::PROXY) {
      ProxyTransport proxy(options.proxyPort);
      proxy.StartProxy(*manager.State().lock);
      // Nothing else to do here; we forward until killed.
      proxy.Run();
      return 0;
    }

    auto ctx = std::make_shared<AppContext>();
    ctx->version         = TASKPILOT_VERSION;
    ctx->port            = options.port;
    ctx->shutdownDelayMs = options.shutdownDelayMs;
    ctx->startedAtMs     = now_ms();
    ctx->exitProcess     = []() { _exit(0); };

    auto api = make_routes(ctx);

    // Hand the port over to lithium, which binds it itself.
    servicePort.Release();
    log_line(LogLevel::INFO, "Starting application server on port " + std::to_string(options.port));
    try {
      http_serve(api, options.port);
    } catch (const std::exception& ex) {
      log_line(LogLevel::ERROR, string("Application server failed: ") + ex.what());
    }

    log_line(LogLevel::ERROR, describe_lost_service_port(lockStore, options.port));
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "taskpilot: fatal: " << ex.what() << "\n";
    return 1;
  }
}
