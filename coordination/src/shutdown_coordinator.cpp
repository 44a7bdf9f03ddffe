#include "../include/shutdown_coordinator.hpp"
#include "../include/common.hpp"
#include "../include/control_client.hpp"
#include "../include/rules.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

HttpShutdownCoordinator::HttpShutdownCoordinator(ServicePort &servicePort, int controlTimeoutMs, int pollIntervalMs)
    : servicePort(servicePort), controlTimeoutMs(controlTimeoutMs), pollIntervalMs(pollIntervalMs) {}

bool HttpShutdownCoordinator::RequestMainShutdown(const LockRecord &record) {
  log_line(LogLevel::INFO, "Handover: asking pid " + std::to_string(record.ownerPid) +
           " (version " + record.protocolVersion + ") to shut down");

  ControlClient client(LOCAL_HOST, record.servicePort, this->controlTimeoutMs);
  ControlResponse response = client.post(SHUTDOWN_PATH);

  if (!response.success) {
    log_line(LogLevel::WARN, "Shutdown request failed: " + response.error);
    return false;
  }
  if (response.statusCode != 200) {
    log_line(LogLevel::WARN, "Shutdown request rejected with HTTP " + std::to_string(response.statusCode));
    return false;
  }
  return true;
}

bool HttpShutdownCoordinator::WaitForPortFree(int timeoutMs) {
  const uint64_t deadline = now_ms() + static_cast<uint64_t>(std::max(timeoutMs, 0));

  while (true) {
    if (this->servicePort.ProbeFree()) {
      log_line(LogLevel::INFO, "Handover: port " + std::to_string(this->servicePort.Port()) + " is free");
      return true;
    }
    uint64_t now = now_ms();
    if (now >= deadline) {
      break;
    }
    uint64_t sleepMs = std::min<uint64_t>(static_cast<uint64_t>(std::max(this->pollIntervalMs, 1)), deadline - now);
    std::this_thread::sleep_for(std::chrono::milliseconds(sleepMs));
  }

  log_line(LogLevel::WARN, "Handover: port " + std::to_string(this->servicePort.Port()) +
           " still in use after " + std::to_string(timeoutMs) + " ms");
  return false;
}
