#include "../include/handoff.hpp"
#include "../../coordination/include/common.hpp"

#include <exception>
#include <optional>

#include <unistd.h>

std::string describe_lost_service_port(LockStore& lockStore, uint16_t port) {
  std::optional<LockRecord> record;
  try {
    record = lockStore.Read();
  } catch (const std::exception& ex) {
    return "Application server on port " + std::to_string(port) + " stopped (lock unreadable: " +
           ex.what() + ")";
  }

  if (record && record->ownerPid != static_cast<int64_t>(::getpid())) {
    return "Service port " + std::to_string(port) + " was taken by pid " + std::to_string(record->ownerPid) +
           " (version " + record->protocolVersion + ") before the application server could bind it";
  }
  return "Application server on port " + std::to_string(port) + " stopped";
}
