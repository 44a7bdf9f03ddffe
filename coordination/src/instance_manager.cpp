#include "../include/instance_manager.hpp"
#include "../include/common.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

int64_t backoff_delay_ms(int backoffMs, int attempt) {
  return static_cast<int64_t>(std::max(backoffMs, 0)) * static_cast<int64_t>(std::max(attempt, 0));
}

InstanceManager::InstanceManager(CoordinatorConfig config,
                                 ServicePort &servicePort,
                                 LockStore &lockStore,
                                 LivenessChecker &liveness,
                                 VersionNegotiator &negotiator,
                                 ShutdownCoordinator &shutdownCoordinator)
    : config(std::move(config)), servicePort(servicePort), lockStore(lockStore), liveness(liveness),
      negotiator(negotiator), shutdownCoordinator(shutdownCoordinator),
      election(servicePort, lockStore, this->config.version) {}

bool InstanceManager::BecomeMain() {
  if (!this->election.TryBecomeMain()) {
    return false;
  }
  this->state.role = InstanceRole::MAIN;
  this->state.lock = this->election.OwnRecord();
  return true;
}

bool InstanceManager::RecoverStaleLock(const LockRecord &record, const string &reason) {
  log_line(LogLevel::INFO, "Stale lock: " + reason + ", removing it");

  // Only delete what we judged; a fresh owner may have replaced it meanwhile.
  this->lockStore.RemoveIfMatches(record);
  return this->BecomeMain();
}

void InstanceManager::TakeOver(const LockRecord &record, const string &mainVersion) {
  const string port = std::to_string(record.servicePort);
  log_line(LogLevel::INFO, "Version mismatch: main pid " + std::to_string(record.ownerPid) + " runs " +
           mainVersion + ", this build is " + this->config.version + ", taking over");

  if (!this->shutdownCoordinator.RequestMainShutdown(record)) {
    throw std::runtime_error("failed to take over as main instance: pid " + std::to_string(record.ownerPid) +
                             " did not acknowledge the shutdown request");
  }
  if (!this->shutdownCoordinator.WaitForPortFree(this->config.handoverTimeoutMs)) {
    throw std::runtime_error("failed to take over as main instance: port " + port + " still in use after " +
                             std::to_string(this->config.handoverTimeoutMs) + " ms");
  }

  // A competing upgrader may already have won and published its own record.
  if (!this->lockStore.RemoveIfMatches(record)) {
    log_line(LogLevel::INFO, "Handover: lock record of pid " + std::to_string(record.ownerPid) +
             " is gone or was replaced, leaving the lock file alone");
  }
  if (!this->BecomeMain()) {
    throw std::runtime_error("failed to take over as main instance: port " + port +
                             " was bound by another process during handover");
  }
}

InstanceRole InstanceManager::Negotiate() {
  if (this->state.role != InstanceRole::ELECTING) {
    throw std::runtime_error("Instance role already decided");
  }

  const int attempts = std::max(this->config.bindRetries, 1);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (this->BecomeMain()) {
      return InstanceRole::MAIN;
    }

    auto record = this->lockStore.Read();
    if (!record) {
      // Peer bound the port but has not published its record yet.
      log_line(LogLevel::INFO, "Port " + std::to_string(this->servicePort.Port()) +
               " busy, no lock record yet (attempt " + std::to_string(attempt) + "/" +
               std::to_string(attempts) + ")");
    } else if (!this->liveness.IsAlive(record->ownerPid)) {
      if (this->RecoverStaleLock(*record, "owner pid " + std::to_string(record->ownerPid) + " is not running")) {
        return InstanceRole::MAIN;
      }
    } else {
      auto mainVersion = this->negotiator.FetchMainVersion(*record);
      if (!mainVersion) {
        // Alive pid but no control-plane answer: recycled pid or a dying owner.
        if (this->RecoverStaleLock(*record, "owner pid " + std::to_string(record->ownerPid) +
                                   " does not answer the version query")) {
          return InstanceRole::MAIN;
        }
      } else if (*mainVersion == this->config.version) {
        this->state.role = InstanceRole::PROXY;
        this->state.lock = record;
        log_line(LogLevel::INFO, "Main instance pid " + std::to_string(record->ownerPid) + " (version " +
                 *mainVersion + ") is running on port " + std::to_string(record->servicePort) +
                 ", acting as proxy");
        return InstanceRole::PROXY;
      } else {
        this->TakeOver(*record, *mainVersion);
        return InstanceRole::MAIN;
      }
    }

    if (attempt < attempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff_delay_ms(this->config.backoffMs, attempt)));
    }
  }

  throw std::runtime_error("service port " + std::to_string(this->servicePort.Port()) +
                           " is in use but no live main instance could be found after " +
                           std::to_string(attempts) + " attempts");
}
