#pragma once

#include "leader_election.hpp"
#include "liveness.hpp"
#include "lock_store.hpp"
#include "rules.hpp"
#include "shutdown_coordinator.hpp"
#include "version_negotiator.hpp"
#include <cstdint>
#include <optional>
#include <string>

using std::string;

// Instance role: starts Electing, ends Main or Proxy for the whole process lifetime.
enum class InstanceRole : uint8_t { ELECTING, MAIN, PROXY };

static inline const char* instance_role_str(InstanceRole role) {
    switch (role) {
      case InstanceRole::ELECTING: return "electing";
      case InstanceRole::MAIN:     return "main";
      case InstanceRole::PROXY:    return "proxy";
    }
    return "unknown";
}

// Tuning knobs of the startup sequence. Defaults live in rules.hpp.
struct CoordinatorConfig {
    string   version{TASKPILOT_VERSION};
    int      bindRetries{BIND_RETRIES};
    int      backoffMs{BIND_BACKOFF_MS};
    int      handoverTimeoutMs{HANDOVER_TIMEOUT_MS};
};

// The process-wide coordination state, carried explicitly through startup.
// Linear backoff before attempt+1, computed wide so any CLI value is safe.
int64_t backoff_delay_ms(int backoffMs, int attempt);

struct InstanceState {
    InstanceRole role{InstanceRole::ELECTING};
    // MAIN: the record we wrote. PROXY: the main's record we route to.
    std::optional<LockRecord> lock;
};

/**
 * InstanceManager - decides once, at startup, whether this process is main
 *
 *   bind ok                                        -> MAIN
 *   bind fails, no record yet                      -> back off, retry
 *   bind fails, owner dead or not answering        -> remove record, retry bind once
 *   bind fails, owner alive, same version          -> PROXY
 *   bind fails, owner alive, different version     -> shutdown, wait port, remove, bind -> MAIN
 *
 * Every way out other than MAIN or PROXY throws std::runtime_error.
 */
class InstanceManager {
private:
    CoordinatorConfig    config;
    ServicePort         &servicePort;
    LockStore           &lockStore;
    LivenessChecker     &liveness;
    VersionNegotiator   &negotiator;
    ShutdownCoordinator &shutdownCoordinator;
    LeaderElection       election;
    InstanceState        state;

    bool BecomeMain();
    bool RecoverStaleLock(const LockRecord &record, const string &reason);
    void TakeOver(const LockRecord &record, const string &mainVersion);

public:
    InstanceManager(CoordinatorConfig config,
                    ServicePort &servicePort,
                    LockStore &lockStore,
                    LivenessChecker &liveness,
                    VersionNegotiator &negotiator,
                    ShutdownCoordinator &shutdownCoordinator);

    // Runs the election/handover sequence. Call once.
    InstanceRole Negotiate();

    const InstanceState &State() const { return state; }
};
