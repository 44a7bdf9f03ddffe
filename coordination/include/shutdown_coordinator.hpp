#pragma once

#include "leader_election.hpp"
#include "lock_store.hpp"

// Displaces a running main whose version differs from ours.
class ShutdownCoordinator {
public:
    virtual ~ShutdownCoordinator() = default;

    // True when the main acknowledged the request, not when it has exited.
    virtual bool RequestMainShutdown(const LockRecord &record) = 0;

    // Polls until the service port can be bound. False on timeout.
    virtual bool WaitForPortFree(int timeoutMs) = 0;
};

class HttpShutdownCoordinator : public ShutdownCoordinator {
private:
    ServicePort &servicePort;
    int controlTimeoutMs;
    int pollIntervalMs;

public:
    HttpShutdownCoordinator(ServicePort &servicePort, int controlTimeoutMs, int pollIntervalMs);

    bool RequestMainShutdown(const LockRecord &record) override;
    bool WaitForPortFree(int timeoutMs) override;
};
