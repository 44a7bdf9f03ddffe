#pragma once

#include "common.hpp"
#include "lock_store.hpp"
#include <cstdint>
#include <string>

using std::string;

/**
 * ServicePort - the fixed TCP port all candidate mains compete for
 *
 * The OS exclusive bind is the mutual exclusion primitive between
 * instances; whoever holds the bound socket is main.
 */
class ServicePort {
public:
    virtual ~ServicePort() = default;

    // Binds and keeps the port. False when someone else holds it.
    virtual bool TryAcquire() = 0;
    virtual void Release() = 0;
    virtual bool IsHeld() const = 0;

    // Binds and immediately releases. True if the port could be bound.
    virtual bool ProbeFree() = 0;

    virtual uint16_t Port() const = 0;
};

class TcpServicePort : public ServicePort {
private:
    uint16_t port;
    string   host;
    sock_t   listenSocket{NET_INVALID};

    sock_t Bind(int &bindErr);

public:
    explicit TcpServicePort(uint16_t port, string host = "0.0.0.0");
    ~TcpServicePort() override;

    TcpServicePort(const TcpServicePort &) = delete;
    TcpServicePort &operator=(const TcpServicePort &) = delete;

    bool TryAcquire() override;
    void Release() override;
    bool IsHeld() const override { return listenSocket != NET_INVALID; }
    bool ProbeFree() override;
    uint16_t Port() const override { return port; }

    // Listening socket while held, NET_INVALID otherwise.
    sock_t Socket() const { return listenSocket; }
};

// One election attempt: bind the service port, then publish our lock record.
class LeaderElection {
private:
    ServicePort &servicePort;
    LockStore   &lockStore;
    string       version;
    LockRecord   ownRecord;

public:
    LeaderElection(ServicePort &servicePort, LockStore &lockStore, string version);

    /**
     * Bind failure means "someone else is main or starting up". It does not
     * imply a lock record exists yet: a racer may sit between bind and write.
     * @return true when this process is now main and its record is written
     */
    bool TryBecomeMain();

    // Record written by the last successful TryBecomeMain().
    const LockRecord &OwnRecord() const { return ownRecord; }
};
