#include "../include/leader_election.hpp"

#include <stdexcept>
#include <utility>

TcpServicePort::TcpServicePort(uint16_t port, string host)
    : port(port), host(std::move(host)) {}

TcpServicePort::~TcpServicePort() {
  this->Release();
}

sock_t TcpServicePort::Bind(int &bindErr) {
  sock_t sock = tcp_listen(this->port, this->host, Consts::LISTEN_BACKLOG, &bindErr);
  if (sock == NET_INVALID && bindErr != EADDRINUSE) {
    // Not a contention answer: nobody could ever win with this configuration.
    throw std::runtime_error("Cannot bind service port " + this->host + ":" + std::to_string(this->port) +
                             ": " + std::strerror(bindErr));
  }
  return sock;
}

bool TcpServicePort::TryAcquire() {
  if (this->IsHeld()) {
    return true;
  }

  int bindErr = 0;
  sock_t sock = this->Bind(bindErr);
  if (sock == NET_INVALID) {
    return false;
  }
  this->listenSocket = sock;
  return true;
}

void TcpServicePort::Release() {
  if (this->listenSocket != NET_INVALID) {
    net_close(this->listenSocket);
    this->listenSocket = NET_INVALID;
  }
}

bool TcpServicePort::ProbeFree() {
  if (this->IsHeld()) {
    return true;
  }

  int bindErr = 0;
  sock_t sock = this->Bind(bindErr);
  if (sock == NET_INVALID) {
    return false;
  }
  net_close(sock);
  return true;
}

LeaderElection::LeaderElection(ServicePort &servicePort, LockStore &lockStore, string version)
    : servicePort(servicePort), lockStore(lockStore), version(std::move(version)) {}

bool LeaderElection::TryBecomeMain() {
  if (!this->servicePort.TryAcquire()) {
    log_line(LogLevel::DEBUG, "Election: service port " + std::to_string(this->servicePort.Port()) + " is taken");
    return false;
  }

  LockRecord record;
  record.ownerPid        = static_cast<int64_t>(::getpid());
  record.protocolVersion = this->version;
  record.servicePort     = this->servicePort.Port();
  record.writtenAtMs     = now_ms();

  try {
    this->lockStore.Write(record);
  } catch (...) {
    // Holding the port without a published record would strand every peer.
    this->servicePort.Release();
    throw;
  }

  this->ownRecord = record;
  log_line(LogLevel::INFO, "Election: became main on port " + std::to_string(record.servicePort) +
           " (pid " + std::to_string(record.ownerPid) + ", version " + record.protocolVersion + ")");
  return true;
}
