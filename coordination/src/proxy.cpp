#include "../include/proxy.hpp"
#include "../include/rules.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

ProxyTransport::ProxyTransport(uint16_t proxyPort, string bindHost)
    : bindHost(std::move(bindHost)), requestedPort(proxyPort), backendHost(LOCAL_HOST) {}

ProxyTransport::~ProxyTransport() {
  this->Stop();
}

uint16_t ProxyTransport::StartProxy(const LockRecord &record) {
  if (this->running) {
    throw std::runtime_error("Proxy already started");
  }

  int listenErr = 0;
  sock_t sock = tcp_listen(this->requestedPort, this->bindHost, Consts::LISTEN_BACKLOG, &listenErr);
  if (sock == NET_INVALID) {
    throw std::runtime_error("Cannot open proxy listener on " + this->bindHost + ":" +
                             std::to_string(this->requestedPort) + ": " + std::strerror(listenErr));
  }

  this->backendPort  = record.servicePort;
  this->listenSocket = sock;
  this->listenPort   = tcp_local_port(sock);
  this->running      = true;

  this->acceptThread = thread(&ProxyTransport::AcceptConnections, this);

  log_line(LogLevel::INFO, "Proxy: listening on " + this->bindHost + ":" + std::to_string(this->listenPort) +
           " -> " + this->backendHost + ":" + std::to_string(this->backendPort) +
           " (main pid " + std::to_string(record.ownerPid) + ")");
  return this->listenPort;
}

void ProxyTransport::Run() {
  std::unique_lock<mutex> lock(this->mtx);
  this->stoppedCondition.wait(lock, [this] { return !this->running; });
}

void ProxyTransport::Stop() {
  {
    std::lock_guard<mutex> lock(this->mtx);
    this->running = false;
  }

  // shutdown() wakes the accept() blocked in AcceptConnections.
  sock_t sock = this->listenSocket.exchange(NET_INVALID);
  if (sock != NET_INVALID) {
    shutdown(sock, SHUT_RDWR);
    net_close(sock);
  }
  this->stoppedCondition.notify_all();

  std::lock_guard<mutex> joinLock(this->joinMutex);
  if (this->acceptThread.joinable() && this->acceptThread.get_id() != std::this_thread::get_id()) {
    this->acceptThread.join();
  }
}

void ProxyTransport::AcceptConnections() {
  while (this->running) {
    sock_t listener = this->listenSocket;
    if (listener == NET_INVALID) {
      break;
    }

    sock_t clientSocket = tcp_accept(listener);
    if (clientSocket == NET_INVALID) {
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      if (this->running) {
        log_line(LogLevel::WARN, "Proxy: accept failed: " + string(std::strerror(errno)));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
      continue;
    }

    // One forwarding context per inbound connection.
    thread(&ProxyTransport::RelayConnection, clientSocket, this->backendHost, this->backendPort).detach();
  }
}

void ProxyTransport::RelayConnection(sock_t clientSocket, string backendHost, uint16_t backendPort) {
  sock_t backendSocket = tcp_connect(backendHost, backendPort);
  if (backendSocket == NET_INVALID) {
    log_line(LogLevel::WARN, "Proxy: main instance unreachable on port " + std::to_string(backendPort));
    // Reset instead of FIN so the client sees a failed connection, not an empty reply.
    struct linger lin;
    lin.l_onoff  = 1;
    lin.l_linger = 0;
    setsockopt(clientSocket, SOL_SOCKET, SO_LINGER, &lin, sizeof(lin));
    net_close(clientSocket);
    return;
  }

  sock_t ends[2] = {clientSocket, backendSocket};
  bool   readable[2] = {true, true};  // direction i reads from ends[i], writes to ends[1 - i]
  std::vector<char> buffer(Consts::RELAY_CHUNK_SIZE);
  bool broken = false;

  while (!broken && (readable[0] || readable[1])) {
    pollfd fds[2]{};
    for (int i = 0; i < 2; ++i) {
      fds[i].fd     = readable[i] ? ends[i] : -1;
      fds[i].events = POLLIN;
    }

    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      broken = true;
      break;
    }

    for (int i = 0; i < 2 && !broken; ++i) {
      if (!readable[i] || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }

      ssize_t received = recv(ends[i], buffer.data(), buffer.size(), 0);
      if (received > 0) {
        if (!send_all(ends[1 - i], buffer.data(), static_cast<size_t>(received))) {
          broken = true;
        }
      } else if (received == 0) {
        // Half-close: pass the EOF on, keep relaying the other direction.
        readable[i] = false;
        shutdown(ends[1 - i], SHUT_WR);
      } else if (errno != EINTR && errno != EAGAIN) {
        broken = true;
      }
    }
  }

  net_close(clientSocket);
  net_close(backendSocket);
}
