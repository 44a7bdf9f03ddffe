#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <sstream>
#include <iostream>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <cctype>
#include <cerrno>
#include <iomanip>
#include <fcntl.h>
#include <poll.h>

using std::string;
using std::vector;

// ---------- Logging ----------

// Log levels used to tag every diagnostic line.
enum class LogLevel : uint8_t { DEBUG, INFO, WARN, ERROR };

// Short fixed-width tag for a LogLevel, e.g. "DEBUG", "INFO ".
static inline const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
      case LogLevel::DEBUG: return "DEBUG";
      case LogLevel::INFO:  return "INFO ";
      case LogLevel::WARN:  return "WARN ";
      case LogLevel::ERROR: return "ERROR";
    }
    return "UNKWN";
}

namespace Consts {
    // Time related
    static constexpr uint32_t MS_PER_SEC        = 1000;
    static constexpr int      LOG_MS_WIDTH      = 3;    // Width for milliseconds in timestamp

    // Networking
    static constexpr int      CONNECT_TIMEOUT_MS = 2000;
    static constexpr int      LISTEN_BACKLOG    = 64;   // Default backlog for tcp_listen
    static constexpr int      NET_OPT_ENABLE    = 1;    // Value to enable socket options (setsockopt)
    static constexpr size_t   RELAY_CHUNK_SIZE  = 16384;

    static constexpr int      MAX_PORT_NUMBER = 65535;
}

// Returns current time in milliseconds since epoch.
static inline uint64_t now_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()
    );
}

// Current wall clock as HH:MM:SS.mmm, used as the log line prefix.
static inline string now_ts() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto tt  = system_clock::to_time_t(now);
    auto ms  = duration_cast<milliseconds>(now.time_since_epoch()) % Consts::MS_PER_SEC;
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(Consts::LOG_MS_WIDTH) << ms.count();
    return oss.str();
}

// Thread-safe log writer. Always stderr: stdout may carry structured protocol traffic.
static inline void log_line(LogLevel lvl, const string& msg) {
    static std::mutex log_mx;
    std::lock_guard<std::mutex> guard(log_mx);
    std::cerr << "[" << now_ts() << "][" << log_level_str(lvl) << "] "
              << msg << "\n";
}


#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
using sock_t = int;

static inline void net_close(sock_t socketHandle) { close(socketHandle); }
static constexpr sock_t NET_INVALID = -1;

// Sets recv/send timeouts (ms) on a socket.
static inline void set_socket_timeouts(sock_t sock, int timeout_ms) {
  if (sock == NET_INVALID || timeout_ms <= 0) {
    return;
  }

  struct timeval tv{};
  tv.tv_sec  = timeout_ms / Consts::MS_PER_SEC;
  tv.tv_usec = (timeout_ms % Consts::MS_PER_SEC) * Consts::MS_PER_SEC;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

/* ===================== TCP helper functions ===================== */

/**
 * Creates a listening TCP socket on host:port.
 *
 * SO_REUSEPORT is deliberately never set: a second bind of the same port must
 * fail with EADDRINUSE, the service port is the instance mutex.
 *
 * @param port - 0 picks an ephemeral port (see tcp_local_port)
 * @param host - dotted IPv4 address to bind, "0.0.0.0" for all interfaces
 * @param err_out - optional, receives errno of the failing call
 * @return listening socket or NET_INVALID
 */
static inline sock_t tcp_listen(uint16_t port, const string& host = "0.0.0.0",
                                int backlog = Consts::LISTEN_BACKLOG, int* err_out = nullptr) {
  if (err_out != nullptr) {
    *err_out = 0;
  }

  sock_t listenSock = socket(AF_INET, SOCK_STREAM, 0);
  if (listenSock == NET_INVALID) {
    if (err_out != nullptr) *err_out = errno;
    log_line(LogLevel::ERROR, "socket() failed in tcp_listen: " + string(std::strerror(errno)));
    return NET_INVALID;
  }

  // SO_REUSEADDR only lets us rebind past TIME_WAIT of a previous owner.
  int reuseFlag = Consts::NET_OPT_ENABLE;
  if (setsockopt(listenSock, SOL_SOCKET, SO_REUSEADDR, &reuseFlag, sizeof(reuseFlag)) < 0) {
    log_line(LogLevel::WARN, "Failed to set SO_REUSEADDR on port " + std::to_string(port));
  }

  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port   = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
    if (err_out != nullptr) *err_out = EINVAL;
    log_line(LogLevel::ERROR, "tcp_listen: invalid bind address " + host);
    net_close(listenSock);
    return NET_INVALID;
  }

  if (bind(listenSock, (sockaddr*)&address, sizeof(address)) < 0) {
    int bindErr = errno;
    if (err_out != nullptr) *err_out = bindErr;
    // Port in use is an expected answer during election, not an error.
    log_line(bindErr == EADDRINUSE ? LogLevel::DEBUG : LogLevel::ERROR,
             "bind() failed on " + host + ":" + std::to_string(port) + ": " + std::strerror(bindErr));
    net_close(listenSock);
    return NET_INVALID;
  }

  if (listen(listenSock, backlog) < 0) {
    if (err_out != nullptr) *err_out = errno;
    log_line(LogLevel::ERROR, "listen() failed on port " + std::to_string(port));
    net_close(listenSock);
    return NET_INVALID;
  }
  return listenSock;
}

// Port a bound socket actually listens on (needed after binding port 0).
static inline uint16_t tcp_local_port(sock_t sock) {
  sockaddr_in address{};
  socklen_t len = sizeof(address);
  if (getsockname(sock, (sockaddr*)&address, &len) != 0) {
    return 0;
  }
  return ntohs(address.sin_port);
}

// Accepts one client. Timeouts are left to the caller; relayed streams may idle for long.
static inline sock_t tcp_accept(sock_t listenSock) {
  sockaddr_in clientAddress{};
  socklen_t addrLen = sizeof(clientAddress);
  return accept(listenSock, (sockaddr*)&clientAddress, &addrLen);
}

// Connects to host:port, giving up after timeout_ms.
static inline sock_t tcp_connect(const string& host, uint16_t port, int timeout_ms = Consts::CONNECT_TIMEOUT_MS) {
  addrinfo hints{};
  addrinfo *result = nullptr;
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  string portStr = std::to_string(port);

  if (getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result) != 0) {
    return NET_INVALID;
  }

  sock_t clientSock = NET_INVALID;

  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    clientSock = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (clientSock == NET_INVALID) {
      continue;
    }

    // Non-blocking connect so the timeout applies
    int flags = fcntl(clientSock, F_GETFL, 0);
    fcntl(clientSock, F_SETFL, flags | O_NONBLOCK);

    int conn_result = connect(clientSock, rp->ai_addr, rp->ai_addrlen);

    if (conn_result == 0) {
      fcntl(clientSock, F_SETFL, flags);
      break;
    }

    if (errno == EINPROGRESS) {
      pollfd pfd{};
      pfd.fd     = clientSock;
      pfd.events = POLLOUT;

      if (poll(&pfd, 1, timeout_ms) > 0) {
        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(clientSock, SOL_SOCKET, SO_ERROR, (char*)&error, &len);

        if (error == 0) {
          fcntl(clientSock, F_SETFL, flags);
          break;
        }
      }
    }

    // Connection failed or timed out - close and try next address
    net_close(clientSock);
    clientSock = NET_INVALID;
  }

  freeaddrinfo(result);
  return clientSock;
}

// Sends the whole buffer, looping over partial writes.
static inline bool send_all(sock_t socketHandle, const char* buffer, size_t dataLen) {
  size_t totalSent = 0;

  while (totalSent < dataLen) {
    ssize_t sent = send(socketHandle, buffer + totalSent, dataLen - totalSent, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    totalSent += (size_t)sent;
  }
  return true;
}

static inline bool send_all(sock_t socketHandle, const string& data) {
  return send_all(socketHandle, data.data(), data.size());
}

// Reads one text line up to '\n' (the '\r' of "\r\n" is dropped) into out.
static inline bool recv_line(sock_t socketHandle, string& out) {
  out.clear();
  char ch;
  while (true) {
    ssize_t received = recv(socketHandle, &ch, 1, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      return false;
    }

    if (ch == '\n') {
      break;
    }
    if (ch != '\r') {
      out.push_back(ch);
    }
  }
  return true;
}

/* ===================== Utility helpers (string) ===================== */

// Strips leading and trailing whitespace.
static inline string trim(const string& str) {
  size_t begin = 0;
  size_t end   = str.size();

  while (begin < end && (std::isspace((unsigned char)str[begin]) != 0)) {
    ++begin;
  }

  while (end > begin && (std::isspace((unsigned char)str[end - 1]) != 0)) {
    --end;
  }

  return str.substr(begin, end - begin);
}

// Splits on a single delimiter character.
static inline vector<string> split(const string& str, char delim) {
  vector<string> parts;
  std::stringstream iss(str);
  string item;
  while (std::getline(iss, item, delim)) {
    parts.push_back(item);
  }
  return parts;
}
