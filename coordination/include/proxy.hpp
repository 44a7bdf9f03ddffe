#pragma once

#include "common.hpp"
#include "lock_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

using std::string;
using std::atomic;
using std::thread;
using std::mutex;
using std::condition_variable;

/**
 * ProxyTransport - transparent TCP relay to the main instance
 *
 * Every accepted connection gets its own thread and its own backend
 * connection to 127.0.0.1:<servicePort>. Bytes are written through as soon
 * as they are read, in both directions, so streamed responses (SSE, chunked
 * bodies, upgraded websockets) pass unchanged. Nothing is parsed.
 */
class ProxyTransport {
private:
    // Configuration
    string   bindHost;
    uint16_t requestedPort;
    string   backendHost;
    uint16_t backendPort{0};

    // State
    atomic<bool>   running{false};
    atomic<sock_t> listenSocket{NET_INVALID};
    atomic<uint16_t> listenPort{0};

    // Synchronization (Run() waits for Stop())
    mutex mtx;
    mutex joinMutex;  // serializes joining acceptThread
    condition_variable stoppedCondition;

    thread acceptThread;

    void AcceptConnections();
    static void RelayConnection(sock_t clientSocket, string backendHost, uint16_t backendPort);

public:
    explicit ProxyTransport(uint16_t proxyPort, string bindHost = "127.0.0.1");
    ~ProxyTransport();

    ProxyTransport(const ProxyTransport &) = delete;
    ProxyTransport &operator=(const ProxyTransport &) = delete;

    /**
     * Opens the local listener and starts forwarding to record.servicePort.
     * @return the port actually listened on (useful with proxyPort 0)
     * @throws std::runtime_error if the listener cannot be opened
     */
    uint16_t StartProxy(const LockRecord &record);

    // Blocks until Stop() is called from another thread.
    void Run();
    // Closes the listener and joins the accept thread; relays already running finish on their own.
    void Stop();

    uint16_t ListenPort() const { return listenPort; }
    bool IsRunning() const { return running; }
};
