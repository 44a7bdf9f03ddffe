#pragma once
#include <cstdint>
#include <string>

using std::string;

/**
 * ControlResponse - outcome of one control-plane HTTP call
 * success is transport-level: a complete HTTP response was read.
 */
struct ControlResponse {
    bool   success{false};
    int    statusCode{0};
    string body;
    string error;  // Why the call failed if success=false
};

/**
 * ControlClient - minimal HTTP/1.1 client for the main instance's control-plane
 *
 * One connection per request ("Connection: close"), bounded by timeoutMs for
 * connect and for every read/write. Only what the control-plane needs:
 * Content-Length bodies, or read-to-EOF when the header is missing.
 */
class ControlClient {
private:
    string   host;
    uint16_t port;
    int      timeoutMs;

    ControlResponse send_request(const string& method, const string& path, const string& body);

public:
    ControlClient(string host, uint16_t port, int timeoutMs);

    ControlResponse get(const string& path);
    ControlResponse post(const string& path, const string& body = "");
};
