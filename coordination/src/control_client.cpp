#include "../include/control_client.hpp"
#include "../include/common.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

ControlClient::ControlClient(string host, uint16_t port, int timeoutMs)
    : host(std::move(host)), port(port), timeoutMs(timeoutMs) {}

static string lower(string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

ControlResponse ControlClient::send_request(const string& method, const string& path, const string& body) {
    ControlResponse response;

    sock_t sock = tcp_connect(host, port, timeoutMs);
    if (sock == NET_INVALID) {
        response.error = "Failed to connect to " + host + ":" + std::to_string(port);
        return response;
    }
    set_socket_timeouts(sock, timeoutMs);

    string request = method + " " + path + " HTTP/1.1\r\n"
                     "Host: " + host + ":" + std::to_string(port) + "\r\n"
                     "Connection: close\r\n"
                     "Content-Length: " + std::to_string(body.size()) + "\r\n"
                     "\r\n" + body;
    if (!send_all(sock, request)) {
        net_close(sock);
        response.error = "Failed to send " + method + " " + path;
        return response;
    }

    // Status line: HTTP/1.1 200 OK
    string line;
    if (!recv_line(sock, line)) {
        net_close(sock);
        response.error = "No response to " + method + " " + path;
        return response;
    }
    auto tokens = split(trim(line), ' ');
    if (tokens.size() < 2 || tokens[0].rfind("HTTP/", 0) != 0) {
        net_close(sock);
        response.error = "Unexpected status line: " + line;
        return response;
    }
    try {
        response.statusCode = std::stoi(tokens[1]);
    } catch (const std::exception&) {
        net_close(sock);
        response.error = "Invalid status code: " + tokens[1];
        return response;
    }

    // Headers until the empty line
    long contentLength = -1;
    while (true) {
        if (!recv_line(sock, line)) {
            net_close(sock);
            response.error = "Truncated response headers";
            return response;
        }
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == string::npos) {
            continue;
        }
        if (lower(trim(line.substr(0, colon))) == "content-length") {
            try {
                contentLength = std::stol(trim(line.substr(colon + 1)));
            } catch (const std::exception&) {
                net_close(sock);
                response.error = "Invalid Content-Length: " + line;
                return response;
            }
        }
    }

    char buffer[4096];
    while (contentLength < 0 || static_cast<long>(response.body.size()) < contentLength) {
        size_t wanted = sizeof(buffer);
        if (contentLength >= 0) {
            wanted = std::min(wanted, static_cast<size_t>(contentLength) - response.body.size());
        }
        ssize_t received = recv(sock, buffer, wanted, 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            break;
        }
        response.body.append(buffer, static_cast<size_t>(received));
    }
    net_close(sock);

    if (contentLength >= 0 && static_cast<long>(response.body.size()) < contentLength) {
        response.error = "Truncated response body";
        return response;
    }

    response.success = true;
    return response;
}

ControlResponse ControlClient::get(const string& path) {
    return send_request("GET", path, "");
}

ControlResponse ControlClient::post(const string& path, const string& body) {
    return send_request("POST", path, body);
}
