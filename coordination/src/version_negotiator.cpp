#include "../include/version_negotiator.hpp"
#include "../include/common.hpp"
#include "../include/control_client.hpp"
#include "../include/rules.hpp"
#include "../include/symbols.hh"

#include <lithium_json.hh>

HttpVersionNegotiator::HttpVersionNegotiator(int timeoutMs) : timeoutMs(timeoutMs) {}

std::optional<string> parse_version_body(const string &body) {
  string text = trim(body);
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.front() == '{') {
    auto parsed = li::mmm(s::version = string());
    auto err = li::json_decode(text, parsed);
    if (err.bad() || trim(parsed.version).empty()) {
      return std::nullopt;
    }
    return trim(parsed.version);
  }

  // Plain text answers are a single token; anything else is not our protocol.
  if (text.find_first_of(" \t\r\n<") != string::npos) {
    return std::nullopt;
  }
  return text;
}

std::optional<string> HttpVersionNegotiator::FetchMainVersion(const LockRecord &record) {
  ControlClient client(LOCAL_HOST, record.servicePort, this->timeoutMs);
  ControlResponse response = client.get(VERSION_PATH);

  if (!response.success) {
    log_line(LogLevel::WARN, "Version query to port " + std::to_string(record.servicePort) +
             " failed: " + response.error);
    return std::nullopt;
  }
  if (response.statusCode != 200) {
    log_line(LogLevel::WARN, "Version query to port " + std::to_string(record.servicePort) +
             " answered HTTP " + std::to_string(response.statusCode));
    return std::nullopt;
  }

  auto version = parse_version_body(response.body);
  if (!version) {
    log_line(LogLevel::WARN, "Unrecognized version response: " + response.body);
  }
  return version;
}
