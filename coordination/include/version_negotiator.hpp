#pragma once

#include "lock_store.hpp"
#include <optional>
#include <string>

using std::string;

// Asks a running main which build it is.
class VersionNegotiator {
public:
    virtual ~VersionNegotiator() = default;

    // Empty optional on any failure; callers treat that like a dying owner.
    virtual std::optional<string> FetchMainVersion(const LockRecord &record) = 0;
};

// GET /__version on 127.0.0.1:<record.servicePort>.
class HttpVersionNegotiator : public VersionNegotiator {
private:
    int timeoutMs;

public:
    explicit HttpVersionNegotiator(int timeoutMs);

    std::optional<string> FetchMainVersion(const LockRecord &record) override;
};

// Accepts {"version":"x"} or a bare version string.
std::optional<string> parse_version_body(const string &body);
