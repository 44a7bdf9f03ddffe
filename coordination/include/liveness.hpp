#pragma once

#include <cstdint>

// Host-local check whether a process id still exists.
// A recycled pid reads as alive; callers confirm with a version query.
class LivenessChecker {
public:
    virtual ~LivenessChecker() = default;

    virtual bool IsAlive(int64_t pid) = 0;
};

// kill(pid, 0) based checker. Never throws.
class ProcessLivenessChecker : public LivenessChecker {
public:
    bool IsAlive(int64_t pid) override;
};
