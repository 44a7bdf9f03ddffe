#include "../include/liveness.hpp"

#include <cerrno>
#include <limits>
#include <signal.h>
#include <sys/types.h>

bool ProcessLivenessChecker::IsAlive(int64_t pid) {
  if (pid <= 0 || pid > std::numeric_limits<pid_t>::max()) {
    return false;
  }

  if (kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // EPERM: exists, but belongs to another user.
  return errno == EPERM;
}
