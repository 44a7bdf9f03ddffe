#pragma once
#include <iosfwd>
#include <string>

/**
 * Local single-shot mode: answers line commands from in, one JSON line each on out.
 *
 *   version -> {"version":"..."}
 *   health  -> {"status":"healthy","version":"...","mode":"local","pid":...}
 *   quit    -> stops reading
 *
 * Never touches the lock file or the service port.
 * @return process exit code
 */
int run_local_mode(std::istream& in, std::ostream& out, const std::string& version);
