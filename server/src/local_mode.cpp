#include "../include/local_mode.hpp"
#include "../include/symbols.hh"
#include "../../coordination/include/common.hpp"

#include <lithium_json.hh>

#include <istream>
#include <ostream>

int run_local_mode(std::istream& in, std::ostream& out, const std::string& version) {
  log_line(LogLevel::INFO, "Local mode (version " + version + "), reading commands from stdin");

  string line;
  while (std::getline(in, line)) {
    string command = trim(line);
    if (command.empty()) {
      continue;
    }

    if (command == "quit") {
      break;
    } else if (command == "version") {
      out << li::json_encode(li::mmm(s::version = version)) << "\n";
    } else if (command == "health") {
      out << li::json_encode(li::mmm(s::status = string("healthy"),
                                     s::version = version,
                                     s::mode = string("local"),
                                     s::pid = static_cast<int64_t>(::getpid()))) << "\n";
    } else {
      log_line(LogLevel::WARN, "Local mode: unknown command '" + command + "'");
      out << li::json_encode(li::mmm(s::error = "unknown command: " + command)) << "\n";
    }
    out.flush();
  }

  return out.good() ? 0 : 1;
}
