#pragma once

#include <functional>
#include <sstream>
#include <string>

namespace fsutils {

enum class log_level {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
  off = 4,
};

// Buffers one message and hands it to the commit function when destroyed, so a
// message is written to stderr in a single piece.
class log_stream : public std::ostringstream {
  std::function<void(const std::string&)> _commit;

 public:
  log_stream() = default;
  explicit log_stream(std::function<void(const std::string&)> commit);
  log_stream(log_stream&& other);
  ~log_stream() override;
};

// Set log level
void set_log_level(log_level level);
log_level get_log_level();

// Name printed in front of every message, normally the program name
void set_log_name(const std::string& name);

// Parses "debug", "info", "warn", "error" or "off". Throws std::invalid_argument.
log_level parse_log_level(const std::string& text);

// Reads FSUTILS_LOG_LEVEL, if set
void configure_log_from_env();

// Returns the log stream if enabled, otherwise returns a stream that discards its input
log_stream log(log_level level = log_level::info);

}  // namespace fsutils
