#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fsutils {

static log_level _log_level = log_level::off;
static std::string _log_name;

log_stream::log_stream(std::function<void(const std::string&)> commit) : _commit(std::move(commit)) {}

log_stream::log_stream(log_stream&& other) : std::ostringstream(std::move(other)), _commit(std::move(other._commit)) {
  other._commit = nullptr;
}

log_stream::~log_stream() {
  if (_commit) {
    _commit(str());
  }
}

void set_log_level(log_level level) { _log_level = level; }

log_level get_log_level() { return _log_level; }

void set_log_name(const std::string& name) { _log_name = name; }

log_level parse_log_level(const std::string& text) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

  if (s == "debug") return log_level::debug;
  if (s == "info") return log_level::info;
  if (s == "warn" || s == "warning") return log_level::warn;
  if (s == "error") return log_level::error;
  if (s == "off" || s == "none") return log_level::off;

  throw std::invalid_argument("invalid log level: " + text);
}

void configure_log_from_env() {
  const char* value = std::getenv("FSUTILS_LOG_LEVEL");
  if (value == nullptr || *value == '\0') {
    return;
  }

  try {
    set_log_level(parse_log_level(value));
  }
  catch (const std::invalid_argument& e) {
    std::cerr << "warning: " << e.what() << std::endl;
  }
}

log_stream log(log_level level) {
  if (level == log_level::off || level < _log_level) {
    return log_stream();
  }

  log_stream stream([](const std::string& message) {
    std::cerr << message;
    if (message.empty() || message.back() != '\n') {
      std::cerr << '\n';
    }
    std::cerr.flush();
  });

  if (!_log_name.empty()) {
    stream << _log_name << ": ";
  }

  switch (level) {
    case log_level::debug:
      stream << "debug - ";
      break;
    case log_level::info:
      stream << "info - ";
      break;
    case log_level::warn:
      stream << "warn - ";
      break;
    case log_level::error:
      stream << "error - ";
      break;
    default:
      break;
  }
  return stream;
}

}  // namespace fsutils
