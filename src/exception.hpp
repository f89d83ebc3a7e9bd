#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace fsutils {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

// Malformed command line. An empty message means "print the usage line".
class usage_error : public exception {
 public:
  usage_error() : exception("") {}
  explicit usage_error(const std::string& message) : exception(message) {}
};

// Fatal filesystem failure. Carries the underlying error code so callers can
// tell permission problems apart from everything else.
class io_error : public exception {
  std::error_code _code;

 public:
  io_error(const std::string& message, std::error_code code) : exception(message), _code(code) {}

  const std::error_code& code() const { return _code; }
};

}  // namespace fsutils
