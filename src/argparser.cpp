#include "argparser.hpp"
#include "exception.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fsutils {

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

uint64_t parse_size(const std::string& size) {
  // Parse size string. Supports these suffixes:
  // - k = 1024
  // - m = 1024 * 1024
  // - g = 1024 * 1024 * 1024
  // No suffix means bytes.
  size_t number_length = size.find_first_not_of("0123456789");
  if (number_length == std::string::npos) {
    number_length = size.size();
  }
  if (number_length == 0) {
    throw std::invalid_argument("invalid size: " + size);
  }

  uint64_t number = 0;
  try {
    number = std::stoull(size.substr(0, number_length));
  }
  catch (const std::out_of_range&) {
    throw std::invalid_argument("size out of range: " + size);
  }

  std::string unit = size.substr(number_length);
  std::transform(unit.begin(), unit.end(), unit.begin(), [](unsigned char c) { return std::tolower(c); });

  uint64_t multiplier = 1;
  if (unit == "k") {
    multiplier = 1024ull;
  }
  else if (unit == "m") {
    multiplier = 1024ull * 1024;
  }
  else if (unit == "g") {
    multiplier = 1024ull * 1024 * 1024;
  }
  else if (!unit.empty()) {
    throw std::invalid_argument("invalid size unit: " + unit);
  }

  if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
    throw std::invalid_argument("size out of range: " + size);
  }
  return number * multiplier;
}

uint32_t parse_count(const std::string& count) {
  std::string digits = count;
  if (!digits.empty() && digits[0] == '+') {
    digits.erase(0, 1);
  }
  if (!all_digits(digits)) {
    throw std::invalid_argument("invalid count: " + count);
  }

  unsigned long long value = 0;
  try {
    value = std::stoull(digits);
  }
  catch (const std::out_of_range&) {
    throw std::invalid_argument("count out of range: " + count);
  }
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("count out of range: " + count);
  }
  return static_cast<uint32_t>(value);
}

argparser::argparser() {}

argparser::argparser(const std::string& command) : _command(command) {}

void argparser::add_option(const std::string& name) {
  _options[name] = std::make_shared<option>(option{name, true});
}

void argparser::add_bool_option(const std::string& name) {
  _options[name] = std::make_shared<option>(option{name, false});
}

void argparser::add_option_alias(const std::string& name, const std::string& alias) {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  _options[alias] = _options[name];
}

bool argparser::is_option(const std::string& arg) const {
  return _options.find(arg) != _options.end();
}

std::string argparser::canonical(const std::string& arg) const {
  auto it = _options.find(arg);
  if (it == _options.end()) {
    throw std::invalid_argument("unknown option: " + arg);
  }
  return it->second->name;
}

bool argparser::takes_value(const std::string& name) const {
  auto it = _options.find(name);
  if (it == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  return it->second->has_value;
}

void argparser::parse(int argc, char** argv) {
  parse(std::vector<std::string>(argv, argv + argc));
}

void argparser::parse(const std::vector<std::string>& argv) {
  if (!argv.empty() && _command.empty()) {
    _command = std::filesystem::path(argv[0]).stem().string();
  }

  _arguments.clear();
  _values.clear();
  _flag.clear();
  _flag_spelling.clear();
  _flag_value.clear();

  if (argv.size() > 1) {
    _arguments.assign(argv.begin() + 1, argv.end());
  }

  if (_arguments.empty()) {
    throw usage_error();
  }

  size_t i = 0;
  auto it = _options.find(_arguments[0]);
  if (it != _options.end()) {
    _flag = it->second->name;
    _flag_spelling = _arguments[0];
    ++i;

    if (it->second->has_value) {
      if (i >= _arguments.size()) {
        throw usage_error("Missing value for '" + _flag_spelling + "'");
      }
      _flag_value = _arguments[i++];
    }
  }

  for (; i < _arguments.size(); ++i) {
    _values.push_back(_arguments[i]);
  }
}

bool argparser::has_option(const std::string& name) const {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  return !_flag.empty() && _flag == canonical(name);
}

std::string argparser::get_option(const std::string& name) const {
  if (!has_option(name)) {
    return "";
  }
  return _flag_value;
}

std::string argparser::flag_spelling() const {
  return _flag_spelling;
}

const std::vector<std::string>& argparser::values() const {
  return _values;
}

const std::vector<std::string>& argparser::arguments() const {
  return _arguments;
}

std::string argparser::command() const {
  return _command;
}

size_t argparser::size() const {
  return _values.size();
}

}  // namespace fsutils
