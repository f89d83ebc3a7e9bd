#ifndef ARGS_HPP
#define ARGS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fsutils {

// Parses a human readable size: digits followed by an optional unit
// k, m or g (case-insensitive, powers of 1024). Throws std::invalid_argument.
uint64_t parse_size(const std::string& size);

// Parses a non-negative decimal count that fits into 32 bits.
// Throws std::invalid_argument.
uint32_t parse_count(const std::string& count);

// Command line parser for the single-flag tools.
//
// Options are registered by their long name and may have any number of
// aliases ("/b" for "--basename"). Only the first argument is inspected for a
// flag; when that flag takes a value, the following argument is consumed.
// All other arguments are kept as positional values.
class argparser {
  struct option {
    std::string name;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _arguments;
  std::vector<std::string> _values;
  std::string _command;
  std::string _flag;
  std::string _flag_spelling;
  std::string _flag_value;

 public:
  argparser();
  explicit argparser(const std::string& command);

  void add_option(const std::string& name);
  void add_bool_option(const std::string& name);
  void add_option_alias(const std::string& name, const std::string& alias);

  // Returns true if arg is a registered option name or alias
  bool is_option(const std::string& arg) const;

  // Returns the long name of a registered option or alias
  std::string canonical(const std::string& arg) const;

  // Returns true if the option takes a value
  bool takes_value(const std::string& name) const;

  void parse(int argc, char** argv);

  // Parses a full argument vector, program name included
  void parse(const std::vector<std::string>& argv);

  // Check if the option was given as the first argument
  bool has_option(const std::string& name) const;

  // Value given to the first-argument option
  std::string get_option(const std::string& name) const;

  // The first argument exactly as typed, if it was an option
  std::string flag_spelling() const;

  // Positional values, in order
  const std::vector<std::string>& values() const;

  // All arguments after the program name
  const std::vector<std::string>& arguments() const;

  // Program name without directory or extension
  std::string command() const;

  // Returns the number of values
  size_t size() const;
};

}  // namespace fsutils

#endif  // ARGS_HPP
