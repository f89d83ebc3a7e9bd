#pragma once

#include "argparser.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <ostream>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace fsutils {
namespace locate {

// Limit value meaning "print every match"
constexpr uint32_t unlimited = std::numeric_limits<uint32_t>::max();

// Lowercase full path contains lowercase term
struct plain_mode {};

// Lowercase file name contains lowercase term
struct basename_mode {};

// Full path contains term verbatim
struct case_sensitive_mode {};

// Lowercase full path matches the pattern anywhere
struct regex_mode {
  std::string source;
  std::regex pattern;
};

using match_mode = std::variant<plain_mode, basename_mode, case_sensitive_mode, regex_mode>;

struct options {
  match_mode mode;
  bool count_only = false;
  uint32_t limit = unlimited;
};

// Registers the locate flags and their aliases
void register_options(argparser& args);

// Builds the options from the first flag. Throws usage_error.
options parse_options(const argparser& args);

// The search term is the last argument. When a value flag is the only
// argument its value is the term. Throws usage_error if there is none.
std::string search_term(const argparser& args);

// Returns true if the path matches term under the selected mode
bool matches(const std::filesystem::path& path, const std::string& term, const options& opts);

// Walks root and returns the displayed path of every matching regular file, in traversal order
std::vector<std::string> find_files(const std::filesystem::path& root, const std::string& term, const options& opts);

// Prints the listing (unless count_only) and the "<n> results found" line
void print_results(std::ostream& out, const std::vector<std::string>& files, const std::string& term,
                   const options& opts);

void print_help(std::ostream& out, const std::string& command);

// Searches the current directory. Returns the process exit code.
int run(std::ostream& out, const std::string& term, const options& opts);

}  // namespace locate
}  // namespace fsutils
