#pragma once

#include "argparser.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fsutils {
namespace tail {

struct options {
  uint32_t num_lines = 10;

  // When set, the last num_bytes bytes are printed instead of lines
  std::optional<uint64_t> num_bytes;
};

// Registers the tail flags and their aliases
void register_options(argparser& args);

// Returns the final num_lines elements of text split on '\n'.
// A trailing newline yields a final empty element.
std::vector<std::string> last_lines(const std::string& text, uint32_t num_lines);

// Prints the "==> name <==" header and its rule
void print_header(std::ostream& out, const std::string& path);

// Prints the header, the tail of the file and a blank line. Throws io_error.
void print_file(std::ostream& out, const std::filesystem::path& path, const options& opts);

// Walks the arguments in order. Flags update opts and apply to the files that
// follow them; each file is printed as soon as it is reached.
// Throws usage_error for bad flags and io_error for unreadable files.
void scan(std::ostream& out, const argparser& args, options& opts);

void print_help(std::ostream& out, const std::string& command);

// Returns the process exit code
int run(std::ostream& out, const argparser& args);

}  // namespace tail
}  // namespace fsutils
