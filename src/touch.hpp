#pragma once

#include "argparser.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace fsutils {
namespace touch {

enum class time_mode {
  // Update both timestamps of existing files
  both,
  // Update only the access time of existing files
  access,
  // Update only the modification time of existing files
  modification,
  // Create directories instead of files
  directory,
};

struct options {
  // Leave missing targets alone
  bool no_create = false;
  time_mode mode = time_mode::both;
};

// What happened to a single target
enum class outcome {
  skipped,
  created_file,
  created_directory,
  updated,
};

// Registers the touch flags and their aliases
void register_options(argparser& args);

// Builds the options from the first flag
options parse_options(const argparser& args);

// Every argument that is not one of the flag spellings
std::vector<std::string> targets(const argparser& args);

// Creates or updates one target. Throws io_error with a user facing message.
outcome touch_target(const std::filesystem::path& target, const options& opts);

void print_help(std::ostream& out, const std::string& command);

// Returns the process exit code
int run(const std::vector<std::string>& targets, const options& opts);

}  // namespace touch
}  // namespace fsutils
