#include "touch.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "log.hpp"

#include <cstdlib>
#include <ostream>
#include <system_error>

namespace fsutils {
namespace touch {

namespace {

bool permission_denied(const std::error_code& ec) {
  return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

[[noreturn]] void unexpected(const io_error& e) {
  throw io_error("An unexpected error occurred: " + e.code().message(), e.code());
}

time_target target_for(time_mode mode) {
  switch (mode) {
    case time_mode::access:
      return time_target::access;
    case time_mode::modification:
      return time_target::modification;
    default:
      return time_target::both;
  }
}

outcome make_directory(const std::filesystem::path& target) {
  try {
    fsutils::create_directories(target);
  }
  catch (const io_error& e) {
    if (permission_denied(e.code())) {
      throw io_error("Error: Unable to create the folder '" + target.string() +
                         "'.\nPossible reasons:\n - Insufficient permissions.\n - Invalid folder name.",
                     e.code());
    }
    unexpected(e);
  }
  return outcome::created_directory;
}

outcome make_file(const std::filesystem::path& target, time_mode mode) {
  bool created = false;
  try {
    created = create_new_file(target);
  }
  catch (const io_error& e) {
    if (permission_denied(e.code())) {
      throw io_error("Error: Unable to create the file '" + target.string() +
                         "'.\nPossible reasons:\n - Insufficient permissions.\n - Invalid file name.",
                     e.code());
    }
    unexpected(e);
  }

  if (created) {
    return outcome::created_file;
  }

  try {
    touch_times(target, target_for(mode));
  }
  catch (const io_error& e) {
    unexpected(e);
  }
  return outcome::updated;
}

}  // namespace

void register_options(argparser& args) {
  args.add_bool_option("--help");
  args.add_option_alias("--help", "/h");
  args.add_bool_option("--no-create");
  args.add_option_alias("--no-create", "/c");
  args.add_bool_option("--directory");
  args.add_option_alias("--directory", "/d");
  args.add_bool_option("--access-time");
  args.add_option_alias("--access-time", "/a");
  args.add_bool_option("--modification-time");
  args.add_option_alias("--modification-time", "/m");
}

options parse_options(const argparser& args) {
  options opts;
  if (args.has_option("--no-create")) {
    opts.no_create = true;
  }
  else if (args.has_option("--directory")) {
    opts.mode = time_mode::directory;
  }
  else if (args.has_option("--access-time")) {
    opts.mode = time_mode::access;
  }
  else if (args.has_option("--modification-time")) {
    opts.mode = time_mode::modification;
  }
  return opts;
}

std::vector<std::string> targets(const argparser& args) {
  std::vector<std::string> result;
  for (const auto& arg : args.arguments()) {
    // A flag spelling is never taken as a file name
    if (!args.is_option(arg)) {
      result.push_back(arg);
    }
  }
  return result;
}

outcome touch_target(const std::filesystem::path& target, const options& opts) {
  if (opts.no_create && !fsutils::exists(target)) {
    return outcome::skipped;
  }
  if (opts.mode == time_mode::directory) {
    return make_directory(target);
  }
  return make_file(target, opts.mode);
}

void print_help(std::ostream& out, const std::string& command) {
  out << "Usage: " << command << "[.exe] [args] <file_name>\n"
      << "\nOPTIONAL ARGUMENTS\n\n"
      << "Note: Only one argument can be used at a time\n\n"
      << "/h or --help                Displays this help message\n\n"
      << "/c or --no-create           Prevents creating new files if they don't already exist\n"
      << "                            If a file exists, the timestamps will be updated\n"
      << "                            but if the file doesn't exist, nothing will happen\n\n"
      << "/d or --directory           Creates directories instead of files\n"
      << "                            Can also create nested folders:\n"
      << "                            " << command << " --directory this/is/a/nested/folder\n\n"
      << "/a or --access-time         Only updates the accessed time of the file if the file already exists,\n"
      << "                            otherwise it creates the file like normal\n\n"
      << "/m or --modification-time   Only updates the modified time of the file if the file already exists,\n"
      << "                            otherwise it creates the file like normal" << std::endl;
}

int run(const std::vector<std::string>& targets, const options& opts) {
  for (const auto& target : targets) {
    switch (touch_target(target, opts)) {
      case outcome::skipped:
        log(log_level::debug) << target << ": does not exist, skipped";
        break;
      case outcome::created_file:
        log(log_level::debug) << target << ": created file";
        break;
      case outcome::created_directory:
        log(log_level::debug) << target << ": created directory";
        break;
      case outcome::updated:
        log(log_level::debug) << target << ": updated timestamps";
        break;
    }
  }
  return EXIT_SUCCESS;
}

}  // namespace touch
}  // namespace fsutils
