#include "locate.hpp"
#include "directory_iterator.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "terminal.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace fsutils {
namespace locate {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

void register_options(argparser& args) {
  args.add_bool_option("--help");
  args.add_option_alias("--help", "/h");
  args.add_bool_option("--basename");
  args.add_option_alias("--basename", "/b");
  args.add_bool_option("--case-sensitive");
  args.add_option_alias("--case-sensitive", "/s");
  args.add_bool_option("--count");
  args.add_option_alias("--count", "/c");
  args.add_option("--limit");
  args.add_option_alias("--limit", "/l");
  args.add_option("--regex");
  args.add_option_alias("--regex", "/r");
}

options parse_options(const argparser& args) {
  options opts;

  if (args.has_option("--basename")) {
    opts.mode = basename_mode{};
  }
  else if (args.has_option("--case-sensitive")) {
    opts.mode = case_sensitive_mode{};
  }
  else if (args.has_option("--count")) {
    opts.count_only = true;
  }
  else if (args.has_option("--limit")) {
    try {
      opts.limit = parse_count(args.get_option("--limit"));
    }
    catch (const std::invalid_argument&) {
      throw usage_error("Expected value after limit flag to be a positive whole number");
    }
  }
  else if (args.has_option("--regex")) {
    std::string source = args.get_option("--regex");
    try {
      opts.mode = regex_mode{source, std::regex(source)};
    }
    catch (const std::regex_error&) {
      throw usage_error("Expected expression after regex flag to be a valid regular expression");
    }
  }

  // A value flag is followed by exactly one search term
  if (!args.flag_spelling().empty() && args.takes_value(args.flag_spelling()) && args.size() > 1) {
    throw usage_error();
  }

  return opts;
}

std::string search_term(const argparser& args) {
  if (args.size() > 0) {
    return args.values().back();
  }

  // "/r <pattern>" alone searches for the pattern itself
  if (!args.flag_spelling().empty() && args.takes_value(args.flag_spelling())) {
    return args.arguments().back();
  }
  throw usage_error();
}

bool matches(const std::filesystem::path& path, const std::string& term, const options& opts) {
  std::string name = path.filename().string();
  if (name.empty()) {
    return false;
  }

  std::string display = path.string();

  if (std::holds_alternative<basename_mode>(opts.mode)) {
    return contains(lowercase(name), lowercase(term));
  }
  if (std::holds_alternative<case_sensitive_mode>(opts.mode)) {
    return contains(display, term);
  }
  if (const auto* re = std::get_if<regex_mode>(&opts.mode)) {
    return std::regex_search(lowercase(display), re->pattern);
  }
  return contains(lowercase(display), lowercase(term));
}

std::vector<std::string> find_files(const std::filesystem::path& root, const std::string& term, const options& opts) {
  std::vector<std::string> files;

  sorted_directory_iterator it(root);
  for (const auto& entry : it) {
    if (entry.is_file() && matches(entry.path(), term, opts)) {
      files.push_back(entry.path().string());
    }
  }

  log(log_level::debug) << "walked " << it.size() << " entries";
  if (it.skipped() > 0) {
    log(log_level::info) << it.skipped() << " entries could not be read";
  }
  return files;
}

void print_results(std::ostream& out, const std::vector<std::string>& files, const std::string& term,
                   const options& opts) {
  if (!opts.count_only) {
    for (size_t i = 0; i < files.size(); ++i) {
      if (opts.limit != unlimited && i >= opts.limit) {
        break;
      }
      out << terminal::highlight_all(files[i], term) << '\n';
    }
    out << '\n';
  }

  out << files.size() << " results found" << std::endl;
}

void print_help(std::ostream& out, const std::string& command) {
  out << "Usage: " << command << "[.exe] [args] <search_term>\n"
      << "\nOPTIONAL ARGUMENTS\n\n"
      << "Note: Only one argument can be used at a time\n\n"
      << "/h or --help              Displays this help message\n"
      << "/b or --basename          Searches for files using their basename instead of their full path "
         "(case-insensitive)\n"
      << "/s or --case-sensitive    Searches for files using case-sensitive search\n"
      << "/c or --count             Only displays the number of matches and not the files matched\n"
      << "/l or --limit <number>    Limits the number of results displayed\n"
      << "/r or --regex <regexp>    Searches for files based on a regular expression" << std::endl;
}

int run(std::ostream& out, const std::string& term, const options& opts) {
  log(log_level::debug) << "searching for '" << term << "'";
  print_results(out, find_files(".", term, opts), term, opts);
  return EXIT_SUCCESS;
}

}  // namespace locate
}  // namespace fsutils
