#include "tail.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "log.hpp"
#include "terminal.hpp"
#include "utf8.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fsutils {
namespace tail {

namespace {

// Arguments that look like flags: "-x", "--xyz" or "/x"
bool looks_like_flag(const std::string& arg) {
  if (arg.empty()) {
    return false;
  }
  return arg[0] == '-' || (arg[0] == '/' && arg.size() == 2);
}

std::string read_or_throw(const std::filesystem::path& path, const options& opts) {
  try {
    if (opts.num_bytes) {
      return read_tail(path, *opts.num_bytes);
    }
    return read_file(path);
  }
  catch (const io_error& e) {
    throw io_error("Error reading file '" + path.string() + "': " + e.code().message(), e.code());
  }
}

}  // namespace

void register_options(argparser& args) {
  args.add_bool_option("--help");
  args.add_option_alias("--help", "/h");
  args.add_option("--num-lines");
  args.add_option_alias("--num-lines", "/l");
  args.add_option_alias("--num-lines", "/n");
  args.add_option("--num-bytes");
  args.add_option_alias("--num-bytes", "/b");
}

std::vector<std::string> last_lines(const std::string& text, uint32_t num_lines) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (true) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, end - pos));
    pos = end + 1;
  }

  if (lines.size() > num_lines) {
    lines.erase(lines.begin(), lines.end() - num_lines);
  }
  return lines;
}

void print_header(std::ostream& out, const std::string& path) {
  std::string header = "==> " + terminal::highlight(path) + " <==";
  out << header << '\n';
  out << std::string(terminal::display_width(header), '-') << '\n';
}

void print_file(std::ostream& out, const std::filesystem::path& path, const options& opts) {
  std::string content = utf8::decode_lossy(read_or_throw(path, opts));

  print_header(out, path.string());

  if (opts.num_bytes) {
    log(log_level::debug) << path.string() << ": last " << *opts.num_bytes << " bytes";
    out << content;
  }
  else {
    log(log_level::debug) << path.string() << ": last " << opts.num_lines << " lines";
    for (const auto& line : last_lines(content, opts.num_lines)) {
      out << line << '\n';
    }
  }

  out << std::endl;
}

void scan(std::ostream& out, const argparser& args, options& opts) {
  const auto& arguments = args.arguments();

  for (size_t i = 0; i < arguments.size(); ++i) {
    const std::string& arg = arguments[i];

    if (args.is_option(arg)) {
      std::string name = args.canonical(arg);
      if (!args.takes_value(name)) {
        // Help is only honoured as the first argument
        continue;
      }
      if (i + 1 >= arguments.size()) {
        throw usage_error("Missing value for '" + arg + "'");
      }

      const std::string& value = arguments[++i];
      if (name == "--num-lines") {
        try {
          opts.num_lines = parse_count(value);
        }
        catch (const std::invalid_argument&) {
          throw usage_error("Invalid number of lines '" + value + "'");
        }
      }
      else if (name == "--num-bytes") {
        try {
          opts.num_bytes = parse_size(value);
        }
        catch (const std::invalid_argument&) {
          throw usage_error("Invalid size format '" + value + "'");
        }
      }
      continue;
    }

    if (looks_like_flag(arg)) {
      throw usage_error("Unknown argument '" + arg + "'");
    }

    print_file(out, arg, opts);
  }
}

void print_help(std::ostream& out, const std::string& command) {
  out << "Usage: " << command << "[.exe] [args] <file_name>\n"
      << "\nOPTIONAL ARGUMENTS\n\n"
      << "Note: Flags apply to the files listed after them\n\n"
      << "/h or --help                  Displays this help message\n"
      << "/l or --num-lines <number>    Displays the last n lines of the file (default 10)\n"
      << "                              (/n is accepted as well)\n"
      << "/b or --num-bytes <size>      Displays the last n bytes of the file\n"
      << "                              (Also supports human-readable formats like:\n"
      << "                              '2k' for 2 kilobytes,\n"
      << "                              '3m' for 3 megabytes\n"
      << "                              and '1g' for 1 gigabyte)" << std::endl;
}

int run(std::ostream& out, const argparser& args) {
  options opts;
  scan(out, args, opts);
  return EXIT_SUCCESS;
}

}  // namespace tail
}  // namespace fsutils
