#include "cli.hpp"
#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

namespace fsutils {

void print_usage(std::ostream& out, const std::string& command, const std::string& synopsis) {
  out << "Usage: " << command << "[.exe] [args] " << synopsis << std::endl;
}

void print_help_pointer(std::ostream& out, const std::string& command) {
  out << "Enter '" << command << " --help' to learn more" << std::endl;
}

int run_tool(const std::string& name, const std::string& synopsis, int argc, char** argv,
             const std::function<void(argparser&)>& setup, const std::function<int(const argparser&)>& body) {
  set_log_name(name);
  configure_log_from_env();

  argparser args;
  auto command = [&]() { return args.command().empty() ? name : args.command(); };

  try {
    setup(args);
    args.parse(argc, argv);
    log(log_level::debug) << "parsed " << args.arguments().size() << " arguments";
    return body(args);
  }
  catch (const usage_error& e) {
    if (std::string(e.what()).empty()) {
      print_usage(std::cerr, command(), synopsis);
    }
    else {
      std::cerr << "Error: " << e.what() << std::endl;
    }
    print_help_pointer(std::cerr, command());
    return EXIT_FAILURE;
  }
  catch (const io_error& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

}  // namespace fsutils
