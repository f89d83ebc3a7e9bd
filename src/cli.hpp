#pragma once

#include "argparser.hpp"

#include <functional>
#include <ostream>
#include <string>

namespace fsutils {

// Entry point shared by the tools. Sets up logging, registers the options,
// parses the command line and runs body. Exceptions are mapped to
// diagnostics on stderr and exit code 1:
//   usage_error  "Error: <message>" (or the usage line) and the help pointer
//   io_error     the message as is
//   anything else "error: <message>"
//
// synopsis is the trailing part of the usage line, e.g. "<search_term>".
int run_tool(const std::string& name, const std::string& synopsis, int argc, char** argv,
             const std::function<void(argparser&)>& setup, const std::function<int(const argparser&)>& body);

// Prints "Usage: <command>[.exe] [args] <synopsis>"
void print_usage(std::ostream& out, const std::string& command, const std::string& synopsis);

// Prints "Enter '<command> --help' to learn more"
void print_help_pointer(std::ostream& out, const std::string& command);

}  // namespace fsutils
