#include "cli.hpp"
#include "tail.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
  return fsutils::run_tool("tail", "<file_name>", argc, argv, fsutils::tail::register_options,
                           [](const fsutils::argparser& args) {
                             if (args.has_option("--help")) {
                               fsutils::tail::print_help(std::cout, args.command());
                               return EXIT_SUCCESS;
                             }

                             return fsutils::tail::run(std::cout, args);
                           });
}
