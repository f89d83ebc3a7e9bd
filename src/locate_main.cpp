#include "cli.hpp"
#include "locate.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
  return fsutils::run_tool("locate", "<search_term>", argc, argv, fsutils::locate::register_options,
                           [](const fsutils::argparser& args) {
                             if (args.has_option("--help")) {
                               fsutils::locate::print_help(std::cout, args.command());
                               return EXIT_SUCCESS;
                             }

                             fsutils::locate::options opts = fsutils::locate::parse_options(args);
                             return fsutils::locate::run(std::cout, fsutils::locate::search_term(args), opts);
                           });
}
