#include "cli.hpp"
#include "touch.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
  return fsutils::run_tool("touch", "<file_name>", argc, argv, fsutils::touch::register_options,
                           [](const fsutils::argparser& args) {
                             if (args.has_option("--help")) {
                               fsutils::touch::print_help(std::cout, args.command());
                               return EXIT_SUCCESS;
                             }

                             fsutils::touch::options opts = fsutils::touch::parse_options(args);
                             return fsutils::touch::run(fsutils::touch::targets(args), opts);
                           });
}
