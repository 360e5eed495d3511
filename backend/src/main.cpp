#include "cli/CommandLine.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    extronctl::cli::CommandLine cli(std::cout, std::cerr);
    return cli.run(args);
}
