#include "flatcfg/Cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return flatcfg::run_cli(argc, argv, std::cout, std::cerr);
}
