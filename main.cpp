#include <iostream>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return sourcemark::app::CommandLine::Run(args, std::cout, std::cerr);
}
