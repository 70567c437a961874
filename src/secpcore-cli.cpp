// SECPCORE CLI - Command Line Interface
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/cli/app.h"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        return secpcore::cli::Run(argc, argv, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return secpcore::cli::EXIT_USAGE;
    }
}
