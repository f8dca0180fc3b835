#include <iostream>
#include "cli.hpp"

int main(int argc, char* argv[])
{
    try {
        return ulid::cli::run(argc, argv, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
