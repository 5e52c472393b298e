#include "cli/run.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return uf2pack::run(argc, argv, std::cout, std::cerr);
}
