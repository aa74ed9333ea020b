// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <iostream>
#include <elfpack/tool/run.hpp>

int main(int argc, char *argv[]) {
    return elfpack::tool::run(argc, argv, std::cout, std::cerr);
}
