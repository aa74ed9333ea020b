// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <elfpack/elf/builder.hpp>

namespace elfpack::tool {

// Raised for malformed command lines, before any output is created.
struct ArgumentError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A NAME=FILE argument: defines symbol NAME with the contents of FILE.
struct SymbolDefinition {
    std::string name;
    std::string path;
};

struct CommandLine {
    elf::HeaderConfig header;
    std::optional<std::string> sectionName;
    std::vector<SymbolDefinition> symbols;
    std::string output;
    bool verbose = false;
    bool help = false;
};

CommandLine parseCommandLine(int argc, const char *const *argv);

SymbolDefinition parseSymbolDefinition(std::string_view arg);
elf::ElfClass parseClass(std::string_view arg);
elf::ByteOrder parseEncoding(std::string_view arg);
uint16_t parseMachine(std::string_view arg);
uint32_t parseFlags(std::string_view arg);

void printUsage(std::ostream &os, const char *program);

} // namespace elfpack::tool
