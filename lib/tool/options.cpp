// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <charconv>
#include <ostream>
#include <elf.h>
#include <elfpack/tool/options.hpp>

namespace elfpack::tool {

namespace {
    struct MachineKeyword {
        const char *keyword;
        uint16_t machine;
    };

    constexpr MachineKeyword machineKeywords[] = {
        {"none", EM_NONE},
        {"386", EM_386},
        {"x86", EM_386},
        {"68k", EM_68K},
        {"arm", EM_ARM},
        {"amd64", EM_X86_64},
        {"x64", EM_X86_64},
        {"x86_64", EM_X86_64},
        {"avr", EM_AVR},
        {"aarch64", EM_AARCH64},
        {"riscv", EM_RISCV},
    };

    // Parses "0x" followed by 1 to sizeof(T) * 2 hex digits.
    template<typename T>
    std::optional<T> parseHex(std::string_view arg) {
        if (arg.substr(0, 2) != "0x")
            return std::nullopt;
        auto digits = arg.substr(2);
        if (digits.empty() || digits.size() > sizeof(T) * 2)
            return std::nullopt;

        T v = 0;
        auto end = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(digits.data(), end, v, 16);
        if (ec != std::errc{} || ptr != end)
            return std::nullopt;
        return v;
    }
}

SymbolDefinition parseSymbolDefinition(std::string_view arg) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos)
        throw ArgumentError("symbol definition must be NAME=FILENAME");
    return SymbolDefinition{std::string{arg.substr(0, eq)}, std::string{arg.substr(eq + 1)}};
}

elf::ElfClass parseClass(std::string_view arg) {
    if (arg == "elf32" || arg == "ELF32")
        return elf::ElfClass::elf32;
    if (arg == "elf64" || arg == "ELF64")
        return elf::ElfClass::elf64;
    throw ArgumentError("class must be either ELF32 or ELF64");
}

elf::ByteOrder parseEncoding(std::string_view arg) {
    if (arg == "LSB" || arg == "lsb" || arg == "LE" || arg == "le")
        return elf::ByteOrder::lsb;
    if (arg == "MSB" || arg == "msb" || arg == "BE" || arg == "be")
        return elf::ByteOrder::msb;
    throw ArgumentError("encoding must be either LSB or MSB");
}

uint16_t parseMachine(std::string_view arg) {
    for (auto &entry : machineKeywords) {
        if (arg == entry.keyword)
            return entry.machine;
    }

    if (arg.substr(0, 2) != "0x")
        throw ArgumentError("machine must either be a hex value (with 0x prefix),"
                " or an architecture keyword");
    if (auto v = parseHex<uint16_t>(arg); v)
        return *v;
    throw ArgumentError("0x must be followed by up to four hex digits"
            " representing an ELF machine id");
}

uint32_t parseFlags(std::string_view arg) {
    if (arg.substr(0, 2) != "0x")
        throw ArgumentError("flags must be a hex value with 0x prefix");
    if (auto v = parseHex<uint32_t>(arg); v)
        return *v;
    throw ArgumentError("0x must be followed by up to eight hex digits representing ELF flags");
}

CommandLine parseCommandLine(int argc, const char *const *argv) {
    CommandLine cl;
    bool haveOutput = false;

    int i = 1;
    while (i < argc) {
        std::string_view arg = argv[i++];

        // Splits "--opt=value"; otherwise the value is the next argument.
        std::optional<std::string_view> inlineValue;
        if (arg.substr(0, 2) == "--") {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }
        auto value = [&] () -> std::string_view {
            if (inlineValue)
                return *inlineValue;
            if (i >= argc)
                throw ArgumentError(std::string{arg} + " requires a value");
            return argv[i++];
        };

        if (arg == "-h" || arg == "--help") {
            cl.help = true;
        } else if (arg == "--verbose") {
            cl.verbose = true;
        } else if (arg == "--class") {
            cl.header.elfClass = parseClass(value());
        } else if (arg == "--encoding") {
            cl.header.byteOrder = parseEncoding(value());
        } else if (arg == "--machine") {
            cl.header.machine = parseMachine(value());
        } else if (arg == "--flags") {
            cl.header.flags = parseFlags(value());
        } else if (arg == "--section-name") {
            cl.sectionName = std::string{value()};
        } else if (arg == "-o" || arg == "--output") {
            cl.output = std::string{value()};
            haveOutput = true;
        } else if (arg == "--") {
            while (i < argc)
                cl.symbols.push_back(parseSymbolDefinition(argv[i++]));
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ArgumentError("unknown option " + std::string{arg});
        } else {
            cl.symbols.push_back(parseSymbolDefinition(arg));
        }
    }

    if (!cl.help && !haveOutput)
        throw ArgumentError("an output file must be given with -o");
    return cl;
}

void printUsage(std::ostream &os, const char *program) {
    os << "Usage: " << program << " [options] -o OUTPUT [NAME=FILE]...\n"
        << "Creates an ELF object file whose symbols contain the given files.\n"
        << "\n"
        << "  --class CLASS        ELF32 or ELF64 (default: ELF64)\n"
        << "  --encoding ENC       LSB or MSB (default: LSB)\n"
        << "  --machine MACHINE    keyword or 0x-prefixed id (default: none)\n"
        << "  --flags FLAGS        0x-prefixed machine flags (default: 0x00000000)\n"
        << "  --section-name NAME  name of the data section (default: .rodata)\n"
        << "  -o, --output FILE    output file\n"
        << "  --verbose            print the placement of each symbol\n"
        << "  -h, --help           show this help\n";
}

} // namespace elfpack::tool
