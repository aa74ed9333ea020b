// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <vector>
#include <elf.h>
#include <gtest/gtest.h>
#include <elfpack/tool/options.hpp>

namespace elfpack::tool {
namespace {

CommandLine parse(std::vector<const char *> args) {
    args.insert(args.begin(), "elfpack");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

TEST(OptionsTest, SymbolDefinitionSplitsAtFirstEquals) {
    auto def = parseSymbolDefinition("logo=images/a=b.png");
    EXPECT_EQ(def.name, "logo");
    EXPECT_EQ(def.path, "images/a=b.png");
    EXPECT_THROW(parseSymbolDefinition("logo.png"), ArgumentError);
}

TEST(OptionsTest, Class) {
    EXPECT_EQ(parseClass("elf32"), elf::ElfClass::elf32);
    EXPECT_EQ(parseClass("ELF64"), elf::ElfClass::elf64);
    EXPECT_THROW(parseClass("elf16"), ArgumentError);
}

TEST(OptionsTest, Encoding) {
    EXPECT_EQ(parseEncoding("le"), elf::ByteOrder::lsb);
    EXPECT_EQ(parseEncoding("LSB"), elf::ByteOrder::lsb);
    EXPECT_EQ(parseEncoding("BE"), elf::ByteOrder::msb);
    EXPECT_EQ(parseEncoding("msb"), elf::ByteOrder::msb);
    EXPECT_THROW(parseEncoding("middle"), ArgumentError);
}

TEST(OptionsTest, Machine) {
    EXPECT_EQ(parseMachine("none"), EM_NONE);
    EXPECT_EQ(parseMachine("x86_64"), EM_X86_64);
    EXPECT_EQ(parseMachine("arm"), EM_ARM);
    EXPECT_EQ(parseMachine("aarch64"), EM_AARCH64);
    EXPECT_EQ(parseMachine("riscv"), EM_RISCV);
    EXPECT_EQ(parseMachine("0x28"), 0x28);
    EXPECT_EQ(parseMachine("0xBEEF"), 0xBEEF);
    EXPECT_THROW(parseMachine("sparc"), ArgumentError);
    EXPECT_THROW(parseMachine("0x"), ArgumentError);
    EXPECT_THROW(parseMachine("0x12345"), ArgumentError);
    EXPECT_THROW(parseMachine("0xZZ"), ArgumentError);
}

TEST(OptionsTest, Flags) {
    EXPECT_EQ(parseFlags("0x00000000"), 0u);
    EXPECT_EQ(parseFlags("0x05000000"), 0x05000000u);
    EXPECT_THROW(parseFlags("5"), ArgumentError);
    EXPECT_THROW(parseFlags("0x123456789"), ArgumentError);
}

TEST(OptionsTest, Defaults) {
    auto cl = parse({"-o", "out.o"});
    EXPECT_EQ(cl.header.elfClass, elf::ElfClass::elf64);
    EXPECT_EQ(cl.header.byteOrder, elf::ByteOrder::lsb);
    EXPECT_EQ(cl.header.machine, EM_NONE);
    EXPECT_EQ(cl.header.flags, 0u);
    EXPECT_FALSE(cl.sectionName);
    EXPECT_TRUE(cl.symbols.empty());
    EXPECT_EQ(cl.output, "out.o");
}

TEST(OptionsTest, FullCommandLine) {
    auto cl = parse({"--class", "elf32", "--encoding=be", "--machine", "arm",
            "--flags=0x05000000", "--section-name", ".assets", "--verbose",
            "a=first.bin", "--output", "out.o", "b=second.bin"});
    EXPECT_EQ(cl.header.elfClass, elf::ElfClass::elf32);
    EXPECT_EQ(cl.header.byteOrder, elf::ByteOrder::msb);
    EXPECT_EQ(cl.header.machine, EM_ARM);
    EXPECT_EQ(cl.header.flags, 0x05000000u);
    EXPECT_EQ(cl.sectionName, ".assets");
    EXPECT_TRUE(cl.verbose);
    EXPECT_EQ(cl.output, "out.o");
    ASSERT_EQ(cl.symbols.size(), 2u);
    EXPECT_EQ(cl.symbols[0].name, "a");
    EXPECT_EQ(cl.symbols[0].path, "first.bin");
    EXPECT_EQ(cl.symbols[1].name, "b");
    EXPECT_EQ(cl.symbols[1].path, "second.bin");
}

TEST(OptionsTest, Errors) {
    EXPECT_THROW(parse({"a=b"}), ArgumentError);
    EXPECT_THROW(parse({"-o"}), ArgumentError);
    EXPECT_THROW(parse({"-o", "out.o", "--bogus"}), ArgumentError);
    EXPECT_THROW(parse({"-o", "out.o", "nofile"}), ArgumentError);
    EXPECT_TRUE(parse({"--help"}).help);
}

} // namespace
} // namespace elfpack::tool
