// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <string>
#include <gtest/gtest.h>
#include <elfpack/elf/string-table.hpp>

namespace elfpack::elf {
namespace {

std::string contents(const StringTable &table) {
    return std::string(table.data(), table.size());
}

TEST(StringTableTest, StartsWithNull) {
    StringTable table;
    EXPECT_EQ(contents(table), std::string("\0", 1));
}

TEST(StringTableTest, OffsetsAreRunningLength) {
    StringTable table;
    EXPECT_EQ(table.add("alpha"), 1u);
    EXPECT_EQ(table.add(""), 7u);
    EXPECT_EQ(table.add("alpha"), 8u);
    EXPECT_EQ(contents(table), std::string("\0alpha\0\0alpha\0", 14));
}

TEST(SectionNameTableTest, DefaultCatalog) {
    SectionNameTable names;
    EXPECT_EQ(names.sectionNamesOffset(), 1u);
    EXPECT_EQ(names.symbolNamesOffset(), 11u);
    EXPECT_EQ(names.symbolsOffset(), 19u);
    EXPECT_EQ(names.dataOffset(), 27u);
    EXPECT_EQ(contents(names.table()),
            std::string("\0.shstrtab\0.strtab\0.symtab\0.rodata\0", 35));
}

TEST(SectionNameTableTest, RenamingOnlyTouchesTheDataName) {
    SectionNameTable names;
    names.setDataName(".a.much.longer.section.name");
    names.setDataName(".blob");
    EXPECT_EQ(names.sectionNamesOffset(), 1u);
    EXPECT_EQ(names.symbolNamesOffset(), 11u);
    EXPECT_EQ(names.symbolsOffset(), 19u);
    EXPECT_EQ(names.dataOffset(), 27u);
    EXPECT_EQ(contents(names.table()),
            std::string("\0.shstrtab\0.strtab\0.symtab\0.blob\0", 33));
}

} // namespace
} // namespace elfpack::elf
