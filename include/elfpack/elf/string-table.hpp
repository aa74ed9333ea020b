// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace elfpack::elf {

// Null-terminated strings referenced by byte offset.
// ELF uses index zero for non-existent strings, so the table starts with a null byte.
struct StringTable {
    StringTable()
    : _buffer(1, '\0') { }

    // Appends s and returns its offset within the table.
    uint32_t add(std::string_view s);

    // Drops everything from offset onwards. Offsets below it stay valid.
    void truncate(uint32_t offset);

    const char *data() const {
        return _buffer.data();
    }

    size_t size() const {
        return _buffer.size();
    }

private:
    std::string _buffer;
};

// The names of the sections that every file contains.
// The data section is named last so that renaming it leaves the other offsets intact.
struct SectionNameTable {
    static constexpr const char *defaultDataName = ".rodata";

    SectionNameTable();

    void setDataName(std::string_view name);

    uint32_t sectionNamesOffset() const { return _sectionNamesOffset; }
    uint32_t symbolNamesOffset() const { return _symbolNamesOffset; }
    uint32_t symbolsOffset() const { return _symbolsOffset; }
    uint32_t dataOffset() const { return _dataOffset; }

    const StringTable &table() const {
        return _table;
    }

private:
    StringTable _table;
    uint32_t _sectionNamesOffset;
    uint32_t _symbolNamesOffset;
    uint32_t _symbolsOffset;
    uint32_t _dataOffset;
};

} // namespace elfpack::elf
