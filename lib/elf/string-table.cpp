// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <cassert>
#include <elfpack/elf/string-table.hpp>

namespace elfpack::elf {

// --------------------------------------------------------------------------------------
// StringTable class
// --------------------------------------------------------------------------------------

uint32_t StringTable::add(std::string_view s) {
    auto offset = static_cast<uint32_t>(_buffer.size());
    _buffer.append(s.data(), s.size());
    _buffer.push_back('\0');
    return offset;
}

void StringTable::truncate(uint32_t offset) {
    assert(offset >= 1 && offset <= _buffer.size());
    _buffer.resize(offset);
}

// --------------------------------------------------------------------------------------
// SectionNameTable class
// --------------------------------------------------------------------------------------

SectionNameTable::SectionNameTable() {
    _sectionNamesOffset = _table.add(".shstrtab");
    _symbolNamesOffset = _table.add(".strtab");
    _symbolsOffset = _table.add(".symtab");
    _dataOffset = _table.add(defaultDataName);
}

void SectionNameTable::setDataName(std::string_view name) {
    _table.truncate(_dataOffset);
    _table.add(name);
}

} // namespace elfpack::elf
