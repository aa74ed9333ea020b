// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <elf.h>
#include <elfpack/util/streams.hpp>

namespace elfpack::elf {

enum class ElfClass : uint8_t {
    elf32 = ELFCLASS32,
    elf64 = ELFCLASS64
};

enum class ByteOrder : uint8_t {
    lsb = ELFDATA2LSB,
    msb = ELFDATA2MSB
};

// Selects the ELF variant. Fixed for the lifetime of a Builder.
struct HeaderConfig {
    ElfClass elfClass = ElfClass::elf64;
    ByteOrder byteOrder = ByteOrder::lsb;
    uint16_t machine = EM_NONE;
    uint32_t flags = 0;
};

// Placement of one symbol's data. dataOffset is relative to the start of the data section.
struct SymbolRecord {
    uint64_t dataOffset = 0;
    uint64_t rawSize = 0;
    uint64_t paddedSize = 0;
    size_t alignment = 1;

    bool operator== (const SymbolRecord &other) const {
        return dataOffset == other.dataOffset && rawSize == other.rawSize
                && paddedSize == other.paddedSize && alignment == other.alignment;
    }
    bool operator!= (const SymbolRecord &other) const { return !(*this == other); }
};

// Incrementally writes a relocatable ELF object whose symbols refer to arbitrary data.
//
// create() writes the ELF header, each addSymbol() call appends the symbol's data
// and finalize() writes the string tables, the symbol table and the section headers.
// Without finalize() the output contains the data but no metadata to find it.
//
// Once any call has thrown, the Builder must not be used again.
struct Builder {
    static std::unique_ptr<Builder> create(const HeaderConfig &config,
            std::unique_ptr<util::OutputStream> out);

    virtual ~Builder() = default;

    // Names the data section (".rodata" by default).
    virtual void setSectionName(const std::string &name) = 0;

    // Copies source to completion into the data section, aligned to the class' word size.
    // Symbol names are not checked for duplicates; the linker decides what to make of them.
    virtual SymbolRecord addSymbol(std::string name, util::InputStream &source) = 0;

    // Like addSymbol() but aligns the data to the given alignment.
    virtual SymbolRecord addAlignedSymbol(std::string name, size_t alignment,
            util::InputStream &source) = 0;

    // Writes the ELF metadata and hands back the output stream.
    virtual std::unique_ptr<util::OutputStream> finalize() = 0;
};

} // namespace elfpack::elf
