// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <elf.h>
#include <elfpack/util/byte-encode.hpp>

namespace elfpack::elf {

// Raised when a value cannot be represented in the selected ELF class.
struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Sections are emitted in exactly this order; the indices are referenced from the
// ELF header (e_shstrndx), from every symbol (st_shndx) and from .symtab (sh_link).
namespace section_indices {
    enum : uint16_t {
        null,
        sectionNames,
        data,
        symbolNames,
        symbols,
        count
    };
}

// Symbol 0 is the null symbol; all symbols after it are global.
constexpr uint32_t firstGlobalSymbol = 1;

// Fields shared by the SHDR layouts of both classes.
struct SectionHeader {
    uint32_t name = 0;
    uint32_t type = SHT_NULL;
    uint64_t flags = 0;
    uint64_t address = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    uint32_t link = 0;
    uint32_t info = 0;
    uint64_t addressAlign = 0;
    uint64_t entrySize = 0;
};

// Fields shared by the SYM layouts of both classes.
struct SymbolEntry {
    uint32_t name = 0;
    uint8_t info = 0;
    uint8_t other = 0;
    uint16_t sectionIndex = SHN_UNDEF;
    uint64_t value = 0;
    uint64_t size = 0;
};

struct Elf32Class {
    using Ehdr = Elf32_Ehdr;
    using Shdr = Elf32_Shdr;
    using Sym = Elf32_Sym;
    using Off = Elf32_Off;

    static constexpr uint8_t identClass = ELFCLASS32;
    static constexpr uint8_t globalObjectInfo = ELF32_ST_INFO(STB_GLOBAL, STT_OBJECT);
    static constexpr size_t naturalAlignment = 4;

    template<typename E>
    static void encodeAddr(E &enc, uint64_t v) { encode32(enc, narrow(v)); }
    template<typename E>
    static void encodeOff(E &enc, uint64_t v) { encode32(enc, narrow(v)); }
    // ELF32 uses Elf32_Word wherever ELF64 uses Elf64_Xword.
    template<typename E>
    static void encodeXword(E &enc, uint64_t v) { encode32(enc, narrow(v)); }

    template<typename E>
    static void encodeSymbol(E &enc, const SymbolEntry &sym) {
        encode32(enc, sym.name); // st_name
        encodeAddr(enc, sym.value); // st_value
        encodeXword(enc, sym.size); // st_size
        encode8(enc, sym.info); // st_info
        encode8(enc, sym.other); // st_other
        encode16(enc, sym.sectionIndex); // st_shndx
    }

    static uint32_t narrow(uint64_t v) {
        if (v > std::numeric_limits<uint32_t>::max())
            throw FormatError("Value does not fit into an ELF32 file");
        return static_cast<uint32_t>(v);
    }
};

struct Elf64Class {
    using Ehdr = Elf64_Ehdr;
    using Shdr = Elf64_Shdr;
    using Sym = Elf64_Sym;
    using Off = Elf64_Off;

    static constexpr uint8_t identClass = ELFCLASS64;
    static constexpr uint8_t globalObjectInfo = ELF64_ST_INFO(STB_GLOBAL, STT_OBJECT);
    static constexpr size_t naturalAlignment = 8;

    template<typename E>
    static void encodeAddr(E &enc, uint64_t v) { encode64(enc, v); }
    template<typename E>
    static void encodeOff(E &enc, uint64_t v) { encode64(enc, v); }
    template<typename E>
    static void encodeXword(E &enc, uint64_t v) { encode64(enc, v); }

    template<typename E>
    static void encodeSymbol(E &enc, const SymbolEntry &sym) {
        encode32(enc, sym.name); // st_name
        encode8(enc, sym.info); // st_info
        encode8(enc, sym.other); // st_other
        encode16(enc, sym.sectionIndex); // st_shndx
        encodeAddr(enc, sym.value); // st_value
        encodeXword(enc, sym.size); // st_size
    }

    static uint64_t narrow(uint64_t v) {
        return v;
    }
};

template<typename C, typename E>
void encodeSectionHeader(E &enc, const SectionHeader &shdr) {
    encode32(enc, shdr.name); // sh_name
    encode32(enc, shdr.type); // sh_type
    C::encodeXword(enc, shdr.flags); // sh_flags
    C::encodeAddr(enc, shdr.address); // sh_addr
    C::encodeOff(enc, shdr.offset); // sh_offset
    C::encodeXword(enc, shdr.size); // sh_size
    encode32(enc, shdr.link); // sh_link
    encode32(enc, shdr.info); // sh_info
    C::encodeXword(enc, shdr.addressAlign); // sh_addralign
    C::encodeXword(enc, shdr.entrySize); // sh_entsize
}

} // namespace elfpack::elf
