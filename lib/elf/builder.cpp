// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <elf.h>
#include <elfpack/elf/builder.hpp>
#include <elfpack/elf/string-table.hpp>
#include <elfpack/elf/utils.hpp>

namespace {
    constexpr bool verbose = false;

    // Gaps between symbols are filled with spaces, never with zeros.
    constexpr uint8_t dataPadding = ' ';

    constexpr size_t copyChunkSize = 64 * 1024;

    uint64_t alignUp(uint64_t v, uint64_t n) {
        return (v + n - 1) / n * n;
    }
}

namespace elfpack::elf {

template<typename C, typename O>
struct BuilderImpl : Builder {
    BuilderImpl(const HeaderConfig &config, std::unique_ptr<util::OutputStream> out)
    : _config{config}, _out{std::move(out)}, _enc{_out.get()} { }

    void emitHeader();

    void setSectionName(const std::string &name) override;
    SymbolRecord addSymbol(std::string name, util::InputStream &source) override;
    SymbolRecord addAlignedSymbol(std::string name, size_t alignment,
            util::InputStream &source) override;
    std::unique_ptr<util::OutputStream> finalize() override;

private:
    struct Extent {
        uint64_t offset;
        uint64_t size;
    };

    // Runs f; any exception leaves the Builder unusable.
    template<typename F>
    auto _guarded(F f) {
        if (_finalized)
            throw std::logic_error("Builder was already finalized");
        if (_failed)
            throw std::logic_error("Builder cannot be used after a failed operation");
        try {
            return f();
        } catch (...) {
            _failed = true;
            throw;
        }
    }

    uint64_t _copyData(util::InputStream &source);
    Extent _emitStringTable(const StringTable &strtab);

    HeaderConfig _config;
    std::unique_ptr<util::OutputStream> _out;
    util::ByteEncoder<O> _enc;
    util::DeferredSlot *_shoffSlot = nullptr;

    // File offset of the data section.
    uint64_t _dataStart = 0;
    // End of the data section including padding that is not written yet.
    uint64_t _dataCursor = 0;
    // Number of data bytes (including padding) that were actually written.
    uint64_t _dataWritten = 0;

    std::vector<SymbolRecord> _symbols;
    std::vector<std::string> _symbolNames;
    SectionNameTable _sectionNames;

    bool _failed = false;
    bool _finalized = false;
};

template<typename C, typename O>
void BuilderImpl<C, O>::emitHeader() {
    _guarded([&] {
        auto headerStart = _enc.offset();

        // Write the EHDR.e_ident field.
        encode8(_enc, ELFMAG0);
        encodeChars(_enc, "ELF");
        encode8(_enc, C::identClass);
        encode8(_enc, static_cast<uint8_t>(_config.byteOrder));
        encode8(_enc, EV_CURRENT); // ELF version; so far, there is only one.
        encode8(_enc, ELFOSABI_NONE);
        _enc.skip(EI_NIDENT - EI_ABIVERSION); // ABI version and padding.

        // Write the remaining EHDR fields.
        encode16(_enc, ET_REL); // e_type
        encode16(_enc, _config.machine); // e_machine
        encode32(_enc, EV_CURRENT); // e_version
        C::encodeAddr(_enc, 0); // e_entry
        C::encodeOff(_enc, 0); // e_phoff
        _shoffSlot = _enc.template defer<typename C::Off>(0); // e_shoff
        encode32(_enc, _config.flags); // e_flags
        auto ehsizeSlot = _enc.template defer<uint16_t>(0); // e_ehsize
        encode16(_enc, 0); // e_phentsize
        encode16(_enc, 0); // e_phnum
        encode16(_enc, sizeof(typename C::Shdr)); // e_shentsize
        encode16(_enc, section_indices::count); // e_shnum
        encode16(_enc, section_indices::sectionNames); // e_shstrndx

        _enc.resolve(ehsizeSlot, static_cast<uint16_t>(_enc.offset() - headerStart));

        _enc.align(C::naturalAlignment);
        _dataStart = _enc.offset();
    });
}

template<typename C, typename O>
void BuilderImpl<C, O>::setSectionName(const std::string &name) {
    _guarded([&] {
        _sectionNames.setDataName(name);
    });
}

template<typename C, typename O>
SymbolRecord BuilderImpl<C, O>::addSymbol(std::string name, util::InputStream &source) {
    return addAlignedSymbol(std::move(name), C::naturalAlignment, source);
}

template<typename C, typename O>
SymbolRecord BuilderImpl<C, O>::addAlignedSymbol(std::string name, size_t alignment,
        util::InputStream &source) {
    return _guarded([&] {
        if (!alignment)
            alignment = 1;

        SymbolRecord record;
        record.alignment = alignment;
        record.dataOffset = alignUp(_dataCursor, alignment);

        // The previous symbol's trailing padding is only written now.
        _enc.pad(record.dataOffset - _dataWritten, dataPadding);
        record.rawSize = _copyData(source);
        _dataWritten = record.dataOffset + record.rawSize;

        record.paddedSize = (record.dataOffset - _dataCursor)
                + alignUp(record.rawSize, alignment);
        _dataCursor += record.paddedSize;

        if (verbose)
            std::cout << "Placing symbol " << name << " at data offset "
                    << (void *)record.dataOffset << ", size: " << (void *)record.rawSize
                    << ", padded size: " << (void *)record.paddedSize << std::endl;

        _symbols.push_back(record);
        _symbolNames.push_back(std::move(name));
        return record;
    });
}

template<typename C, typename O>
uint64_t BuilderImpl<C, O>::_copyData(util::InputStream &source) {
    std::vector<uint8_t> chunk(copyChunkSize);
    uint64_t size = 0;
    while (auto n = source.read(chunk.data(), chunk.size())) {
        encodeBytes(_enc, chunk.data(), n);
        size += n;
    }
    return size;
}

template<typename C, typename O>
auto BuilderImpl<C, O>::_emitStringTable(const StringTable &strtab) -> Extent {
    _enc.align(C::naturalAlignment);
    auto start = _enc.offset();
    encodeBytes(_enc, strtab.data(), strtab.size());
    return Extent{start, _enc.offset() - start};
}

template<typename C, typename O>
std::unique_ptr<util::OutputStream> BuilderImpl<C, O>::finalize() {
    _guarded([&] {
        // Complete the data section with the last symbol's trailing padding.
        _enc.pad(_dataCursor - _dataWritten, dataPadding);
        _dataWritten = _dataCursor;

        // .shstrtab must have index 1 since e_shstrndx refers to it.
        auto sectionNames = _emitStringTable(_sectionNames.table());

        StringTable strtab;
        std::vector<uint32_t> nameOffsets;
        nameOffsets.reserve(_symbolNames.size());
        for (auto &name : _symbolNames)
            nameOffsets.push_back(strtab.add(name));
        auto symbolNames = _emitStringTable(strtab);

        _enc.align(C::naturalAlignment);
        auto symbolsStart = _enc.offset();

        // Encode the null symbol. Specified in the ELF base specification.
        C::encodeSymbol(_enc, SymbolEntry{});

        // Encode all "real" symbols.
        uint64_t dataSize = 0;
        size_t dataAlignment = 1;
        for (size_t i = 0; i < _symbols.size(); i++) {
            auto &record = _symbols[i];

            SymbolEntry sym;
            sym.name = nameOffsets[i];
            sym.info = C::globalObjectInfo;
            sym.sectionIndex = section_indices::data;
            sym.value = record.dataOffset;
            sym.size = record.rawSize;
            C::encodeSymbol(_enc, sym);

            dataSize += record.paddedSize;
            dataAlignment = std::max(dataAlignment, record.alignment);
        }
        Extent symbols{symbolsStart, _enc.offset() - symbolsStart};
        assert(dataSize == _dataWritten);

        _enc.align(C::naturalAlignment);
        auto shdrsStart = _enc.offset();

        // Emit the SHN_UNDEF section. Specified in the ELF base specification.
        encodeSectionHeader<C>(_enc, SectionHeader{});

        SectionHeader shstrtab;
        shstrtab.name = _sectionNames.sectionNamesOffset();
        shstrtab.type = SHT_STRTAB;
        shstrtab.flags = SHF_STRINGS;
        shstrtab.offset = sectionNames.offset;
        shstrtab.size = sectionNames.size;
        shstrtab.entrySize = 1;
        encodeSectionHeader<C>(_enc, shstrtab);

        // The linker decides the final address of the data.
        SectionHeader data;
        data.name = _sectionNames.dataOffset();
        data.type = SHT_PROGBITS;
        data.flags = SHF_ALLOC;
        data.offset = _dataStart;
        data.size = dataSize;
        data.addressAlign = dataAlignment;
        encodeSectionHeader<C>(_enc, data);

        SectionHeader strtabHeader;
        strtabHeader.name = _sectionNames.symbolNamesOffset();
        strtabHeader.type = SHT_STRTAB;
        strtabHeader.flags = SHF_STRINGS;
        strtabHeader.offset = symbolNames.offset;
        strtabHeader.size = symbolNames.size;
        strtabHeader.entrySize = 1;
        encodeSectionHeader<C>(_enc, strtabHeader);

        SectionHeader symtab;
        symtab.name = _sectionNames.symbolsOffset();
        symtab.type = SHT_SYMTAB;
        symtab.offset = symbols.offset;
        symtab.size = symbols.size;
        symtab.link = section_indices::symbolNames;
        symtab.info = firstGlobalSymbol;
        symtab.entrySize = sizeof(typename C::Sym);
        encodeSectionHeader<C>(_enc, symtab);

        if (verbose)
            std::cout << "Section headers at " << (void *)shdrsStart
                    << ", data section size: " << (void *)dataSize
                    << ", alignment: " << dataAlignment << std::endl;

        // Now that the SHDRs are placed, e_shoff can be fixed up.
        _enc.resolve(_shoffSlot, static_cast<typename C::Off>(C::narrow(shdrsStart)));
        assert(!_enc.pendingSlots() && "Unresolved fields in ELF output");
    });

    _finalized = true;
    return std::move(_out);
}

namespace {
    template<typename C>
    std::unique_ptr<Builder> createForClass(const HeaderConfig &config,
            std::unique_ptr<util::OutputStream> out) {
        if (config.byteOrder == ByteOrder::msb) {
            auto builder = std::make_unique<BuilderImpl<C, util::BigEndian>>(config,
                    std::move(out));
            builder->emitHeader();
            return builder;
        }
        auto builder = std::make_unique<BuilderImpl<C, util::LittleEndian>>(config,
                std::move(out));
        builder->emitHeader();
        return builder;
    }
}

std::unique_ptr<Builder> Builder::create(const HeaderConfig &config,
        std::unique_ptr<util::OutputStream> out) {
    if (config.byteOrder != ByteOrder::lsb && config.byteOrder != ByteOrder::msb)
        throw std::invalid_argument("Unknown ELF data encoding");

    switch (config.elfClass) {
    case ElfClass::elf32:
        return createForClass<Elf32Class>(config, std::move(out));
    case ElfClass::elf64:
        return createForClass<Elf64Class>(config, std::move(out));
    }
    throw std::invalid_argument("Unknown ELF class");
}

} // namespace elfpack::elf
