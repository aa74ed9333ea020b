// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>
#include <frg/list.hpp>
#include <elfpack/util/streams.hpp>

namespace elfpack::util {

struct LittleEndian {
    template<typename T>
    static void store(uint8_t *p, T v) {
        for (size_t i = 0; i < sizeof(T); i++)
            p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
};

struct BigEndian {
    template<typename T>
    static void store(uint8_t *p, T v) {
        for (size_t i = 0; i < sizeof(T); i++)
            p[sizeof(T) - 1 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
};

// A placeholder in the output that must be overwritten once its value is known.
struct DeferredSlot {
    template<typename Order>
    friend struct ByteEncoder;

    DeferredSlot(uint64_t position_, size_t width_)
    : position{position_}, width{width_} { }

    DeferredSlot(const DeferredSlot &) = delete;

    DeferredSlot &operator= (const DeferredSlot &) = delete;

    const uint64_t position;
    const size_t width;

    bool isResolved() const {
        return _resolved;
    }

private:
    bool _resolved = false;
    frg::default_list_hook<DeferredSlot> _pendingHook;
};

// Writes integers in the byte order given by Order to an OutputStream.
template<typename Order>
struct ByteEncoder {
    ByteEncoder(OutputStream *out)
    : _out{out} { }

    ByteEncoder(const ByteEncoder &) = delete;

    ByteEncoder &operator= (const ByteEncoder &) = delete;

private:
    template<typename T>
    void _poke(T v) {
        uint8_t bytes[sizeof(T)];
        Order::store(bytes, v);
        _out->write(bytes, sizeof(T));
    }

public:
    uint64_t offset() {
        return _out->position();
    }

    friend void encodeChars(ByteEncoder &e, const char *v) {
        while (*v)
            e._poke<uint8_t>(*(v++));
    }
    friend void encodeBytes(ByteEncoder &e, const void *p, size_t n) { e._out->write(p, n); }
    friend void encode8(ByteEncoder &e, uint8_t v) { e._poke<uint8_t>(v); }
    friend void encode16(ByteEncoder &e, uint16_t v) { e._poke<uint16_t>(v); }
    friend void encode32(ByteEncoder &e, uint32_t v) { e._poke<uint32_t>(v); }
    friend void encode64(ByteEncoder &e, uint64_t v) { e._poke<uint64_t>(v); }

    // Writes count copies of fill.
    void pad(size_t count, uint8_t fill) {
        std::vector<uint8_t> chunk(count, fill);
        _out->write(chunk.data(), chunk.size());
    }

    // Pads with fill up to the next multiple of n. Returns the number of bytes added.
    size_t align(size_t n, uint8_t fill = 0) {
        assert(n);
        size_t misalignment = offset() % n;
        if (!misalignment)
            return 0;
        pad(n - misalignment, fill);
        return n - misalignment;
    }

    void skip(size_t n) {
        pad(n, 0);
    }

    // Writes placeholder and returns a slot that must later be passed to resolve().
    template<typename T>
    DeferredSlot *defer(T placeholder) {
        auto slot = std::make_unique<DeferredSlot>(offset(), sizeof(T));
        _poke<T>(placeholder);

        auto ptr = slot.get();
        _pending.push_back(ptr);
        _slots.push_back(std::move(slot));
        return ptr;
    }

    // Overwrites the slot's placeholder with v. The cursor is restored afterwards.
    template<typename T>
    void resolve(DeferredSlot *slot, T v) {
        assert(!slot->_resolved && "DeferredSlot was already resolved");
        assert(slot->width == sizeof(T) && "DeferredSlot resolved with mismatching width");

        auto cursor = offset();
        _out->seek(slot->position);
        _poke<T>(v);
        _out->seek(cursor);

        _pending.erase(_pending.iterator_to(slot));
        slot->_resolved = true;
    }

    size_t pendingSlots() {
        size_t n = 0;
        for (auto it = _pending.begin(); it != _pending.end(); ++it)
            n++;
        return n;
    }

private:
    OutputStream *_out;
    std::vector<std::unique_ptr<DeferredSlot>> _slots;
    frg::intrusive_list<
        DeferredSlot,
        frg::locate_member<
            DeferredSlot,
            frg::default_list_hook<DeferredSlot>,
            &DeferredSlot::_pendingHook
        >
    > _pending;
};

} // namespace elfpack::util
