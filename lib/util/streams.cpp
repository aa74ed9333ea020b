// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <elfpack/util/streams.hpp>

namespace elfpack::util {

namespace {
    [[noreturn]] void throwIoError(const char *what, const std::string &path) {
        throw IoError{std::string{what} + " " + path + ": " + strerror(errno)};
    }
}

// --------------------------------------------------------------------------------------
// BufferOutputStream class
// --------------------------------------------------------------------------------------

void BufferOutputStream::write(const void *data, size_t size) {
    auto bytes = static_cast<const uint8_t *>(data);
    size_t overlap = std::min(size, buffer.size() - _cursor);
    if (overlap)
        memcpy(buffer.data() + _cursor, bytes, overlap);
    buffer.insert(buffer.end(), bytes + overlap, bytes + size);
    _cursor += size;
}

void BufferOutputStream::seek(uint64_t position) {
    // Seeking past the end zero-fills, which is what a file does as well.
    if (position > buffer.size())
        buffer.resize(position, 0);
    _cursor = position;
}

uint64_t BufferOutputStream::position() {
    return _cursor;
}

// --------------------------------------------------------------------------------------
// FileOutputStream class
// --------------------------------------------------------------------------------------

std::unique_ptr<FileOutputStream> FileOutputStream::create(const std::string &path) {
    FILE *file;
    if (!(file = fopen(path.c_str(), "wb")))
        throwIoError("Could not create", path);
    return std::make_unique<FileOutputStream>(file, path);
}

FileOutputStream::FileOutputStream(FILE *file, std::string path)
: _file{file}, _path{std::move(path)} { }

FileOutputStream::~FileOutputStream() {
    // Errors are only observable through close(); this is the unwinding path.
    if (_file)
        fclose(_file);
}

void FileOutputStream::write(const void *data, size_t size) {
    if (!size)
        return;
    if (fwrite(data, 1, size, _file) != size)
        throwIoError("Could not write to", _path);
}

void FileOutputStream::seek(uint64_t position) {
    if (fseeko(_file, static_cast<off_t>(position), SEEK_SET))
        throwIoError("Could not seek in", _path);
}

uint64_t FileOutputStream::position() {
    auto offset = ftello(_file);
    if (offset < 0)
        throwIoError("Could not query position in", _path);
    return offset;
}

void FileOutputStream::sync() {
    if (fflush(_file))
        throwIoError("Could not flush", _path);
    if (fsync(fileno(_file)))
        throwIoError("Could not sync", _path);
}

void FileOutputStream::close() {
    auto file = _file;
    _file = nullptr;
    if (file && fclose(file))
        throwIoError("Could not close", _path);
}

// --------------------------------------------------------------------------------------
// MemoryInputStream class
// --------------------------------------------------------------------------------------

size_t MemoryInputStream::read(void *buffer, size_t size) {
    size_t n = std::min(size, _size - _consumed);
    if (!n)
        return 0;
    memcpy(buffer, _data + _consumed, n);
    _consumed += n;
    return n;
}

// --------------------------------------------------------------------------------------
// FileInputStream class
// --------------------------------------------------------------------------------------

std::unique_ptr<FileInputStream> FileInputStream::open(const std::string &path) {
    FILE *file;
    if (!(file = fopen(path.c_str(), "rb")))
        throwIoError("Could not open", path);
    return std::make_unique<FileInputStream>(file, path);
}

FileInputStream::FileInputStream(FILE *file, std::string path)
: _file{file}, _path{std::move(path)} { }

FileInputStream::~FileInputStream() {
    fclose(_file);
}

size_t FileInputStream::read(void *buffer, size_t size) {
    auto n = fread(buffer, 1, size, _file);
    if (n < size && ferror(_file))
        throwIoError("Could not read from", _path);
    return n;
}

} // namespace elfpack::util
