// Copyright the elfpack authors (AUTHORS.md) 2026
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace elfpack::util {

// Raised for every failure to open, read, write, seek or sync a stream.
struct IoError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Seekable byte sink. Writes happen at position() and advance it.
struct OutputStream {
    virtual ~OutputStream() = default;

    virtual void write(const void *data, size_t size) = 0;
    virtual void seek(uint64_t position) = 0;
    virtual uint64_t position() = 0;

    // Pushes written data to stable storage (if there is any).
    virtual void sync() { }
};

// Sequential byte source. read() returns zero once the source is exhausted.
struct InputStream {
    virtual ~InputStream() = default;

    virtual size_t read(void *buffer, size_t size) = 0;
};

struct BufferOutputStream : OutputStream {
    void write(const void *data, size_t size) override;
    void seek(uint64_t position) override;
    uint64_t position() override;

    std::vector<uint8_t> buffer;

private:
    size_t _cursor = 0;
};

struct FileOutputStream : OutputStream {
    static std::unique_ptr<FileOutputStream> create(const std::string &path);

    FileOutputStream(FILE *file, std::string path);

    FileOutputStream(const FileOutputStream &) = delete;

    ~FileOutputStream() override;

    FileOutputStream &operator= (const FileOutputStream &) = delete;

    void write(const void *data, size_t size) override;
    void seek(uint64_t position) override;
    uint64_t position() override;
    void sync() override;

    // Closes the file and reports errors that are deferred until fclose().
    void close();

private:
    FILE *_file;
    std::string _path;
};

struct MemoryInputStream : InputStream {
    MemoryInputStream(const void *data, size_t size)
    : _data{static_cast<const uint8_t *>(data)}, _size{size} { }

    // Only refers to s, which must outlive the stream.
    explicit MemoryInputStream(const std::string &s)
    : MemoryInputStream{s.data(), s.size()} { }

    explicit MemoryInputStream(std::string &&) = delete;

    size_t read(void *buffer, size_t size) override;

private:
    const uint8_t *_data;
    size_t _size;
    size_t _consumed = 0;
};

struct FileInputStream : InputStream {
    static std::unique_ptr<FileInputStream> open(const std::string &path);

    FileInputStream(FILE *file, std::string path);

    FileInputStream(const FileInputStream &) = delete;

    ~FileInputStream() override;

    FileInputStream &operator= (const FileInputStream &) = delete;

    size_t read(void *buffer, size_t size) override;

private:
    FILE *_file;
    std::string _path;
};

} // namespace elfpack::util
