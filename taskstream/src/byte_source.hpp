#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using std::vector;

/**
 * ByteSource models a finite, non-rewindable byte stream.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * Reads up to maxLen bytes into buffer.
     * Returns 0 on EOF. May return fewer bytes than available. Throws on I/O errors.
     */
    virtual size_t read(uint8_t* buffer, size_t maxLen) = 0;
};

/**
 * ByteSink models an append-only byte destination.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * Writes all len bytes. Throws on I/O errors.
     */
    virtual void write(const uint8_t* data, size_t len) = 0;
};

/**
 * In-memory ByteSource over an owned copy of the data.
 */
class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(vector<uint8_t> data) : data_(std::move(data)), offset_(0) {}
    explicit MemoryByteSource(const string& data) : data_(data.begin(), data.end()), offset_(0) {}

    size_t read(uint8_t* buffer, size_t maxLen) override;

    size_t size() const { return data_.size(); }

private:
    vector<uint8_t> data_;
    size_t offset_;
};

/**
 * ByteSource reading a local file in binary mode.
 */
class FileByteSource final : public ByteSource {
public:
    explicit FileByteSource(const string& path);

    size_t read(uint8_t* buffer, size_t maxLen) override;

private:
    string path_;
    ifstream in_;
};

/**
 * ByteSink collecting everything into a growable buffer.
 */
class MemoryByteSink final : public ByteSink {
public:
    void write(const uint8_t* data, size_t len) override;

    const vector<uint8_t>& data() const { return data_; }

private:
    vector<uint8_t> data_;
};

/**
 * ByteSink writing to a local file, truncating it on open.
 */
class FileByteSink final : public ByteSink {
public:
    explicit FileByteSink(const string& path);

    void write(const uint8_t* data, size_t len) override;

private:
    string path_;
    ofstream out_;
};

/**
 * Utility: reads from src until exactly n bytes were collected or EOF is hit.
 * Tolerates short reads. The returned buffer is shorter than n only at EOF.
 */
vector<uint8_t> readUpTo(ByteSource& src, size_t n);
