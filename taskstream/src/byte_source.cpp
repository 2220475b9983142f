#include "byte_source.hpp"

#include <array>
#include <cstring>
#include <stdexcept>

using namespace std;
using std::array;
using std::vector;

size_t MemoryByteSource::read(uint8_t* buffer, size_t maxLen) {
    if (offset_ >= data_.size() || maxLen == 0) {
        return 0;
    }
    size_t remaining = data_.size() - offset_;
    size_t toCopy = remaining < maxLen ? remaining : maxLen;
    memcpy(buffer, data_.data() + offset_, toCopy);
    offset_ += toCopy;
    return toCopy;
}

FileByteSource::FileByteSource(const string& path) : path_(path), in_(path.c_str(), ios::binary) {
    if (!in_) {
        throw runtime_error("failed to open " + path);
    }
}

size_t FileByteSource::read(uint8_t* buffer, size_t maxLen) {
    if (maxLen == 0 || in_.eof()) {
        return 0;
    }
    in_.read(reinterpret_cast<char*>(buffer), static_cast<streamsize>(maxLen));
    if (in_.bad()) {
        throw runtime_error("failed to read " + path_);
    }
    return static_cast<size_t>(in_.gcount());
}

void MemoryByteSink::write(const uint8_t* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

FileByteSink::FileByteSink(const string& path) : path_(path), out_(path.c_str(), ios::binary | ios::trunc) {
    if (!out_) {
        throw runtime_error("failed to create " + path);
    }
}

void FileByteSink::write(const uint8_t* data, size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<streamsize>(len));
    if (!out_) {
        throw runtime_error("failed to write " + path_);
    }
}

/**
 * Utility: collects up to n bytes from a ByteSource that may return short reads.
 */
vector<uint8_t> readUpTo(ByteSource& src, size_t n) {
    vector<uint8_t> data;
    const size_t initialReserve = n < (64 * 1024) ? n : (64 * 1024);
    if (initialReserve > 0) {
        data.reserve(initialReserve);
    }
    array<uint8_t, 64 * 1024> scratch{};
    size_t total = 0;
    while (total < n) {
        size_t want = n - total < scratch.size() ? n - total : scratch.size();
        size_t readCount = src.read(scratch.data(), want);
        if (readCount == 0)
            break;
        total += readCount;
        data.insert(data.end(), scratch.begin(), scratch.begin() + readCount);
    }
    return data;
}
