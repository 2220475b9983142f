#pragma once

#include "byte_source.hpp"
#include "config.hpp"
#include "record_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Decoder for the legacy key/value framing.
 *
 * Each record is two fields, key then value, and each field is
 *   <ascii decimal length> <space> <bytes> <one delimiter byte>
 * Decoding stops when the declared size has been consumed, or at end of input
 * on a record boundary when no size was declared. The delimiter after a value
 * may be absent when the value ends the input or is directly followed by the
 * next length prefix.
 */
class NetstrReader {
public:
    /**
     * head holds bytes already taken from source by the caller; they count
     * toward the declared size. readSize is the refill block for length prefixes.
     */
    NetstrReader(ByteSource& source,
                 const InputMeta& meta,
                 std::string head = std::string(),
                 std::size_t readSize = 8192);

    bool next(std::string& key, std::string& value);

    std::uint64_t consumed() const { return consumed_; }

private:
    std::string readField();
    bool ensure(std::size_t n, std::size_t readSize);

    ByteSource& source_;
    InputMeta meta_;
    std::string buffer_;
    std::vector<std::uint8_t> scratch_;
    std::size_t readSize_;
    std::size_t idx_;
    std::uint64_t totalRead_;
    std::uint64_t consumed_;
    bool exhausted_;
};

/**
 * Exposes a NetstrReader as a RecordReader of (Bytes, Bytes) pairs.
 */
class NetstrRecordReader final : public RecordReader {
public:
    NetstrRecordReader(ByteSource& source,
                       const InputMeta& meta,
                       std::string head = std::string(),
                       std::size_t readSize = 8192);

    bool next(Object& out) override;

private:
    NetstrReader reader_;
    std::string key_;
    std::string value_;
};

/**
 * Writes records in the legacy framing using the textual form of key and value.
 */
class NetstrWriter final : public RecordWriter {
public:
    explicit NetstrWriter(ByteSink& sink) : sink_(sink) {}

    void add(const Object& key, const Object& value) override;
    void close() override {}

private:
    ByteSink& sink_;
};

/**
 * Writes "<len(key)> <key> <len(value)> <value>\n" to sink.
 */
void writeNetstr(ByteSink& sink, const std::string& key, const std::string& value);
