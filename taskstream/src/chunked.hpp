#pragma once

#include "byte_source.hpp"
#include "config.hpp"
#include "netstr.hpp"
#include "object_codec.hpp"
#include "record_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/**
 * Wire layout of one chunk, all integers little-endian:
 *
 *   u8  marker      128 + writer version
 *   u8  compressed  0 or 1
 *   u32 crc32       over the uncompressed payload
 *   u64 length      payload bytes on the wire, 0 for the terminal chunk
 *   ... payload     objects back to back, deflated when compressed is 1
 */
constexpr std::size_t kChunkHeaderSize = 13;
constexpr std::uint8_t kChunkMarkerBase = 128;

/**
 * Decoder for the chunked record format.
 *
 * Constructed with the first byte of the stream, which the caller already
 * consumed. A byte below 128 means the stream is in the legacy key/value
 * framing: it is handed to a NetstrReader and chunk decoding never starts.
 *
 * Chunks are verified as a unit: decompression and checksum both succeed
 * before any object of the chunk is produced. With ignoreCorrupt a chunk that
 * fails either check is skipped; truncation and malformed headers always raise.
 */
class ChunkedReader final : public RecordReader {
public:
    ChunkedReader(ByteSource& source,
                  const InputMeta& meta,
                  std::uint8_t firstByte,
                  const ObjectCodec& codec,
                  const ReaderConfig& cfg = ReaderConfig());

    bool next(Object& out) override;

    bool isLegacy() const { return legacy_ != nullptr; }

private:
    void loadChunk();
    bool readMarker();

    ByteSource& source_;
    InputMeta meta_;
    const ObjectCodec& codec_;
    ReaderConfig cfg_;
    std::unique_ptr<NetstrRecordReader> legacy_;
    std::vector<std::uint8_t> payload_;
    std::size_t cursor_;
    std::uint64_t offset_;
    std::uint64_t payloadStart_;
    bool haveMarker_;
    bool inChunk_;
    bool done_;
};

/**
 * Encoder for the chunked record format.
 *
 * Objects are encoded into a buffer that becomes a chunk once it reaches
 * minChunkSize, or when flush() is called. close() must be called to emit the
 * remaining data and the terminal chunk.
 */
class ChunkedWriter final : public RecordWriter {
public:
    ChunkedWriter(ByteSink& sink, const ObjectCodec& codec, const WriterConfig& cfg = WriterConfig());

    /**
     * Appends the pair (key, value) as one object.
     */
    void add(const Object& key, const Object& value) override;
    void append(const Object& obj);
    void flush();
    void close() override;

    bool closed() const { return closed_; }

private:
    void writeChunk(const std::vector<std::uint8_t>& body, bool compressed, std::uint32_t checksum);

    ByteSink& sink_;
    const ObjectCodec& codec_;
    WriterConfig cfg_;
    std::vector<std::uint8_t> buffer_;
    bool closed_;
};
