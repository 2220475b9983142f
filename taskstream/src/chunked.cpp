#include "chunked.hpp"

#include "data_error.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <climits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std;

namespace {

uint32_t crc32Of(const vector<uint8_t>& data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    size_t done = 0;
    while (done < data.size()) {
        uInt block = static_cast<uInt>(min<size_t>(data.size() - done, UINT_MAX));
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data() + done), block);
        done += block;
    }
    return static_cast<uint32_t>(crc);
}

/**
 * Owns an inflate stream for the duration of one chunk.
 */
struct InflateStream {
    z_stream zs{};
    bool ready = false;

    InflateStream() { ready = ::inflateInit(&zs) == Z_OK; }
    ~InflateStream() {
        if (ready) {
            ::inflateEnd(&zs);
        }
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

/**
 * Inflates a zlib stream of unknown uncompressed size.
 * Returns false and fills error when the data is not a complete zlib stream.
 */
bool inflatePayload(const vector<uint8_t>& in, vector<uint8_t>& out, string& error) {
    if (in.size() > UINT_MAX) {
        error = "compressed chunk too large";
        return false;
    }
    InflateStream stream;
    if (!stream.ready) {
        error = "inflateInit failed";
        return false;
    }
    stream.zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    stream.zs.avail_in = static_cast<uInt>(in.size());

    array<uint8_t, 64 * 1024> scratch{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.zs.next_out = scratch.data();
        stream.zs.avail_out = static_cast<uInt>(scratch.size());
        rc = ::inflate(&stream.zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            error = stream.zs.msg != nullptr ? stream.zs.msg : "inflate failed";
            return false;
        }
        size_t produced = scratch.size() - stream.zs.avail_out;
        out.insert(out.end(), scratch.begin(), scratch.begin() + produced);
        if (rc == Z_OK && stream.zs.avail_in == 0 && produced == 0) {
            error = "incomplete or truncated stream";
            return false;
        }
    }
    return true;
}

vector<uint8_t> deflatePayload(const vector<uint8_t>& in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    vector<uint8_t> out(bound);
    uLongf outLen = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &outLen,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) {
        throw runtime_error("zlib compress2 failed with code " + to_string(rc));
    }
    out.resize(static_cast<size_t>(outLen));
    return out;
}

uint32_t loadU32(const vector<uint8_t>& data, size_t at) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[at + i]) << (i * 8);
    }
    return value;
}

uint64_t loadU64(const vector<uint8_t>& data, size_t at) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[at + i]) << (i * 8);
    }
    return value;
}

void storeLE(vector<uint8_t>& out, uint64_t value, int width) {
    for (int i = 0; i < width; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

} // namespace

// --------------- DECODE ---------------

ChunkedReader::ChunkedReader(ByteSource& source,
                             const InputMeta& meta,
                             uint8_t firstByte,
                             const ObjectCodec& codec,
                             const ReaderConfig& cfg)
    : source_(source),
      meta_(meta),
      codec_(codec),
      cfg_(cfg),
      cursor_(0),
      offset_(1),
      payloadStart_(0),
      haveMarker_(true),
      inChunk_(false),
      done_(false) {
    if (firstByte < kChunkMarkerBase) {
        spdlog::debug("{}: legacy key/value stream", meta_.url);
        legacy_ = make_unique<NetstrRecordReader>(source_, meta_, string(1, static_cast<char>(firstByte)),
                                                   cfg_.readBufferSize);
    } else {
        spdlog::debug("{}: chunked stream, version {}", meta_.url, firstByte - kChunkMarkerBase);
    }
}

bool ChunkedReader::next(Object& out) {
    if (legacy_) {
        return legacy_->next(out);
    }
    while (!done_) {
        if (inChunk_) {
            try {
                if (codec_.decodeNext(payload_, cursor_, out)) {
                    return true;
                }
            } catch (const ObjectCodecError& e) {
                throw DataError(DataErrorKind::Corrupted, meta_.url, payloadStart_,
                                string("undecodable object in chunk: ") + e.what());
            }
            inChunk_ = false;
            payload_.clear();
            cursor_ = 0;
        }
        loadChunk();
    }
    return false;
}

/**
 * Consumes the marker byte of the next chunk. Returns false at end of input.
 */
bool ChunkedReader::readMarker() {
    if (meta_.hasSize && offset_ >= meta_.size) {
        return false;
    }
    vector<uint8_t> marker = readUpTo(source_, 1);
    if (marker.empty()) {
        return false;
    }
    if (marker[0] < kChunkMarkerBase) {
        throw DataError(DataErrorKind::Corrupted, meta_.url, offset_,
                        "malformed chunk header: marker byte " + to_string(marker[0]));
    }
    ++offset_;
    return true;
}

/**
 * Reads, verifies and stages the next chunk, or marks the stream finished.
 */
void ChunkedReader::loadChunk() {
    if (!haveMarker_ && !readMarker()) {
        spdlog::warn("{}: stream ended at {} bytes without a terminal chunk", meta_.url, offset_);
        done_ = true;
        return;
    }
    haveMarker_ = false;

    if (meta_.hasSize && meta_.size - min(offset_, meta_.size) < kChunkHeaderSize) {
        throw DataError(DataErrorKind::Truncated, meta_.url, offset_, "chunk header runs past the declared size");
    }
    vector<uint8_t> header = readUpTo(source_, kChunkHeaderSize);
    if (header.size() < kChunkHeaderSize) {
        throw DataError(DataErrorKind::Truncated, meta_.url, offset_,
                        "chunk header cut short after " + to_string(header.size()) + " bytes");
    }
    uint8_t isCompressed = header[0];
    uint32_t checksum = loadU32(header, 1);
    uint64_t length = loadU64(header, 5);
    if (isCompressed > 1) {
        throw DataError(DataErrorKind::Corrupted, meta_.url, offset_,
                        "malformed chunk header: compression flag " + to_string(isCompressed));
    }
    offset_ += kChunkHeaderSize;

    if (length == 0) {
        done_ = true;
        return;
    }
    if (meta_.hasSize && length > meta_.size - min(offset_, meta_.size)) {
        throw DataError(DataErrorKind::Truncated, meta_.url, offset_,
                        "chunk of " + to_string(length) + " bytes runs past the declared size " +
                            to_string(meta_.size));
    }

    vector<uint8_t> chunk = readUpTo(source_, static_cast<size_t>(length));
    if (chunk.size() < length) {
        throw DataError(DataErrorKind::Truncated, meta_.url, offset_,
                        "expected a chunk of " + to_string(length) + " bytes, got " + to_string(chunk.size()));
    }
    payloadStart_ = offset_;
    offset_ += length;

    string problem;
    vector<uint8_t> data;
    if (isCompressed) {
        if (!inflatePayload(chunk, data, problem)) {
            problem = "decompression failed: " + problem;
        }
    } else {
        data = std::move(chunk);
    }
    if (problem.empty() && crc32Of(data) != checksum) {
        problem = "Checksum does not match";
    }

    if (!problem.empty()) {
        string detail = "Corrupted data between bytes " + to_string(payloadStart_) + "-" +
                        to_string(payloadStart_ + length) + ": " + problem;
        if (!cfg_.ignoreCorrupt) {
            throw DataError(DataErrorKind::Corrupted, meta_.url, payloadStart_, detail);
        }
        spdlog::warn("{}: skipping chunk. {}", meta_.url, detail);
        return;
    }

    payload_ = std::move(data);
    cursor_ = 0;
    inChunk_ = true;
}

// --------------- ENCODE ---------------

ChunkedWriter::ChunkedWriter(ByteSink& sink, const ObjectCodec& codec, const WriterConfig& cfg)
    : sink_(sink), codec_(codec), cfg_(cfg), closed_(false) {
    validate(cfg_);
}

void ChunkedWriter::add(const Object& key, const Object& value) {
    append(Object::pair(key, value));
}

void ChunkedWriter::append(const Object& obj) {
    if (closed_) {
        throw logic_error("append on a closed ChunkedWriter");
    }
    size_t mark = buffer_.size();
    try {
        codec_.encodeOne(obj, buffer_);
    } catch (const ObjectCodecError&) {
        // drop a partial encoding so the chunk stays decodable
        buffer_.resize(mark);
        throw;
    }
    if (buffer_.size() >= cfg_.minChunkSize) {
        flush();
    }
}

/**
 * Emits the buffered objects as one chunk. Nothing is written when the buffer is empty.
 */
void ChunkedWriter::flush() {
    if (closed_) {
        throw logic_error("flush on a closed ChunkedWriter");
    }
    if (buffer_.empty()) {
        return;
    }
    uint32_t checksum = crc32Of(buffer_);
    if (cfg_.compressLevel > 0) {
        vector<uint8_t> packed = deflatePayload(buffer_, cfg_.compressLevel);
        spdlog::debug("chunk: {} bytes deflated to {}", buffer_.size(), packed.size());
        writeChunk(packed, true, checksum);
    } else {
        spdlog::debug("chunk: {} bytes stored", buffer_.size());
        writeChunk(buffer_, false, checksum);
    }
    buffer_.clear();
}

void ChunkedWriter::close() {
    if (closed_) {
        return;
    }
    flush();
    writeChunk(vector<uint8_t>(), false, 0);
    closed_ = true;
}

void ChunkedWriter::writeChunk(const vector<uint8_t>& body, bool compressed, uint32_t checksum) {
    vector<uint8_t> header;
    header.reserve(1 + kChunkHeaderSize);
    header.push_back(static_cast<uint8_t>(kChunkMarkerBase + cfg_.version));
    header.push_back(compressed ? 1 : 0);
    storeLE(header, checksum, 4);
    storeLE(header, body.size(), 8);
    sink_.write(header.data(), header.size());
    if (!body.empty()) {
        sink_.write(body.data(), body.size());
    }
}
