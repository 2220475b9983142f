#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

/**
 * Job parameters as handed to the worker, keyed by name.
 */
using Params = std::map<std::string, std::string>;

/**
 * Metadata about one task input.
 */
struct InputMeta {
    std::string url;
    // declared size presence modeled without std::optional, like the rest of the task interface
    bool hasSize = false;
    std::uint64_t size = 0;
};

/**
 * Decode-side policy.
 */
struct ReaderConfig {
    // skip chunks whose checksum or compression is broken instead of failing
    bool ignoreCorrupt = false;
    std::size_t readBufferSize = 8192;
};

/**
 * Encode-side policy for the chunked format.
 */
struct WriterConfig {
    // informational format tag, written as 128 + version in every chunk marker
    int version = 1;
    // 0 stores chunks, 1..9 deflates them at that zlib level
    int compressLevel = 2;
    std::size_t minChunkSize = 1024 * 1024;
};

/**
 * Builds a ReaderConfig from params "ignore_corrupt" and "read_buffer_size".
 * Missing keys keep their defaults. Throws std::invalid_argument naming the bad key.
 */
ReaderConfig readerConfigFromParams(const Params& params);

/**
 * Builds a WriterConfig from params "version", "compress_level" and "min_chunk".
 * Missing keys keep their defaults. Throws std::invalid_argument naming the bad key.
 */
WriterConfig writerConfigFromParams(const Params& params);

/**
 * Throws std::invalid_argument if any field is out of range.
 */
void validate(const WriterConfig& cfg);
