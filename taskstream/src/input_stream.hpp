#pragma once

#include "byte_source.hpp"
#include "config.hpp"
#include "object_codec.hpp"
#include "record_stream.hpp"

#include <memory>

/**
 * Opens a decoded record stream over source.
 *
 * Reads exactly one byte to choose the format: nothing at all yields an empty
 * stream, a byte below 128 the legacy key/value framing, anything else the
 * chunked format. Legacy records come out as (Bytes, Bytes) pairs.
 *
 * source and codec must outlive the returned reader.
 */
std::unique_ptr<RecordReader> openInputStream(ByteSource& source,
                                              const InputMeta& meta,
                                              const ObjectCodec& codec,
                                              const ReaderConfig& cfg = ReaderConfig());

/**
 * Same as above with the default BinaryObjectCodec.
 */
std::unique_ptr<RecordReader> openInputStream(ByteSource& source,
                                              const InputMeta& meta,
                                              const ReaderConfig& cfg = ReaderConfig());

/**
 * Process-wide BinaryObjectCodec instance.
 */
const ObjectCodec& defaultObjectCodec();
