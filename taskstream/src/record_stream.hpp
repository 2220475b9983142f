#pragma once

#include "object.hpp"

/**
 * Pull-based, non-restartable sequence of decoded records.
 */
class RecordReader {
public:
    virtual ~RecordReader() = default;

    /**
     * Stores the next record in out. Returns false once the input is exhausted.
     * Throws DataError when the input is truncated or corrupted.
     */
    virtual bool next(Object& out) = 0;
};

/**
 * Destination for task output records.
 */
class RecordWriter {
public:
    virtual ~RecordWriter() = default;

    virtual void add(const Object& key, const Object& value) = 0;

    /**
     * Writes anything still buffered plus any end-of-stream framing.
     */
    virtual void close() = 0;
};
