#pragma once

#include "object.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised by an ObjectCodec when payload bytes do not form a valid object.
 */
class ObjectCodecError : public std::runtime_error {
public:
    explicit ObjectCodecError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Encodes objects into self-delimiting byte runs and back.
 * Object boundaries inside a chunk payload are owned by the codec.
 */
class ObjectCodec {
public:
    virtual ~ObjectCodec() = default;

    /**
     * Appends the encoding of obj to out.
     * Throws ObjectCodecError for objects the codec cannot represent.
     */
    virtual void encodeOne(const Object& obj, std::vector<std::uint8_t>& out) const = 0;

    /**
     * Decodes the object starting at cursor and advances cursor past it.
     * Returns false once the payload is exhausted. Throws ObjectCodecError on malformed bytes.
     */
    virtual bool decodeNext(const std::vector<std::uint8_t>& payload, std::size_t& cursor, Object& out) const = 0;
};

/**
 * Default codec: one tag byte per object followed by a little-endian body.
 *   'N'                 None
 *   'I' i64             Integer
 *   'R' f64             Real
 *   'B' u32 len, bytes  Bytes
 *   'T' u32 n, items    Tuple
 */
class BinaryObjectCodec final : public ObjectCodec {
public:
    void encodeOne(const Object& obj, std::vector<std::uint8_t>& out) const override;
    bool decodeNext(const std::vector<std::uint8_t>& payload, std::size_t& cursor, Object& out) const override;
};
