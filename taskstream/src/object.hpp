#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * Immutable value carried through a record stream.
 * A legacy (key, value) record is a two-item Tuple of Bytes.
 */
class Object {
public:
    enum class Type { None, Integer, Real, Bytes, Tuple };

    Object() : type_(Type::None), integer_(0), real_(0.0) {}

    static Object integer(std::int64_t value);
    static Object real(double value);
    static Object bytes(std::string value);
    static Object tuple(std::vector<Object> items);
    static Object pair(Object first, Object second);

    Type type() const { return type_; }
    bool isNone() const { return type_ == Type::None; }

    /**
     * Typed accessors. Throw std::logic_error when the object holds another type.
     */
    std::int64_t asInteger() const;
    double asReal() const;
    const std::string& asBytes() const;
    const std::vector<Object>& items() const;

    /**
     * Textual form: raw bytes, decimal numbers, "None", or "(a, b, ...)".
     * Used for netstr output and partition hashing.
     */
    std::string toString() const;

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    Type type_;
    std::int64_t integer_;
    double real_;
    std::string bytes_;
    std::vector<Object> items_;
};

const char* toString(Object::Type type);
