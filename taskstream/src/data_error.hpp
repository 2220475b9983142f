#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Failure classes of a decode. Both are terminal for the stream being decoded.
 */
enum class DataErrorKind {
    Truncated,
    Corrupted
};

/**
 * Raised when input bytes cannot be turned into records.
 * Carries the input label (usually its url) and the byte offset of the fault,
 * so the task runtime can report where the input went bad.
 */
class DataError : public std::runtime_error {
public:
    DataError(DataErrorKind kind, std::string sourceId, std::uint64_t offset, std::string detail);

    DataErrorKind kind() const { return kind_; }
    const std::string& sourceId() const { return sourceId_; }
    std::uint64_t offset() const { return offset_; }
    const std::string& detail() const { return detail_; }

private:
    DataErrorKind kind_;
    std::string sourceId_;
    std::uint64_t offset_;
    std::string detail_;
};

const char* toString(DataErrorKind kind);
