#pragma once

#include "byte_source.hpp"
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <vector>

/**
 * Incremental tokenizer over a ByteSource.
 *
 * Bytes are appended to an internal buffer and a token is matched anchored at
 * the buffer head; every match yields its capture groups and its bytes are
 * dropped. A miss only means more input is needed, so a token that never
 * matches consumes the whole source before the tail policy applies. With an
 * unknown size over an endless source that never returns.
 *
 * Once the source is exhausted:
 *  - a declared size that was not reached raises DataError(Truncated);
 *  - leftover bytes are yielded as a one-element match when outputTail is set,
 *    otherwise they are discarded with a warning.
 */
class BufferedTokenizer {
public:
    virtual ~BufferedTokenizer() = default;

    /**
     * Produces the next match's capture groups. Returns false at the end of the stream.
     */
    bool next(std::vector<std::string>& groups);

protected:
    BufferedTokenizer(ByteSource& source, const InputMeta& meta, bool outputTail, std::size_t readBufferSize);

    /**
     * Matches one token at the head of buffer and fills groups.
     * Returns the number of bytes matched, 0 when more input is needed.
     */
    virtual std::size_t matchHead(const std::string& buffer, std::vector<std::string>& groups) = 0;

    const InputMeta& meta() const { return meta_; }

private:
    bool fill();

    ByteSource& source_;
    InputMeta meta_;
    bool outputTail_;
    std::size_t readBufferSize_;
    std::string buffer_;
    std::uint64_t totalRead_;
    bool exhausted_;
    bool done_;
};

/**
 * Tokenizer driven by a caller-supplied ECMAScript pattern.
 *
 * libstdc++ evaluates std::regex recursively, one frame per character, so a
 * pattern whose match (or pending partial match) spans a few hundred KB can
 * exhaust the stack. Keep tokens short or use LineReader for line splitting.
 * A pattern that matches the empty string raises std::invalid_argument.
 */
class RegexReader final : public BufferedTokenizer {
public:
    RegexReader(const std::string& pattern,
                ByteSource& source,
                const InputMeta& meta,
                bool outputTail = false,
                std::size_t readBufferSize = 8192);

protected:
    std::size_t matchHead(const std::string& buffer, std::vector<std::string>& groups) override;

private:
    std::regex pattern_;
};

/**
 * Yields each line of input without its '\n'. A final line without newline is kept.
 * Lines of any length are supported.
 */
class LineReader final : public BufferedTokenizer {
public:
    LineReader(ByteSource& source, const InputMeta& meta, std::size_t readBufferSize = 8192);

    using BufferedTokenizer::next;
    bool next(std::string& line);

protected:
    std::size_t matchHead(const std::string& buffer, std::vector<std::string>& groups) override;

private:
    std::vector<std::string> groups_;
    // bytes at the buffer head already known to hold no newline
    std::size_t scanned_;
};
