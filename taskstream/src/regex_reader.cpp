#include "regex_reader.hpp"

#include "data_error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace std;

BufferedTokenizer::BufferedTokenizer(ByteSource& source,
                                     const InputMeta& meta,
                                     bool outputTail,
                                     size_t readBufferSize)
    : source_(source),
      meta_(meta),
      outputTail_(outputTail),
      readBufferSize_(readBufferSize),
      totalRead_(0),
      exhausted_(false),
      done_(false) {
    if (readBufferSize_ == 0) {
        throw invalid_argument("readBufferSize must be positive");
    }
}

bool BufferedTokenizer::next(vector<string>& groups) {
    while (true) {
        if (!buffer_.empty()) {
            size_t matched = matchHead(buffer_, groups);
            if (matched > 0) {
                buffer_.erase(0, matched);
                return true;
            }
        }
        if (done_) {
            return false;
        }
        if (!exhausted_) {
            fill();
            continue;
        }

        done_ = true;
        if (meta_.hasSize && totalRead_ < meta_.size) {
            throw DataError(DataErrorKind::Truncated, meta_.url, totalRead_,
                            "expected " + to_string(meta_.size) + " bytes, got " + to_string(totalRead_));
        }
        if (buffer_.empty()) {
            return false;
        }
        if (outputTail_) {
            groups.assign(1, buffer_);
            buffer_.clear();
            return true;
        }
        spdlog::warn("Couldn't match the last {} bytes in {}. Some bytes may be missing from input.",
                     buffer_.size(), meta_.url);
        buffer_.clear();
        return false;
    }
}

/**
 * Reads one block, never past the declared size. Marks the source exhausted on EOF.
 */
bool BufferedTokenizer::fill() {
    size_t want = readBufferSize_;
    if (meta_.hasSize) {
        uint64_t remaining = meta_.size - totalRead_;
        want = static_cast<size_t>(min<uint64_t>(want, remaining));
    }
    if (want == 0) {
        exhausted_ = true;
        return false;
    }
    string block(want, '\0');
    size_t n = source_.read(reinterpret_cast<uint8_t*>(&block[0]), want);
    totalRead_ += n;
    buffer_.append(block, 0, n);
    if (n == 0 || (meta_.hasSize && totalRead_ >= meta_.size)) {
        exhausted_ = true;
    }
    return n > 0;
}

RegexReader::RegexReader(const string& pattern,
                         ByteSource& source,
                         const InputMeta& meta,
                         bool outputTail,
                         size_t readBufferSize)
    : BufferedTokenizer(source, meta, outputTail, readBufferSize), pattern_(pattern) {}

size_t RegexReader::matchHead(const string& buffer, vector<string>& groups) {
    smatch m;
    if (!regex_search(buffer, m, pattern_, regex_constants::match_continuous)) {
        return 0;
    }
    if (m.length(0) == 0) {
        throw invalid_argument("pattern matched an empty string at the head of " + meta().url);
    }
    groups.clear();
    for (size_t i = 1; i < m.size(); ++i) {
        groups.push_back(m[i].str());
    }
    return static_cast<size_t>(m.length(0));
}

LineReader::LineReader(ByteSource& source, const InputMeta& meta, size_t readBufferSize)
    : BufferedTokenizer(source, meta, true, readBufferSize), scanned_(0) {}

bool LineReader::next(string& line) {
    if (!next(groups_)) {
        return false;
    }
    line = groups_.empty() ? string() : std::move(groups_[0]);
    return true;
}

size_t LineReader::matchHead(const string& buffer, vector<string>& groups) {
    size_t newline = buffer.find('\n', scanned_);
    if (newline == string::npos) {
        scanned_ = buffer.size();
        return 0;
    }
    scanned_ = 0;
    groups.assign(1, buffer.substr(0, newline));
    return newline + 1;
}
