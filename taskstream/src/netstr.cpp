#include "netstr.hpp"

#include "data_error.hpp"

#include <algorithm>
#include <utility>

using namespace std;

namespace {

// a length prefix is at most 10 digits plus its terminating space
constexpr size_t kLengthWindow = 11;
constexpr size_t kMaxReadBlock = 1024 * 1024;

bool isDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

} // namespace

NetstrReader::NetstrReader(ByteSource& source, const InputMeta& meta, string head, size_t readSize)
    : source_(source),
      meta_(meta),
      buffer_(std::move(head)),
      readSize_(readSize == 0 ? 1 : readSize),
      idx_(0),
      totalRead_(buffer_.size()),
      consumed_(0),
      exhausted_(false) {}

bool NetstrReader::next(string& key, string& value) {
    if (meta_.hasSize) {
        if (consumed_ >= meta_.size) {
            return false;
        }
    } else if (!ensure(1, readSize_)) {
        return false;
    }
    string k = readField();
    string v = readField();
    key = std::move(k);
    value = std::move(v);
    return true;
}

/**
 * Parses one length-prefixed field and its trailing delimiter.
 */
string NetstrReader::readField() {
    ensure(kLengthWindow, readSize_);
    size_t avail = buffer_.size() - idx_;
    if (avail == 0) {
        throw DataError(DataErrorKind::Truncated, meta_.url, consumed_,
                        meta_.hasSize ? "expected " + to_string(meta_.size) + " bytes, got " + to_string(consumed_)
                                      : string("input ends inside a record"));
    }

    size_t window = min(kLengthWindow, avail);
    size_t space = buffer_.find(' ', idx_);
    if (space == string::npos || space >= idx_ + window) {
        if (window < kLengthWindow) {
            throw DataError(DataErrorKind::Truncated, meta_.url, consumed_, "input ends inside a value length");
        }
        throw DataError(DataErrorKind::Corrupted, meta_.url, consumed_, "could not parse a value length");
    }
    if (space == idx_ || !all_of(buffer_.begin() + idx_, buffer_.begin() + space, isDigit)) {
        throw DataError(DataErrorKind::Corrupted, meta_.url, consumed_, "could not parse a value length");
    }

    uint64_t length = 0;
    for (size_t i = idx_; i < space; ++i) {
        length = length * 10 + static_cast<uint64_t>(buffer_[i] - '0');
    }
    consumed_ += space + 1 - idx_;
    idx_ = space + 1;

    if (meta_.hasSize && length > meta_.size - min(consumed_, meta_.size)) {
        throw DataError(DataErrorKind::Truncated, meta_.url, consumed_,
                        "value of " + to_string(length) + " bytes runs past the declared size " +
                            to_string(meta_.size));
    }

    size_t needed = static_cast<size_t>(length);
    ensure(needed + 1, needed + readSize_ + 1);
    avail = buffer_.size() - idx_;
    if (avail < needed) {
        throw DataError(DataErrorKind::Truncated, meta_.url, consumed_,
                        "expected a value of " + to_string(length + 1) + " bytes");
    }

    string value = buffer_.substr(idx_, needed);
    idx_ += needed;
    consumed_ += length;
    if (avail > needed && !isDigit(buffer_[idx_])) {
        ++idx_;
        ++consumed_;
    }
    return value;
}

/**
 * Buffers until n unread bytes are available or the input is exhausted.
 * Never reads past the declared size. Returns whether n bytes are available.
 */
bool NetstrReader::ensure(size_t n, size_t readSize) {
    while (buffer_.size() - idx_ < n && !exhausted_) {
        if (idx_ > 0) {
            buffer_.erase(0, idx_);
            idx_ = 0;
        }
        size_t want = min(readSize, kMaxReadBlock);
        if (meta_.hasSize) {
            want = static_cast<size_t>(min<uint64_t>(want, meta_.size - min(totalRead_, meta_.size)));
        }
        if (want == 0) {
            exhausted_ = true;
            break;
        }
        if (scratch_.size() < want) {
            scratch_.resize(want);
        }
        size_t got = source_.read(scratch_.data(), want);
        buffer_.append(reinterpret_cast<const char*>(scratch_.data()), got);
        totalRead_ += got;
        if (got == 0) {
            exhausted_ = true;
        }
    }
    return buffer_.size() - idx_ >= n;
}

NetstrRecordReader::NetstrRecordReader(ByteSource& source, const InputMeta& meta, string head, size_t readSize)
    : reader_(source, meta, std::move(head), readSize) {}

bool NetstrRecordReader::next(Object& out) {
    if (!reader_.next(key_, value_)) {
        return false;
    }
    out = Object::pair(Object::bytes(key_), Object::bytes(value_));
    return true;
}

void NetstrWriter::add(const Object& key, const Object& value) {
    writeNetstr(sink_, key.toString(), value.toString());
}

void writeNetstr(ByteSink& sink, const string& key, const string& value) {
    string out;
    out.reserve(key.size() + value.size() + 24);
    out += to_string(key.size());
    out += ' ';
    out += key;
    out += ' ';
    out += to_string(value.size());
    out += ' ';
    out += value;
    out += '\n';
    sink.write(reinterpret_cast<const uint8_t*>(out.data()), out.size());
}
