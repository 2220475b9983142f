#include "object_codec.hpp"

#include <cstring>
#include <limits>
#include <utility>

using namespace std;

namespace {

constexpr uint8_t kTagNone = 'N';
constexpr uint8_t kTagInteger = 'I';
constexpr uint8_t kTagReal = 'R';
constexpr uint8_t kTagBytes = 'B';
constexpr uint8_t kTagTuple = 'T';

constexpr int kMaxNesting = 64;

void putU32(vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void putU64(vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

uint32_t checkedLength(size_t size) {
    if (size > numeric_limits<uint32_t>::max()) {
        throw ObjectCodecError("object too large to encode");
    }
    return static_cast<uint32_t>(size);
}

/**
 * Bounds-checked cursor over a payload.
 */
class PayloadCursor {
public:
    PayloadCursor(const vector<uint8_t>& payload, size_t& cursor) : payload_(payload), cursor_(cursor) {}

    void require(size_t n) const {
        if (payload_.size() - cursor_ < n) {
            throw ObjectCodecError("object runs past end of payload at byte " + to_string(cursor_));
        }
    }

    uint8_t u8() {
        require(1);
        return payload_[cursor_++];
    }

    uint32_t u32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(payload_[cursor_ + i]) << (i * 8);
        }
        cursor_ += 4;
        return value;
    }

    uint64_t u64() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(payload_[cursor_ + i]) << (i * 8);
        }
        cursor_ += 8;
        return value;
    }

    string take(size_t n) {
        require(n);
        string out(reinterpret_cast<const char*>(payload_.data() + cursor_), n);
        cursor_ += n;
        return out;
    }

private:
    const vector<uint8_t>& payload_;
    size_t& cursor_;
};

/**
 * Rejects what the decoder would refuse, before any byte is written.
 */
void checkEncodable(const Object& obj, int depth) {
    if (depth > kMaxNesting) {
        throw ObjectCodecError("object nesting too deep");
    }
    if (obj.type() == Object::Type::Bytes) {
        checkedLength(obj.asBytes().size());
    } else if (obj.type() == Object::Type::Tuple) {
        checkedLength(obj.items().size());
        for (const auto& item : obj.items()) {
            checkEncodable(item, depth + 1);
        }
    }
}

void encodeValue(const Object& obj, vector<uint8_t>& out) {
    switch (obj.type()) {
    case Object::Type::None:
        out.push_back(kTagNone);
        break;
    case Object::Type::Integer:
        out.push_back(kTagInteger);
        putU64(out, static_cast<uint64_t>(obj.asInteger()));
        break;
    case Object::Type::Real: {
        double value = obj.asReal();
        uint64_t bits = 0;
        memcpy(&bits, &value, sizeof(bits));
        out.push_back(kTagReal);
        putU64(out, bits);
        break;
    }
    case Object::Type::Bytes: {
        const string& bytes = obj.asBytes();
        out.push_back(kTagBytes);
        putU32(out, checkedLength(bytes.size()));
        out.insert(out.end(), bytes.begin(), bytes.end());
        break;
    }
    case Object::Type::Tuple: {
        const vector<Object>& items = obj.items();
        out.push_back(kTagTuple);
        putU32(out, checkedLength(items.size()));
        for (const auto& item : items) {
            encodeValue(item, out);
        }
        break;
    }
    }
}

Object decodeValue(PayloadCursor& in, int depth) {
    if (depth > kMaxNesting) {
        throw ObjectCodecError("object nesting too deep");
    }
    uint8_t tag = in.u8();
    switch (tag) {
    case kTagNone:
        return Object();
    case kTagInteger:
        return Object::integer(static_cast<int64_t>(in.u64()));
    case kTagReal: {
        uint64_t bits = in.u64();
        double value = 0.0;
        memcpy(&value, &bits, sizeof(value));
        return Object::real(value);
    }
    case kTagBytes: {
        uint32_t len = in.u32();
        return Object::bytes(in.take(len));
    }
    case kTagTuple: {
        uint32_t count = in.u32();
        // every item takes at least its tag byte
        in.require(count);
        vector<Object> items;
        items.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            items.push_back(decodeValue(in, depth + 1));
        }
        return Object::tuple(std::move(items));
    }
    default:
        throw ObjectCodecError("unknown object tag " + to_string(static_cast<int>(tag)));
    }
}

} // namespace

void BinaryObjectCodec::encodeOne(const Object& obj, vector<uint8_t>& out) const {
    checkEncodable(obj, 0);
    encodeValue(obj, out);
}

bool BinaryObjectCodec::decodeNext(const vector<uint8_t>& payload, size_t& cursor, Object& out) const {
    if (cursor >= payload.size()) {
        return false;
    }
    PayloadCursor in(payload, cursor);
    out = decodeValue(in, 0);
    return true;
}
