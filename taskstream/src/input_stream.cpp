#include "input_stream.hpp"

#include "chunked.hpp"

#include <spdlog/spdlog.h>

#include <vector>

using namespace std;

namespace {

class EmptyRecordReader final : public RecordReader {
public:
    bool next(Object&) override { return false; }
};

} // namespace

unique_ptr<RecordReader> openInputStream(ByteSource& source,
                                         const InputMeta& meta,
                                         const ObjectCodec& codec,
                                         const ReaderConfig& cfg) {
    if (meta.hasSize && meta.size == 0) {
        return make_unique<EmptyRecordReader>();
    }
    vector<uint8_t> head = readUpTo(source, 1);
    if (head.empty()) {
        spdlog::debug("{}: empty input", meta.url);
        return make_unique<EmptyRecordReader>();
    }
    return make_unique<ChunkedReader>(source, meta, head[0], codec, cfg);
}

unique_ptr<RecordReader> openInputStream(ByteSource& source, const InputMeta& meta, const ReaderConfig& cfg) {
    return openInputStream(source, meta, defaultObjectCodec(), cfg);
}

const ObjectCodec& defaultObjectCodec() {
    static const BinaryObjectCodec codec{};
    return codec;
}
