#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

using namespace std;

namespace {

const string* findParam(const Params& params, const string& key) {
    auto it = params.find(key);
    return it == params.end() ? nullptr : &it->second;
}

long long parseInteger(const string& key, const string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = stoll(text, &used);
    } catch (const logic_error&) {
        throw invalid_argument("param " + key + " is not an integer: '" + text + "'");
    }
    if (used != text.size()) {
        throw invalid_argument("param " + key + " is not an integer: '" + text + "'");
    }
    return value;
}

bool parseBool(const string& key, const string& text) {
    string lowered(text);
    transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) { return tolower(ch); });
    if (lowered == "1" || lowered == "true" || lowered == "yes") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no") {
        return false;
    }
    throw invalid_argument("param " + key + " is not a boolean: '" + text + "'");
}

} // namespace

ReaderConfig readerConfigFromParams(const Params& params) {
    ReaderConfig cfg;
    if (const string* v = findParam(params, "ignore_corrupt")) {
        cfg.ignoreCorrupt = parseBool("ignore_corrupt", *v);
    }
    if (const string* v = findParam(params, "read_buffer_size")) {
        long long size = parseInteger("read_buffer_size", *v);
        if (size <= 0) {
            throw invalid_argument("param read_buffer_size must be positive");
        }
        cfg.readBufferSize = static_cast<size_t>(size);
    }
    return cfg;
}

WriterConfig writerConfigFromParams(const Params& params) {
    WriterConfig cfg;
    if (const string* v = findParam(params, "version")) {
        long long version = parseInteger("version", *v);
        if (version < 0 || version > 127) {
            throw invalid_argument("param version must be within [0, 127]");
        }
        cfg.version = static_cast<int>(version);
    }
    if (const string* v = findParam(params, "compress_level")) {
        long long level = parseInteger("compress_level", *v);
        if (level < 0 || level > 9) {
            throw invalid_argument("param compress_level must be within [0, 9]");
        }
        cfg.compressLevel = static_cast<int>(level);
    }
    if (const string* v = findParam(params, "min_chunk")) {
        long long minChunk = parseInteger("min_chunk", *v);
        if (minChunk <= 0) {
            throw invalid_argument("param min_chunk must be positive");
        }
        cfg.minChunkSize = static_cast<size_t>(minChunk);
    }
    return cfg;
}

void validate(const WriterConfig& cfg) {
    if (cfg.version < 0 || cfg.version > 127) {
        throw invalid_argument("writer version must be within [0, 127]");
    }
    if (cfg.compressLevel < 0 || cfg.compressLevel > 9) {
        throw invalid_argument("writer compressLevel must be within [0, 9]");
    }
    if (cfg.minChunkSize == 0) {
        throw invalid_argument("writer minChunkSize must be positive");
    }
}
