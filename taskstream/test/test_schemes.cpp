#include "../src/config.hpp"
#include "../src/schemes.hpp"

#include "test_util.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace std;
using namespace testutil;

namespace {

template <typename Exception, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

// ======================== Schemes ========================

void testParseScheme() {
    assert(SchemeRegistry::parseScheme("raw://abc") == "raw");
    assert(SchemeRegistry::parseScheme("http://host/path") == "http");
    assert(SchemeRegistry::parseScheme("/var/data/input") == "file");
    assert(SchemeRegistry::parseScheme("relative/path") == "file");
    assert(SchemeRegistry::parseScheme("a path with raw://inside") == "file");
}

void testRawScheme() {
    SchemeRegistry registry = SchemeRegistry::withDefaults();
    OpenedInput input = registry.open("raw://hello");
    assert(input.meta.url == "raw://hello");
    assert(input.meta.hasSize);
    assert(input.meta.size == 5);
    assert(asString(readUpTo(*input.source, 100)) == "hello");
}

void testFileSchemeWithAndWithoutPrefix() {
    SchemeRegistry registry = SchemeRegistry::withDefaults();
    string data = loadFile("test/resources/sample.netstr");
    const string candidates[] = {"test/resources/sample.netstr", "../test/resources/sample.netstr",
                                 "taskstream/test/resources/sample.netstr"};
    for (const auto& path : candidates) {
        try {
            OpenedInput bare = registry.open(path);
            assert(bare.meta.size == data.size());
            OpenedInput prefixed = registry.open("file://" + path);
            assert(asString(readUpTo(*prefixed.source, data.size() + 1)) == data);
            return;
        } catch (const runtime_error&) {
            continue;
        }
    }
    assert(false);
}

void testBarePathWithSeparatorInside() {
    filesystem::path dir = filesystem::temp_directory_path() / "taskstream_scheme_test" / "a:";
    filesystem::create_directories(dir);
    {
        FileByteSink sink((dir / "b").string());
        sink.write(reinterpret_cast<const uint8_t*>("inner"), 5);
    }
    string url = dir.parent_path().string() + "/a://b";
    assert(SchemeRegistry::parseScheme(url) == "file");

    SchemeRegistry registry = SchemeRegistry::withDefaults();
    OpenedInput input = registry.open(url);
    assert(input.meta.size == 5);
    assert(asString(readUpTo(*input.source, 10)) == "inner");
    input.source.reset();
    filesystem::remove_all(dir.parent_path());

    OpenedInput raw = registry.open("raw://x://y");
    assert(asString(readUpTo(*raw.source, 10)) == "x://y");
}

void testMissingFile() {
    SchemeRegistry registry = SchemeRegistry::withDefaults();
    assert(throws<runtime_error>([&]() { registry.open("file:///does/not/exist/anywhere"); }));
}

void testUnknownScheme() {
    SchemeRegistry registry = SchemeRegistry::withDefaults();
    assert(!registry.hasScheme("http"));
    assert(throws<invalid_argument>([&]() { registry.open("http://example.invalid/data"); }));
}

void testCustomAndLegacyFactories() {
    SchemeRegistry registry;
    registry.registerScheme("mem", [](const string& url, const Params& params) {
        OpenedInput input;
        string body = params.count("body") ? params.at("body") : string();
        input.source = make_unique<MemoryByteSource>(body);
        input.meta = InputMeta{url, true, body.size()};
        return input;
    });
    registry.registerScheme("old", adaptLegacyFactory([](const string& url) {
        OpenedInput input;
        input.source = make_unique<MemoryByteSource>(string("legacy"));
        input.meta = InputMeta{url, false, 0};
        return input;
    }));

    OpenedInput mem = registry.open("mem://x", Params{{"body", "payload"}});
    assert(mem.meta.size == 7);
    assert(asString(readUpTo(*mem.source, 7)) == "payload");

    OpenedInput old = registry.open("old://y", Params{{"ignored", "1"}});
    assert(!old.meta.hasSize);
    assert(asString(readUpTo(*old.source, 10)) == "legacy");

    assert(throws<invalid_argument>([&]() { registry.open("no/scheme/here"); }));
}

// ======================== Config ========================

void testConfigDefaults() {
    InputMeta meta;
    assert(meta.url.empty());
    assert(!meta.hasSize);
    assert(meta.size == 0);
    ReaderConfig reader = readerConfigFromParams(Params());
    assert(!reader.ignoreCorrupt);
    assert(reader.readBufferSize == 8192);
    WriterConfig writer = writerConfigFromParams(Params());
    assert(writer.version == 1);
    assert(writer.compressLevel == 2);
    assert(writer.minChunkSize == 1024 * 1024);
}

void testConfigFromParams() {
    ReaderConfig reader = readerConfigFromParams(Params{{"ignore_corrupt", "True"}, {"read_buffer_size", "512"}});
    assert(reader.ignoreCorrupt);
    assert(reader.readBufferSize == 512);
    WriterConfig writer =
        writerConfigFromParams(Params{{"version", "3"}, {"compress_level", "0"}, {"min_chunk", "4096"}});
    assert(writer.version == 3);
    assert(writer.compressLevel == 0);
    assert(writer.minChunkSize == 4096);
}

void testConfigRejectsBadValues() {
    assert(throws<invalid_argument>([]() { readerConfigFromParams(Params{{"ignore_corrupt", "maybe"}}); }));
    assert(throws<invalid_argument>([]() { readerConfigFromParams(Params{{"read_buffer_size", "0"}}); }));
    assert(throws<invalid_argument>([]() { writerConfigFromParams(Params{{"version", "128"}}); }));
    assert(throws<invalid_argument>([]() { writerConfigFromParams(Params{{"compress_level", "10"}}); }));
    assert(throws<invalid_argument>([]() { writerConfigFromParams(Params{{"min_chunk", "12kb"}}); }));
    WriterConfig cfg;
    cfg.minChunkSize = 0;
    assert(throws<invalid_argument>([&]() { validate(cfg); }));
}

} // end namespace

int main() {
    spdlog::set_level(spdlog::level::off);
    testParseScheme();
    testRawScheme();
    testFileSchemeWithAndWithoutPrefix();
    testBarePathWithSeparatorInside();
    testMissingFile();
    testUnknownScheme();
    testCustomAndLegacyFactories();
    testConfigDefaults();
    testConfigFromParams();
    testConfigRejectsBadValues();
    cout << "All scheme tests passed\n";
    return 0;
}
