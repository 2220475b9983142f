#include "../src/regex_reader.hpp"

#include "test_util.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace testutil;

namespace {

vector<vector<string>> drain(RegexReader& reader) {
    vector<vector<string>> out;
    vector<string> groups;
    while (reader.next(groups)) {
        out.push_back(groups);
    }
    return out;
}

// ======================== Happy Paths ========================

void testTailIsYielded() {
    MemoryByteSource src(string("a\nb\nc"));
    RegexReader reader("(.*?)\n", src, sized("mem://tail", 5), true);
    auto matches = drain(reader);
    assert(matches.size() == 3);
    assert(matches[0] == vector<string>{"a"});
    assert(matches[1] == vector<string>{"b"});
    assert(matches[2] == vector<string>{"c"});
}

void testTailIsDiscarded() {
    MemoryByteSource src(string("a\nb\nc"));
    RegexReader reader("(.*?)\n", src, sized("mem://notail", 5), false);
    auto matches = drain(reader);
    assert(matches.size() == 2);
    assert(matches[1] == vector<string>{"b"});
    vector<string> groups;
    assert(!reader.next(groups));
}

void testMultipleGroups() {
    MemoryByteSource src(string("a=1;bb=22;"));
    RegexReader reader("(\\w+)=(\\w+);", src, unsized("mem://groups"));
    auto matches = drain(reader);
    assert(matches.size() == 2);
    assert((matches[0] == vector<string>{"a", "1"}));
    assert((matches[1] == vector<string>{"bb", "22"}));
}

void testShortReadsStillMatch() {
    ShortReadSource src(string("alpha\nbeta\ngamma\n"), 1);
    RegexReader reader("(.*?)\n", src, sized("mem://short", 17), false, 3);
    auto matches = drain(reader);
    assert(matches.size() == 3);
    assert(matches[2] == vector<string>{"gamma"});
}

void testLineReaderOverFile() {
    string data = loadFile("test/resources/lines.txt");
    MemoryByteSource src(data);
    LineReader reader(src, sized("file://lines.txt", data.size()));
    vector<string> lines;
    string line;
    while (reader.next(line)) {
        lines.push_back(line);
    }
    assert(lines.size() == 4);
    assert(lines[0] == "first line");
    assert(lines[1] == "second line\r");
    assert(lines[2].empty());
    assert(lines[3] == "last line without newline");
}

// ======================== Edge Cases ========================

void testLineReaderMegabyteLine() {
    const size_t length = 2 * 1024 * 1024;
    string data = string(length, 'x') + "\n" + "after";
    ShortReadSource src(data, 4096);
    LineReader reader(src, sized("mem://longline", data.size()));
    string line;
    assert(reader.next(line));
    assert(line.size() == length);
    assert(line.find_first_not_of('x') == string::npos);
    assert(reader.next(line));
    assert(line == "after");
    assert(!reader.next(line));
}

void testLineReaderMegabyteTail() {
    const size_t length = 1024 * 1024;
    MemoryByteSource src(string(length, 'y'));
    LineReader reader(src, unsized("mem://longtail"));
    string line;
    assert(reader.next(line));
    assert(line.size() == length);
    assert(!reader.next(line));
}

void testReadsStopAtDeclaredSize() {
    ShortReadSource src(string("a\nb\nc"), 100);
    RegexReader reader("(.*?)\n", src, sized("mem://bounded", 4), true);
    auto matches = drain(reader);
    assert(matches.size() == 2);
    assert(src.consumed() == 4);
}

void testNeverMatchingPatternFallsToTail() {
    MemoryByteSource src(string("no delimiter here"));
    RegexReader reader("(.*?);", src, unsized("mem://nomatch"), true, 4);
    auto matches = drain(reader);
    assert(matches.size() == 1);
    assert(matches[0] == vector<string>{"no delimiter here"});
}

void testEmptyInput() {
    MemoryByteSource src{string()};
    RegexReader reader("(.*?)\n", src, sized("mem://empty", 0), true);
    assert(drain(reader).empty());
}

// ======================== Negative Paths ========================

void testDeclaredSizeNotReached() {
    MemoryByteSource src(string("a\nb\nc"));
    RegexReader reader("(.*?)\n", src, sized("mem://truncated", 10), true);
    vector<string> groups;
    assert(reader.next(groups) && groups[0] == "a");
    assert(reader.next(groups) && groups[0] == "b");
    DataErrorKind kind = expectDataError([&]() { reader.next(groups); });
    assert(kind == DataErrorKind::Truncated);
}

void testEmptyMatchRejected() {
    MemoryByteSource src(string("xyz"));
    RegexReader reader("(a*)", src, unsized("mem://emptymatch"));
    vector<string> groups;
    bool threw = false;
    try {
        reader.next(groups);
    } catch (const invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // end namespace

int main() {
    spdlog::set_level(spdlog::level::off);
    testTailIsYielded();
    testTailIsDiscarded();
    testMultipleGroups();
    testShortReadsStillMatch();
    testLineReaderOverFile();
    testLineReaderMegabyteLine();
    testLineReaderMegabyteTail();
    testReadsStopAtDeclaredSize();
    testNeverMatchingPatternFallsToTail();
    testEmptyInput();
    testDeclaredSizeNotReached();
    testEmptyMatchRejected();
    cout << "All regex reader tests passed\n";
    return 0;
}
