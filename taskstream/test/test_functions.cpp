#include "../src/chunked.hpp"
#include "../src/functions.hpp"
#include "../src/input_stream.hpp"
#include "../src/netstr.hpp"

#include "test_util.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace testutil;

namespace {

template <typename Fn>
bool throwsInvalidArgument(Fn fn) {
    try {
        fn();
    } catch (const invalid_argument&) {
        return true;
    }
    return false;
}

// ======================== Partitioning ========================

void testDefaultPartitionInRange() {
    vector<Object> keys = {
        Object::bytes(""), Object::bytes("apple"), Object::integer(-12), Object::real(2.5),
        Object(), Object::pair(Object::bytes("a"), Object::integer(1))};
    for (int n : {1, 2, 7, 64, 1000}) {
        for (const auto& key : keys) {
            int p = defaultPartition(key, n);
            assert(p >= 0 && p < n);
            assert(p == defaultPartition(key, n));
        }
    }
    assert(defaultPartition(Object::bytes("anything"), 1) == 0);
}

void testDefaultPartitionUsesTextualForm() {
    assert(defaultPartition(Object::integer(42), 97) == defaultPartition(Object::bytes("42"), 97));
}

void testDefaultPartitionRejectsNoPartitions() {
    assert(throwsInvalidArgument([]() { defaultPartition(Object::bytes("k"), 0); }));
}

void testRangePartitionExtremes() {
    PartitionFunction part = makeRangePartition(0, 100);
    assert(part(Object::integer(0), 10) == 0);
    assert(part(Object::integer(100), 10) == 9);
    assert(part(Object::integer(50), 10) == 5);
    assert(part(Object::bytes("100"), 10) == 9);
    assert(part(Object::real(0.0), 10) == 0);
}

void testRangePartitionOffsetMinimum() {
    PartitionFunction part = makeRangePartition(-50, 50);
    assert(part(Object::integer(-50), 5) == 0);
    assert(part(Object::integer(50), 5) == 4);
}

void testRangePartitionRejectsBadInput() {
    assert(throwsInvalidArgument([]() { makeRangePartition(3, 3); }));
    PartitionFunction part = makeRangePartition(0, 10);
    assert(throwsInvalidArgument([&]() { part(Object::bytes("ten"), 4); }));
    assert(throwsInvalidArgument([&]() { part(Object(), 4); }));
}

// ======================== Reduce ========================

void testNopReduceCopiesLegacyIntoChunked() {
    MemoryByteSink legacy;
    writeNetstr(legacy, "a", "1");
    writeNetstr(legacy, "b", "2");
    MemoryByteSource src(legacy.data());
    auto input = openInputStream(src, sized("mem://reduce-in", legacy.data().size()));

    MemoryByteSink out;
    ChunkedWriter writer(out, defaultObjectCodec());
    nopReduce(*input, writer);
    writer.close();

    MemoryByteSource back(out.data());
    auto decoded = openInputStream(back, sized("mem://reduce-out", out.data().size()));
    Object record;
    assert(decoded->next(record));
    assert(record == Object::pair(Object::bytes("a"), Object::bytes("1")));
    assert(decoded->next(record));
    assert(record == Object::pair(Object::bytes("b"), Object::bytes("2")));
    assert(!decoded->next(record));
}

} // end namespace

int main() {
    testDefaultPartitionInRange();
    testDefaultPartitionUsesTextualForm();
    testDefaultPartitionRejectsNoPartitions();
    testRangePartitionExtremes();
    testRangePartitionOffsetMinimum();
    testRangePartitionRejectsBadInput();
    testNopReduceCopiesLegacyIntoChunked();
    cout << "All function tests passed\n";
    return 0;
}
