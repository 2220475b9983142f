#include "functions.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace std;

namespace {

double numericKey(const Object& key) {
    switch (key.type()) {
    case Object::Type::Integer:
        return static_cast<double>(key.asInteger());
    case Object::Type::Real:
        return key.asReal();
    case Object::Type::Bytes: {
        const string& text = key.asBytes();
        size_t used = 0;
        long long value = 0;
        try {
            value = stoll(text, &used);
        } catch (const logic_error&) {
            throw invalid_argument("range partition key is not numeric: '" + text + "'");
        }
        if (used != text.size()) {
            throw invalid_argument("range partition key is not numeric: '" + text + "'");
        }
        return static_cast<double>(value);
    }
    default:
        throw invalid_argument(string("range partition key of type ") + toString(key.type()) + " is not numeric");
    }
}

} // namespace

int defaultPartition(const Object& key, int partitions) {
    if (partitions <= 0) {
        throw invalid_argument("number of partitions must be positive");
    }
    size_t h = hash<string>()(key.toString());
    return static_cast<int>(h % static_cast<size_t>(partitions));
}

PartitionFunction makeRangePartition(int64_t minValue, int64_t maxValue) {
    if (maxValue == minValue) {
        throw invalid_argument("range partition needs maxValue != minValue");
    }
    const double low = static_cast<double>(minValue);
    const double range = static_cast<double>(maxValue) - low;
    return [low, range](const Object& key, int partitions) {
        return static_cast<int>(lround((numericKey(key) - low) / range * (partitions - 1)));
    };
}

void nopReduce(RecordReader& input, RecordWriter& output) {
    Object record;
    while (input.next(record)) {
        const vector<Object>& kv = record.items();
        if (kv.size() != 2) {
            throw invalid_argument("reduce input record is not a (key, value) pair");
        }
        output.add(kv[0], kv[1]);
    }
}
