#pragma once

#include "object.hpp"
#include "record_stream.hpp"

#include <cstdint>
#include <functional>

/**
 * Maps a key to a partition index in [0, partitions).
 */
using PartitionFunction = std::function<int(const Object& key, int partitions)>;

/**
 * Returns hash(textual form of key) % partitions.
 * The hash is only stable within one process; it is not a cross-run contract.
 * Throws std::invalid_argument when partitions <= 0.
 */
int defaultPartition(const Object& key, int partitions);

/**
 * Returns a function placing numeric keys of [minValue, maxValue] into equally
 * sized partitions: round((key - minValue) / (maxValue - minValue) * (partitions - 1)).
 * Keys may be Integer, Real, or Bytes holding a decimal integer.
 * Throws std::invalid_argument when maxValue == minValue.
 */
PartitionFunction makeRangePartition(std::int64_t minValue, std::int64_t maxValue);

/**
 * Copies every (key, value) pair from input to output unchanged.
 */
void nopReduce(RecordReader& input, RecordWriter& output);
