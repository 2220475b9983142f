#include "data_error.hpp"

#include <sstream>
#include <utility>

using namespace std;

namespace {

string formatMessage(DataErrorKind kind, const string& sourceId, uint64_t offset, const string& detail) {
    ostringstream oss;
    oss << toString(kind) << " input: " << detail << " (offset " << offset << ") in " << sourceId;
    return oss.str();
}

} // namespace

DataError::DataError(DataErrorKind kind, string sourceId, uint64_t offset, string detail)
    : runtime_error(formatMessage(kind, sourceId, offset, detail)),
      kind_(kind),
      sourceId_(std::move(sourceId)),
      offset_(offset),
      detail_(std::move(detail)) {}

const char* toString(DataErrorKind kind) {
    switch (kind) {
    case DataErrorKind::Truncated:
        return "Truncated";
    case DataErrorKind::Corrupted:
        return "Corrupted";
    }
    return "Unknown";
}
