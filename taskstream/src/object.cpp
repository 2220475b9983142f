#include "object.hpp"

#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace std;

namespace {

void requireType(Object::Type actual, Object::Type expected) {
    if (actual != expected) {
        throw logic_error(string("object holds ") + toString(actual) + ", not " + toString(expected));
    }
}

/**
 * Shortest of the 15/17 digit renderings that parses back to the same double.
 */
string formatReal(double value) {
    for (int precision : {15, 17}) {
        ostringstream oss;
        oss << setprecision(precision) << value;
        istringstream back(oss.str());
        double parsed = 0.0;
        back >> parsed;
        if (parsed == value || precision == 17) {
            return oss.str();
        }
    }
    return string();
}

} // namespace

Object Object::integer(int64_t value) {
    Object obj;
    obj.type_ = Type::Integer;
    obj.integer_ = value;
    return obj;
}

Object Object::real(double value) {
    Object obj;
    obj.type_ = Type::Real;
    obj.real_ = value;
    return obj;
}

Object Object::bytes(string value) {
    Object obj;
    obj.type_ = Type::Bytes;
    obj.bytes_ = std::move(value);
    return obj;
}

Object Object::tuple(vector<Object> items) {
    Object obj;
    obj.type_ = Type::Tuple;
    obj.items_ = std::move(items);
    return obj;
}

Object Object::pair(Object first, Object second) {
    vector<Object> items;
    items.reserve(2);
    items.push_back(std::move(first));
    items.push_back(std::move(second));
    return tuple(std::move(items));
}

int64_t Object::asInteger() const {
    requireType(type_, Type::Integer);
    return integer_;
}

double Object::asReal() const {
    requireType(type_, Type::Real);
    return real_;
}

const string& Object::asBytes() const {
    requireType(type_, Type::Bytes);
    return bytes_;
}

const vector<Object>& Object::items() const {
    requireType(type_, Type::Tuple);
    return items_;
}

string Object::toString() const {
    switch (type_) {
    case Type::None:
        return "None";
    case Type::Integer:
        return to_string(integer_);
    case Type::Real:
        return formatReal(real_);
    case Type::Bytes:
        return bytes_;
    case Type::Tuple: {
        string out = "(";
        for (size_t i = 0; i < items_.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += items_[i].toString();
        }
        out += ")";
        return out;
    }
    }
    return string();
}

bool Object::operator==(const Object& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
    case Type::None:
        return true;
    case Type::Integer:
        return integer_ == other.integer_;
    case Type::Real:
        return real_ == other.real_;
    case Type::Bytes:
        return bytes_ == other.bytes_;
    case Type::Tuple:
        return items_ == other.items_;
    }
    return false;
}

const char* toString(Object::Type type) {
    switch (type) {
    case Object::Type::None:
        return "None";
    case Object::Type::Integer:
        return "Integer";
    case Object::Type::Real:
        return "Real";
    case Object::Type::Bytes:
        return "Bytes";
    case Object::Type::Tuple:
        return "Tuple";
    }
    return "Unknown";
}
