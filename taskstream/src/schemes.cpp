#include "schemes.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace std;

namespace {

const char* const kDefaultScheme = "file";

const regex& schemePattern() {
    static const regex pattern("(\\w+)://");
    return pattern;
}

/**
 * Strips a leading "scheme://" from url when present.
 */
string stripScheme(const string& url) {
    smatch m;
    if (regex_search(url, m, schemePattern(), regex_constants::match_continuous)) {
        return url.substr(static_cast<size_t>(m.length(0)));
    }
    return url;
}

} // namespace

InputFactory adaptLegacyFactory(LegacyInputFactory factory) {
    return [factory](const string& url, const Params&) { return factory(url); };
}

void SchemeRegistry::registerScheme(const string& scheme, InputFactory factory) {
    factories_[scheme] = std::move(factory);
}

bool SchemeRegistry::hasScheme(const string& scheme) const {
    return factories_.count(scheme) > 0;
}

OpenedInput SchemeRegistry::open(const string& url, const Params& params) const {
    string scheme = parseScheme(url);
    auto it = factories_.find(scheme);
    if (it == factories_.end()) {
        throw invalid_argument("no input stream registered for scheme '" + scheme + "' of " + url);
    }
    spdlog::debug("opening {} with scheme {}", url, scheme);
    return it->second(url, params);
}

SchemeRegistry SchemeRegistry::withDefaults() {
    SchemeRegistry registry;
    registry.registerScheme("file", openFileInput);
    registry.registerScheme("raw", openRawInput);
    return registry;
}

string SchemeRegistry::parseScheme(const string& url) {
    smatch m;
    if (regex_search(url, m, schemePattern(), regex_constants::match_continuous)) {
        return m[1].str();
    }
    return kDefaultScheme;
}

OpenedInput openFileInput(const string& url, const Params&) {
    string path = stripScheme(url);
    error_code ec;
    uintmax_t size = filesystem::file_size(path, ec);
    if (ec) {
        throw runtime_error("failed to stat " + path + ": " + ec.message());
    }
    OpenedInput input;
    input.source = make_unique<FileByteSource>(path);
    input.meta = InputMeta{url, true, static_cast<uint64_t>(size)};
    return input;
}

OpenedInput openRawInput(const string& url, const Params&) {
    string data = stripScheme(url);
    OpenedInput input;
    input.meta = InputMeta{url, true, static_cast<uint64_t>(data.size())};
    input.source = make_unique<MemoryByteSource>(data);
    return input;
}
