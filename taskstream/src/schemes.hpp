#pragma once

#include "byte_source.hpp"
#include "config.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

/**
 * A resolved task input: the byte stream plus what is known about it.
 */
struct OpenedInput {
    std::unique_ptr<ByteSource> source;
    InputMeta meta;
};

/**
 * Opens the input named by url.
 */
using InputFactory = std::function<OpenedInput(const std::string& url, const Params& params)>;

/**
 * Old-style factory that takes no job params.
 */
using LegacyInputFactory = std::function<OpenedInput(const std::string& url)>;

/**
 * Wraps an old-style factory so it can be registered; params are ignored.
 */
InputFactory adaptLegacyFactory(LegacyInputFactory factory);

/**
 * Resolves input urls to byte sources by their scheme.
 */
class SchemeRegistry {
public:
    /**
     * Adds or replaces the factory for scheme.
     */
    void registerScheme(const std::string& scheme, InputFactory factory);

    bool hasScheme(const std::string& scheme) const;

    /**
     * Opens url through the factory of its scheme. Urls without a scheme are files.
     * Throws std::invalid_argument when no factory is registered for the scheme.
     */
    OpenedInput open(const std::string& url, const Params& params = Params()) const;

    /**
     * Registry with the built-in "file" and "raw" schemes.
     */
    static SchemeRegistry withDefaults();

    /**
     * Returns the scheme of "scheme://rest", or "file" when url has none.
     */
    static std::string parseScheme(const std::string& url);

private:
    std::map<std::string, InputFactory> factories_;
};

/**
 * "file://path" or a bare path. The declared size comes from the filesystem.
 */
OpenedInput openFileInput(const std::string& url, const Params& params);

/**
 * "raw://data": the bytes after the scheme are the input itself.
 */
OpenedInput openRawInput(const std::string& url, const Params& params);
