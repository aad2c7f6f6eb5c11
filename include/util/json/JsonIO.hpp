#pragma once
#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace util::json {

/**
 * @brief Raised when a JSON document cannot be parsed or a JSON value
 * cannot be decoded into the requested C++ type.
 */
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when a C++ value has no JSON representation (NaN, infinity).
 */
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Reader settings.
 *
 * The default is strict: a single top-level value, no comments, no
 * trailing commas, no trailing content. `lenient` relaxes comments and
 * trailing commas only.
 */
struct ReadOptions {
    bool lenient = false;
};

/**
 * @brief Writer settings.
 *
 * Compact output unless `pretty` is set.
 */
struct WriteOptions {
    bool pretty = false;
};

/**
 * @brief Parses a JSON document.
 *
 * A top-level scalar (including `null`) is accepted; the caller's codec
 * decides whether it fits the expected type.
 *
 * @throws ParseError with jsoncpp's formatted diagnostics on malformed input
 */
inline Json::Value read(std::string_view data, ReadOptions opts = {}) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["strictRoot"] = false;
    if (opts.lenient) {
        builder["allowComments"] = true;
        builder["allowTrailingCommas"] = true;
    }

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    Json::String errs;
    if (!reader->parse(data.data(), data.data() + data.size(), &root, &errs))
        throw ParseError("json: " + errs);
    return root;
}

/**
 * @brief Serializes @p value.
 *
 * Non-ASCII text is written as UTF-8 rather than `\u` escapes.
 */
inline std::string write(const Json::Value& value, WriteOptions opts = {}) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = opts.pretty ? "  " : "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

/**
 * @brief Name of a JSON value's type, for error messages.
 */
inline const char* typeName(const Json::Value& v) noexcept {
    switch (v.type()) {
    case Json::nullValue:    return "null";
    case Json::intValue:
    case Json::uintValue:    return "integer";
    case Json::realValue:    return "number";
    case Json::stringValue:  return "string";
    case Json::booleanValue: return "bool";
    case Json::arrayValue:   return "array";
    case Json::objectValue:  return "object";
    }
    return "unknown";
}

} // namespace util::json
