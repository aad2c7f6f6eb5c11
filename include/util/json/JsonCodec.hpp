#pragma once
#include <JsonIO.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace util::json {

/**
 * @brief Encodes a C++ value as a `Json::Value` and decodes it back.
 *
 * Specialize for user types:
 * @code
 * namespace util::json {
 * template <>
 * struct Codec<Point> {
 *     static Json::Value encode(const Point& p);
 *     static Point decode(const Json::Value& v);   // throws ParseError
 * };
 * }
 * @endcode
 *
 * The primary template is left undefined so that an unsupported element
 * type fails at compile time.
 */
template <typename T, typename Enable = void>
struct Codec;

namespace detail {

[[noreturn]] inline void mismatch(const Json::Value& v, const char* expected) {
    throw ParseError(std::string("json: cannot decode ") + typeName(v) +
                     " into " + expected);
}

// prefixes the location of a failing element to the inner message
[[noreturn]] inline void rethrowAt(const std::string& where, const ParseError& e) {
    std::string msg = e.what();
    constexpr std::string_view prefix = "json: ";
    if (msg.compare(0, prefix.size(), prefix) == 0)
        msg.erase(0, prefix.size());
    throw ParseError("json: " + where + ": " + msg);
}

} // namespace detail

template <>
struct Codec<Json::Value> {
    static Json::Value encode(const Json::Value& v) { return v; }
    static Json::Value decode(const Json::Value& v) { return v; }
};

template <>
struct Codec<bool> {
    static Json::Value encode(bool v) { return Json::Value(v); }
    static bool decode(const Json::Value& v) {
        if (!v.isBool())
            detail::mismatch(v, "bool");
        return v.asBool();
    }
};

/// integers: only JSON integer literals are accepted, range checked
template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static Json::Value encode(T v) {
        if constexpr (std::is_signed_v<T>) {
            return Json::Value(static_cast<Json::Int64>(v));
        } else {
            return Json::Value(static_cast<Json::UInt64>(v));
        }
    }

    static T decode(const Json::Value& v) {
        if (v.type() != Json::intValue && v.type() != Json::uintValue)
            detail::mismatch(v, "integer");

        if constexpr (std::is_signed_v<T>) {
            if (!v.isInt64())
                throw ParseError("json: integer out of range");
            Json::Int64 x = v.asInt64();
            if constexpr (sizeof(T) < sizeof(Json::Int64)) {
                if (x < static_cast<Json::Int64>(std::numeric_limits<T>::min()) ||
                    x > static_cast<Json::Int64>(std::numeric_limits<T>::max()))
                    throw ParseError("json: integer out of range");
            }
            return static_cast<T>(x);
        } else {
            if (!v.isUInt64())
                throw ParseError("json: integer out of range");
            Json::UInt64 x = v.asUInt64();
            if constexpr (sizeof(T) < sizeof(Json::UInt64)) {
                if (x > static_cast<Json::UInt64>(std::numeric_limits<T>::max()))
                    throw ParseError("json: integer out of range");
            }
            return static_cast<T>(x);
        }
    }
};

/// finite numbers only: NaN and infinities have no JSON literal
template <typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Json::Value encode(T v) {
        if (!std::isfinite(v))
            throw EncodeError(std::string("json: unsupported value: ") +
                              (std::isnan(v) ? "NaN" : v > 0 ? "+Inf" : "-Inf"));
        return Json::Value(static_cast<double>(v));
    }

    static T decode(const Json::Value& v) {
        if (!v.isDouble())
            detail::mismatch(v, "number");
        double x = v.asDouble();
        if constexpr (sizeof(T) < sizeof(double)) {
            if (x > std::numeric_limits<T>::max() || x < std::numeric_limits<T>::lowest())
                throw ParseError("json: number out of range");
        }
        return static_cast<T>(x);
    }
};

template <>
struct Codec<std::string> {
    static Json::Value encode(const std::string& v) { return Json::Value(v); }
    static std::string decode(const Json::Value& v) {
        if (!v.isString())
            detail::mismatch(v, "string");
        return v.asString();
    }
};

/// arrays; `null` decodes as an empty vector
template <typename U>
struct Codec<std::vector<U>> {
    static Json::Value encode(const std::vector<U>& v) {
        Json::Value out(Json::arrayValue);
        for (const U& item : v)
            out.append(Codec<U>::encode(item));
        return out;
    }

    static std::vector<U> decode(const Json::Value& v) {
        std::vector<U> out;
        if (v.isNull())
            return out;
        if (!v.isArray())
            detail::mismatch(v, "array");

        out.reserve(v.size());
        for (Json::ArrayIndex i = 0; i < v.size(); i++) {
            try {
                out.push_back(Codec<U>::decode(v[i]));
            } catch (const ParseError& e) {
                detail::rethrowAt("index " + std::to_string(i), e);
            }
        }
        return out;
    }
};

/// `null` <-> empty optional
template <typename U>
struct Codec<std::optional<U>> {
    static Json::Value encode(const std::optional<U>& v) {
        return v ? Codec<U>::encode(*v) : Json::Value(Json::nullValue);
    }

    static std::optional<U> decode(const Json::Value& v) {
        if (v.isNull())
            return std::nullopt;
        return Codec<U>::decode(v);
    }
};

/// objects with string keys; `null` decodes as an empty map
template <typename U>
struct Codec<std::map<std::string, U>> {
    static Json::Value encode(const std::map<std::string, U>& v) {
        Json::Value out(Json::objectValue);
        for (const auto& [key, item] : v)
            out[key] = Codec<U>::encode(item);
        return out;
    }

    static std::map<std::string, U> decode(const Json::Value& v) {
        std::map<std::string, U> out;
        if (v.isNull())
            return out;
        if (!v.isObject())
            detail::mismatch(v, "object");

        for (const std::string& key : v.getMemberNames()) {
            try {
                out.emplace(key, Codec<U>::decode(v[key]));
            } catch (const ParseError& e) {
                detail::rethrowAt("key \"" + key + "\"", e);
            }
        }
        return out;
    }
};

/**
 * @brief Encodes @p v and serializes it.
 *
 * @throws EncodeError if @p v holds a value JSON cannot represent
 */
template <typename T>
std::string marshal(const T& v, WriteOptions opts = {}) {
    return write(Codec<T>::encode(v), opts);
}

/**
 * @brief Parses @p data and decodes it as a T.
 *
 * @throws ParseError on malformed JSON or a value that does not fit T
 */
template <typename T>
T unmarshal(std::string_view data, ReadOptions opts = {}) {
    return Codec<T>::decode(read(data, opts));
}

} // namespace util::json
