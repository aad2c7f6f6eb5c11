// ==========================
// Base Container Interface
// ==========================

#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace base {

/// @brief Common contract of the sequence containers.
///
/// Covers what every container offers regardless of its access
/// discipline: size queries, a bulk copy of the elements, clearing,
/// a text rendering and JSON round-tripping.
///
/// @tparam T The element type.
template <typename T>
class IContainer {
public:
    using value_type = T;

    /// @brief Virtual destructor to allow cleanup through base pointer.
    virtual ~IContainer() = default;

    /// @brief Returns the current number of elements. O(1).
    virtual size_t size() const = 0;

    /// @brief Returns true if the container holds no element.
    bool empty() const { return size() == 0; }

    /// @brief Returns a copy of all elements in the container's natural
    /// removal order.
    ///
    /// The returned vector is independent of the container: later
    /// mutations do not affect it.
    virtual std::vector<T> values() const = 0;

    /// @brief Removes all elements.
    virtual void clear() = 0;

    /// @brief Returns a human readable rendering, `<Name>: <json>`.
    ///
    /// @throws util::json::EncodeError as toJson().
    virtual std::string toString() const = 0;

    /// @brief Returns the JSON array encoding of the container.
    ///
    /// @throws util::json::EncodeError if an element has no JSON form
    /// (a NaN or infinite floating-point value).
    virtual std::string toJson() const = 0;

    /// @brief Replaces the content with the elements of a JSON array.
    ///
    /// @throws util::json::ParseError if @p data is not a JSON array of T.
    /// The container is left unchanged on failure.
    virtual void fromJson(std::string_view data) = 0;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const IContainer<T>& c) {
    return os << c.toString();
}

}   //namespace base
