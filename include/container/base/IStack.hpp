// ==========================
// Base Stack Interface
// ==========================

#pragma once
#include <IContainer.hpp>

namespace base {

/// @brief LIFO stack interface.
///
/// `values()` returns the elements top first; `listValues()` returns
/// them in push order (bottom first), which is the order used by the
/// JSON encoding.
///
/// @tparam T The element type.
template <typename T>
class IStack : public IContainer<T> {
public:
    /// @brief Virtual destructor to allow cleanup through base pointer.
    virtual ~IStack() = default;

    // ==========================
    // Core Stack Operations
    // ==========================

    /// @brief Pushes a copy of @p item on top of the stack.
    virtual void push(const T& item) = 0;

    /// @brief Pushes @p item on top of the stack.
    virtual void push(T&& item) = 0;

    /// @brief Removes the top element.
    ///
    /// @param container Receives the removed element, or a
    ///        value-initialized T if the stack is empty.
    /// @return true if an element was removed, false if the stack is empty.
    virtual bool pop(T& container) = 0;

    /// @brief Copies the top element without removing it.
    ///
    /// @return true if the stack is not empty.
    virtual bool peek(T& container) const = 0;

    /// @brief Returns a copy of all elements in push order (earliest first).
    virtual std::vector<T> listValues() const = 0;
};

}   //namespace base
