// ==========================
// Base Queue Interface
// ==========================

#pragma once
#include <IContainer.hpp>

namespace base {

/// @brief FIFO queue interface.
///
/// Elements leave the queue in the order they entered it. `values()`
/// returns them in dequeue order (front first).
///
/// @tparam T The element type.
template <typename T>
class IQueue : public IContainer<T> {
public:
    /// @brief Virtual destructor to allow cleanup through base pointer.
    virtual ~IQueue() = default;

    // ==========================
    // Core Queue Operations
    // ==========================

    /// @brief Appends a copy of @p item at the back of the queue.
    virtual void enqueue(const T& item) = 0;

    /// @brief Appends @p item at the back of the queue.
    virtual void enqueue(T&& item) = 0;

    /// @brief Removes the front element.
    ///
    /// @param container Receives the removed element, or a
    ///        value-initialized T if the queue is empty.
    /// @return true if an element was removed, false if the queue is empty.
    virtual bool dequeue(T& container) = 0;

    /// @brief Copies the front element without removing it.
    ///
    /// @param container Receives the front element, or a
    ///        value-initialized T if the queue is empty.
    /// @return true if the queue is not empty.
    virtual bool peek(T& container) const = 0;
};

}   //namespace base
