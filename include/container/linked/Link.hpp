#pragma once
#include <memory>
#include <utility>
#include <cstddef>

namespace container::linked {

template <typename T>
struct Node;

/// @brief Forward link of a singly linked chain.
///
/// Used on its own as the sentinel head of a container (it carries no
/// value, so `T` need not be default constructible), and as the base of
/// every value-bearing `Node`. Each link uniquely owns its successor.
template <typename T>
struct Link {
    std::unique_ptr<Node<T>> next;

    Link() = default;
    explicit Link(std::unique_ptr<Node<T>> n) noexcept : next(std::move(n)) {}

    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;
};

/// @brief Value-bearing node of a singly linked chain.
template <typename T>
struct Node : Link<T> {
    T value;

    template <typename... Args>
    explicit Node(std::unique_ptr<Node<T>> n, Args&&... args)
        : Link<T>(std::move(n)), value(std::forward<Args>(args)...) {}
};

/**
 * @brief Detaches and returns the first node after @p head.
 *
 * The returned node's forward link is already cleared, so dropping it
 * never reaches (or destroys) the rest of the chain.
 *
 * @warning @p head must have a successor
 */
template <typename T>
std::unique_ptr<Node<T>> unlinkNext(Link<T>& head) noexcept {
    std::unique_ptr<Node<T>> removed = std::move(head.next);
    head.next = std::move(removed->next);
    return removed;
}

/**
 * @brief Destroys every node after @p head, one at a time.
 *
 * Each node is detached from its successor before it is dropped: letting
 * the `unique_ptr` chain cascade would recurse once per node.
 *
 * @return number of nodes destroyed
 */
template <typename T>
size_t unlinkAll(Link<T>& head) noexcept {
    size_t count = 0;
    while (head.next) {
        (void)unlinkNext(head);
        ++count;
    }
    return count;
}

/**
 * @brief Counts the nodes reachable from @p head.
 *
 * O(n) walk used by debug checks and tests.
 */
template <typename T>
size_t chainLength(const Link<T>& head) noexcept {
    size_t count = 0;
    for (const Node<T>* p = head.next.get(); p != nullptr; p = p->next.get())
        ++count;
    return count;
}

} // namespace container::linked
