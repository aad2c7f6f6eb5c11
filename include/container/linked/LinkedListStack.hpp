#pragma once
#include <algorithm>
#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <IStack.hpp>           //  base stack interface
#include <Link.hpp>             //  node record
#include <LinkedOptions.hpp>    //  options
#include <JsonCodec.hpp>        //  element codec

namespace container {

/**
 * @brief LIFO stack backed by a singly linked chain of heap nodes.
 *
 * The sentinel's forward link is the top of the stack; push and pop only
 * ever touch the front of the chain.
 *
 * The JSON encoding lists the elements in push order (bottom first), so
 * `fromJson(toJson())` rebuilds the same stack.
 *
 * Not thread-safe.
 *
 * @tparam T   Type of elements stored in the stack.
 * @tparam Opt OptionsPack<> of LinkedListOption tags
 */
template <typename T, typename Opt = meta::EmptyOptions>
class LinkedListStack : public base::IStack<T> {
    static_assert(meta::is_options_pack_v<Opt>, "LinkedListStack: Opt must be a meta::OptionsPack");

    using Link = linked::Link<T>;
    using Node = linked::Node<T>;

    static constexpr bool PRETTY_JSON  = Opt::template has<LinkedListOption::PrettyJson>;
    static constexpr bool LENIENT_JSON = Opt::template has<LinkedListOption::LenientJson>;

public:
    LinkedListStack() noexcept = default;

    ~LinkedListStack() override {
        linked::unlinkAll(head_);
    }

    LinkedListStack(const LinkedListStack&) = delete;
    LinkedListStack& operator=(const LinkedListStack&) = delete;

    LinkedListStack(LinkedListStack&& other) noexcept
        : head_(std::move(other.head_.next)), size_(other.size_) {
        other.size_ = 0;
    }

    LinkedListStack& operator=(LinkedListStack&& other) noexcept {
        if (this != &other) {
            clear();
            head_.next = std::move(other.head_.next);
            size_ = other.size_;
            other.size_ = 0;
        }
        return *this;
    }

    size_t size() const override { return size_; }

    /**
     * @brief Pushes an element constructed in place from @p args.
     *
     * The value is built before the node takes over the old top, so a
     * throwing constructor leaves the stack untouched.
     */
    template <typename... Args>
    void emplace(Args&&... args) {
        auto node = std::make_unique<Node>(nullptr, std::forward<Args>(args)...);
        node->next = std::move(head_.next);
        head_.next = std::move(node);
        ++size_;
    }

    void push(const T& item) override { emplace(item); }
    void push(T&& item) override { emplace(std::move(item)); }

    /**
     * @brief Removes the top element.
     *
     * The removed node is detached from the rest of the chain before it
     * is destroyed.
     *
     * @param out receives the element, or T{} when the stack is empty
     * @return false if the stack was empty
     */
    bool pop(T& out) override {
        if (size_ == 0) {
            out = T{};
            return false;
        }

        out = std::move(head_.next->value);
        (void)linked::unlinkNext(head_);
        --size_;
        return true;
    }

    bool peek(T& out) const override {
        if (size_ == 0) {
            out = T{};
            return false;
        }
        out = head_.next->value;
        return true;
    }

    /// @brief elements in LIFO order (top first)
    std::vector<T> values() const override {
        std::vector<T> out;
        out.reserve(size_);
        for (const Node* p = head_.next.get(); p != nullptr; p = p->next.get())
            out.push_back(p->value);
        return out;
    }

    /// @brief elements in push order (bottom first)
    std::vector<T> listValues() const override {
        std::vector<T> out = values();
        std::reverse(out.begin(), out.end());
        return out;
    }

    void clear() override {
        [[maybe_unused]] size_t removed = linked::unlinkAll(head_);
        assert(removed == size_ && "LinkedListStack: length counter out of sync");
        size_ = 0;
    }

    std::string toString() const override {
        return name() + ": " + util::json::marshal(listValues());
    }

    std::string toJson() const override {
        return util::json::marshal(listValues(), {PRETTY_JSON});
    }

    /**
     * @brief Replaces the content with the elements of a JSON array.
     *
     * Elements are pushed in array order, so the last array element ends
     * up on top. The stack is left as it was if decoding fails.
     *
     * @throws util::json::ParseError
     */
    void fromJson(std::string_view data) override {
        std::vector<T> items = util::json::unmarshal<std::vector<T>>(data, {LENIENT_JSON});

        LinkedListStack scratch;
        for (T& item : items)
            scratch.push(std::move(item));
        *this = std::move(scratch);
    }

    /// @brief canonical name of the container
    static std::string name() {
        return "LinkedListStack";
    }

protected:
    /// @brief sentinel link, its successor is the top
    const Link& sentinel() const noexcept { return head_; }

private:
    Link head_;
    size_t size_{0};
};

} // namespace container
