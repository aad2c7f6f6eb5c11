#pragma once
#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <IQueue.hpp>           //  base queue interface
#include <Link.hpp>             //  node record
#include <LinkedOptions.hpp>    //  options
#include <JsonCodec.hpp>        //  element codec

namespace container {

/**
 * @brief FIFO queue backed by a singly linked chain of heap nodes.
 *
 * The chain hangs off a sentinel link owned by value. `tail_` is a
 * non-owning pointer to the last node, or to the sentinel while the
 * queue is empty, which makes enqueue branch-free.
 *
 * Not thread-safe.
 *
 * @tparam T   Type of elements stored in the queue.
 * @tparam Opt OptionsPack<> of LinkedListOption tags
 */
template <typename T, typename Opt = meta::EmptyOptions>
class LinkedListQueue : public base::IQueue<T> {
    static_assert(meta::is_options_pack_v<Opt>, "LinkedListQueue: Opt must be a meta::OptionsPack");

    using Link = linked::Link<T>;
    using Node = linked::Node<T>;

    static constexpr bool PRETTY_JSON  = Opt::template has<LinkedListOption::PrettyJson>;
    static constexpr bool LENIENT_JSON = Opt::template has<LinkedListOption::LenientJson>;

public:
    LinkedListQueue() noexcept : tail_(&head_) {}

    ~LinkedListQueue() override {
        linked::unlinkAll(head_);
    }

    LinkedListQueue(const LinkedListQueue&) = delete;
    LinkedListQueue& operator=(const LinkedListQueue&) = delete;

    /**
     * @brief Takes over the chain of @p other in O(1).
     *
     * @p other is left empty with its tail back on its own sentinel.
     */
    LinkedListQueue(LinkedListQueue&& other) noexcept
        : head_(std::move(other.head_.next)),
          tail_(other.size_ != 0 ? other.tail_ : &head_),
          size_(other.size_) {
        other.tail_ = &other.head_;
        other.size_ = 0;
    }

    LinkedListQueue& operator=(LinkedListQueue&& other) noexcept {
        if (this != &other) {
            clear();
            head_.next = std::move(other.head_.next);
            tail_ = other.size_ != 0 ? other.tail_ : &head_;
            size_ = other.size_;
            other.tail_ = &other.head_;
            other.size_ = 0;
        }
        return *this;
    }

    size_t size() const override { return size_; }

    /**
     * @brief Appends an element constructed in place from @p args.
     *
     * The node is fully built before it is linked, so a throwing
     * constructor leaves the queue untouched.
     */
    template <typename... Args>
    void emplace(Args&&... args) {
        tail_->next = std::make_unique<Node>(nullptr, std::forward<Args>(args)...);
        tail_ = tail_->next.get();
        ++size_;
    }

    void enqueue(const T& item) override { emplace(item); }
    void enqueue(T&& item) override { emplace(std::move(item)); }

    /**
     * @brief Removes the front element.
     *
     * The removed node is detached from its successor before it is
     * destroyed. Dequeuing the last element puts the tail back on the
     * sentinel.
     *
     * @param out receives the element, or T{} when the queue is empty
     * @return false if the queue was empty
     */
    bool dequeue(T& out) override {
        if (size_ == 0) {
            out = T{};
            return false;
        }

        out = std::move(head_.next->value);
        (void)linked::unlinkNext(head_);

        if (--size_ == 0) {
            tail_ = &head_;
        }
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

    /// @brief elements in dequeue order (front first)
    std::vector<T> values() const override {
        std::vector<T> out;
        out.reserve(size_);
        for (const Node* p = head_.next.get(); p != nullptr; p = p->next.get())
            out.push_back(p->value);
        return out;
    }

    /**
     * @brief Removes all elements, unlinking every node before it is freed.
     */
    void clear() override {
        [[maybe_unused]] size_t removed = linked::unlinkAll(head_);
        assert(removed == size_ && "LinkedListQueue: length counter out of sync");
        tail_ = &head_;
        size_ = 0;
    }

    std::string toString() const override {
        return name() + ": " + util::json::marshal(values());
    }

    std::string toJson() const override {
        return util::json::marshal(values(), {PRETTY_JSON});
    }

    /**
     * @brief Replaces the content with the elements of a JSON array, in
     * array order (index 0 becomes the front).
     *
     * The whole array is decoded and linked into a scratch queue first;
     * on any failure this queue is left as it was.
     *
     * @throws util::json::ParseError
     */
    void fromJson(std::string_view data) override {
        std::vector<T> items = util::json::unmarshal<std::vector<T>>(data, {LENIENT_JSON});

        LinkedListQueue scratch;
        for (T& item : items)
            scratch.enqueue(std::move(item));
        *this = std::move(scratch);
    }

    /// @brief canonical name of the container
    static std::string name() {
        return "LinkedListQueue";
    }

protected:
    /// @brief sentinel link (never carries a value)
    const Link& sentinel() const noexcept { return head_; }

    /// @brief last node, or the sentinel when empty
    const Link* tailLink() const noexcept { return tail_; }

private:
    Link head_;
    Link* tail_;
    size_t size_{0};
};

} // namespace container
