/**
 * @file ContainerTest.cpp
 * @brief Typed GoogleTest suite for behaviour shared by every container.
 *
 * Each container is driven through a tiny adapter so the same checks run
 * on queues and stacks: length accounting, peek/remove agreement, clear,
 * JSON round trip, failure atomicity and the base-interface entry points
 * (`IContainer`, `operator<<`).
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>
#include <LinkedListQueue.hpp>
#include <LinkedListStack.hpp>

using container::LinkedListQueue;
using container::LinkedListStack;

// ---- List of container implementations to test ----
typedef ::testing::Types<
    LinkedListQueue<int>,
    LinkedListStack<int>,
    LinkedListQueue<std::string>,
    LinkedListStack<std::string>
> ContainerTypes;

// ---- Fixture ----
template <typename C>
class ContainerTest : public ::testing::Test {
protected:
    using T = typename C::value_type;
    static constexpr bool IS_QUEUE = std::is_base_of_v<base::IQueue<T>, C>;

    static T make(int i) {
        if constexpr (std::is_same_v<T, std::string>) {
            return "v" + std::to_string(i);
        } else {
            return static_cast<T>(i);
        }
    }

    void insert(const T& v) {
        if constexpr (IS_QUEUE) {
            c.enqueue(v);
        } else {
            c.push(v);
        }
    }

    bool remove(T& out) {
        if constexpr (IS_QUEUE) {
            return c.dequeue(out);
        } else {
            return c.pop(out);
        }
    }

    /// the order in which the JSON encoding lists the elements
    std::vector<T> wireOrder() const {
        if constexpr (IS_QUEUE) {
            return c.values();
        } else {
            return c.listValues();
        }
    }

    C c;
};
TYPED_TEST_SUITE(ContainerTest, ContainerTypes);

// ------------------------------------------------
// Length accounting
// ------------------------------------------------

TYPED_TEST(ContainerTest, LengthTracksSuccessfulOperations) {
    using T = typename TestFixture::T;
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> op(0, 2); // 0,1:insert 2:remove

    size_t expected = 0;
    T out{};
    for (int i = 0; i < 5000; i++) {
        if (op(rng) < 2) {
            this->insert(TestFixture::make(i));
            ++expected;
        } else {
            bool ok = this->remove(out);
            EXPECT_EQ(ok, expected > 0);
            if (ok)
                --expected;
        }
        ASSERT_EQ(this->c.size(), expected);
        ASSERT_EQ(this->c.values().size(), expected);
    }
}

TYPED_TEST(ContainerTest, RemoveFromEmpty) {
    using T = typename TestFixture::T;
    T out = TestFixture::make(99);
    EXPECT_FALSE(this->remove(out)); // should not crash or succeed
    EXPECT_EQ(out, T{});
    EXPECT_EQ(this->c.size(), 0u);
}

TYPED_TEST(ContainerTest, PeekMatchesNextRemove) {
    using T = typename TestFixture::T;
    for (int i = 0; i < 6; i++)
        this->insert(TestFixture::make(i));

    T seen{};
    T out{};
    for (int i = 0; i < 7; i++) {
        bool peeked = this->c.peek(seen);
        bool removed = this->remove(out);
        EXPECT_EQ(peeked, removed);
        EXPECT_EQ(seen, out);
    }
}

// ------------------------------------------------
// Clear
// ------------------------------------------------

TYPED_TEST(ContainerTest, ClearThenReuse) {
    using T = typename TestFixture::T;
    for (int i = 0; i < 20; i++)
        this->insert(TestFixture::make(i));

    this->c.clear();
    EXPECT_EQ(this->c.size(), 0u);
    EXPECT_TRUE(this->c.values().empty());
    EXPECT_EQ(this->c.toJson(), "[]");

    this->insert(TestFixture::make(1));
    T out{};
    EXPECT_TRUE(this->remove(out));
    EXPECT_EQ(out, TestFixture::make(1));
    EXPECT_FALSE(this->remove(out));
}

// ------------------------------------------------
// JSON
// ------------------------------------------------

TYPED_TEST(ContainerTest, JsonRoundTrip) {
    for (int i = 0; i < 50; i++)
        this->insert(TestFixture::make(i));

    TypeParam copy;
    copy.fromJson(this->c.toJson());
    EXPECT_EQ(copy.values(), this->c.values());
    EXPECT_EQ(copy.toJson(), this->c.toJson());
}

TYPED_TEST(ContainerTest, JsonListsWireOrder) {
    using T = typename TestFixture::T;
    for (int i = 0; i < 4; i++)
        this->insert(TestFixture::make(i));

    std::vector<T> decoded = util::json::unmarshal<std::vector<T>>(this->c.toJson());
    EXPECT_EQ(decoded, this->wireOrder());

    // element 0 on the wire is the one inserted first
    EXPECT_EQ(decoded.front(), TestFixture::make(0));
}

TYPED_TEST(ContainerTest, NullClears) {
    this->insert(TestFixture::make(1));
    this->c.fromJson("null");
    EXPECT_EQ(this->c.size(), 0u);
}

TYPED_TEST(ContainerTest, MidArrayFailureLeavesContainerUnchanged) {
    for (int i = 0; i < 3; i++)
        this->insert(TestFixture::make(i));
    std::string before = this->c.toJson();

    // the trailing `true` fits neither int nor string
    std::string bad = this->c.toJson();
    bad.insert(bad.size() - 1, ",true");
    EXPECT_THROW(this->c.fromJson(bad), util::json::ParseError);

    EXPECT_EQ(this->c.toJson(), before);
    EXPECT_EQ(this->c.size(), 3u);
}

// ------------------------------------------------
// Base interface
// ------------------------------------------------

TYPED_TEST(ContainerTest, UsableThroughBaseInterface) {
    using T = typename TestFixture::T;
    std::unique_ptr<base::IContainer<T>> p = std::make_unique<TypeParam>();
    p->fromJson(this->c.toJson());
    EXPECT_TRUE(p->empty());

    this->insert(TestFixture::make(3));
    p->fromJson(this->c.toJson());
    EXPECT_EQ(p->size(), 1u);
    EXPECT_EQ(p->values(), this->c.values());

    p->clear();
    EXPECT_TRUE(p->empty());
}

TYPED_TEST(ContainerTest, StreamsToString) {
    this->insert(TestFixture::make(1));
    this->insert(TestFixture::make(2));

    std::ostringstream os;
    os << this->c;
    EXPECT_EQ(os.str(), this->c.toString());
    EXPECT_EQ(os.str(), TypeParam::name() + ": " + this->c.toJson());
}

// ------------------------------------------------
// Queue / stack relationship
// ------------------------------------------------

TEST(QueueStackTest, QueueValuesAreReversedStackValues) {
    LinkedListQueue<int> q;
    LinkedListStack<int> s;
    for (int i = 0; i < 32; i++) {
        q.enqueue(i * i);
        s.push(i * i);
    }

    std::vector<int> reversed = s.values();
    std::reverse(reversed.begin(), reversed.end());
    EXPECT_EQ(q.values(), reversed);
    EXPECT_EQ(q.values(), s.listValues());
    EXPECT_EQ(q.toJson(), s.toJson());
}

TEST(QueueStackTest, JsonMovesBetweenContainers) {
    LinkedListQueue<std::string> q;
    q.enqueue("a");
    q.enqueue("b");

    // a stack fed from a queue's JSON pops in reverse dequeue order
    LinkedListStack<std::string> s;
    s.fromJson(q.toJson());
    std::string out;
    EXPECT_TRUE(s.pop(out));
    EXPECT_EQ(out, "b");
    EXPECT_TRUE(s.pop(out));
    EXPECT_EQ(out, "a");
}
