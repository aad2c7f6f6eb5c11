#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <IQueue.hpp>
#include <IStack.hpp>
#include <JsonCodec.hpp>

namespace bench {

static constexpr size_t NSEC_IN_SEC = 1'000'000'000ull;

struct BenchItem {  //payload carried by the containers
    uint64_t value;
};

}   //bench namespace

//containers need a JSON codec for their element type
namespace util::json {
template <>
struct Codec<bench::BenchItem> {
    static Json::Value encode(const bench::BenchItem& item) {
        return Codec<uint64_t>::encode(item.value);
    }
    static bench::BenchItem decode(const Json::Value& v) {
        return bench::BenchItem{Codec<uint64_t>::decode(v)};
    }
};
}   //namespace util::json

namespace bench {

/**
 * @brief parses a strictly positive decimal count from the command line
 *
 * Only digits are accepted, so signs, whitespace and trailing garbage are
 * rejected instead of being wrapped or skipped by std::stoull.
 *
 * @return false if @p arg is not a count in [1, SIZE_MAX]
 */
inline bool parseCount(const std::string& arg, size_t& out) {
    if (arg.empty() || arg.find_first_not_of("0123456789") != std::string::npos)
        return false;
    unsigned long long v;
    try {
        v = std::stoull(arg);
    } catch (const std::out_of_range&) {
        return false;
    }
    if (v == 0 || v > std::numeric_limits<size_t>::max())
        return false;
    out = static_cast<size_t>(v);
    return true;
}

/**
 * @brief inserts one item, dispatching on the container discipline
 */
template<typename C>
inline void insert(C& c, const BenchItem& item) {
    if constexpr (std::is_base_of_v<base::IQueue<BenchItem>, C>) {
        c.enqueue(item);
    } else {
        static_assert(std::is_base_of_v<base::IStack<BenchItem>, C>,
                      "bench: container must be a queue or a stack");
        c.push(item);
    }
}

/**
 * @brief removes one item, dispatching on the container discipline
 */
template<typename C>
inline bool remove(C& c, BenchItem& out) {
    if constexpr (std::is_base_of_v<base::IQueue<BenchItem>, C>) {
        return c.dequeue(out);
    } else {
        return c.pop(out);
    }
}

/**
 * @brief runs a fill/drain workload on a fresh container
 *
 * Inserts @p ops items, then removes them all. Each insert and each
 * remove counts as one operation.
 *
 * @return operations per second, or a negative value if the container
 * did not hand back every item it was given
 */
template<typename C>
double benchmark(size_t ops) {
    using namespace std::chrono;

    C container;
    BenchItem out{0};
    uint64_t checksum = 0;

    auto start = high_resolution_clock::now();

    for (size_t i = 0; i < ops; i++) {
        insert(container, BenchItem{i});
    }
    size_t drained = 0;
    while (remove(container, out)) {
        checksum += out.value;
        drained++;
    }

    auto end = high_resolution_clock::now();

    //every item must come back exactly once
    uint64_t expected = ops == 0 ? 0 : static_cast<uint64_t>(ops) * (ops - 1) / 2;
    if (drained != ops || checksum != expected) {
        std::cerr << "[bench] " << C::name() << ": drained " << drained << " of " << ops << " items\n";
        return -1.0;
    }

    std::chrono::nanoseconds deltaTime = end - start;
    if (deltaTime.count() == 0)
        return 0.0;
    return static_cast<long double>(2 * ops * NSEC_IN_SEC) / deltaTime.count();
}

}   //bench namespace
