#pragma once

#include <cstddef>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered_map.hpp>

// combines std::hash of every element of a pair/tuple key
struct tuple_hasher {
    template <typename ... Ts>
    size_t operator()(const std::tuple<Ts...> &key) const {
        size_t h{};
        std::apply([&](const auto & ... vs) {
            (boost::hash_combine(h, std::hash<std::decay_t<decltype(vs)>>{}(vs)), ...);
        }, key);
        return h;
    }

    template <typename A, typename B>
    size_t operator()(const std::pair<A, B> &key) const {
        size_t h{};
        boost::hash_combine(h, std::hash<A>{}(key.first));
        boost::hash_combine(h, std::hash<B>{}(key.second));
        return h;
    }
};

// NOT thread-safe at all!
// grows monotonically; references to stored values are never invalidated
template <typename K, typename V, typename Hash = tuple_hasher>
class Cache {
    boost::unordered_map<K, V, Hash> table;

public:
    // compute() is invoked only on a miss, exactly once
    template <typename F>
    const V &get_or_compute(const K &key, F &&compute) {
        if (auto it = table.find(key); it != table.end())
            return it->second;
        return table.emplace(key, std::forward<F>(compute)()).first->second;
    }

    [[nodiscard]] bool contains(const K &key) const {
        return table.find(key) != table.end();
    }

    [[nodiscard]] size_t size() const { return table.size(); }

    // approximate footprint of the entries, for reporting
    [[nodiscard]] size_t bytes() const {
        return table.size() * (sizeof(K) + sizeof(V) + sizeof(void *))
            + table.bucket_count() * sizeof(void *);
    }
};
