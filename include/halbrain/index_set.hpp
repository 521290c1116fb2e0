#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

#include "halbrain/chain.hpp"
#include "halbrain/logging.hpp"
#include "halbrain/word.hpp"

namespace halbrain {

/**
 * Set with unique membership and uniform random sampling.
 *
 * Members are kept in a dense vector beside a hash index, so sampling is an
 * index draw over the current membership and does not depend on hash-table
 * iteration order. Iteration follows insertion order. Members are never
 * removed.
 */
template<typename T, typename Hash>
class IndexSet {
public:
    using const_iterator = typename std::vector<T>::const_iterator;

    IndexSet() = default;
    IndexSet(std::initializer_list<T> init) {
        for (const auto& v : init) add(v);
    }

    // Returns true if value was not already a member.
    bool add(const T& value) {
        auto [it, inserted] = index_.try_emplace(value, items_.size());
        if (inserted) {
            items_.push_back(value);
        }
        return inserted;
    }

    bool has(const T& value) const { return index_.find(value) != index_.end(); }

    size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }

    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }
    const std::vector<T>& items() const noexcept { return items_; }

    void merge(const IndexSet& other) {
        for (const auto& v : other.items_) add(v);
    }

    IndexSet union_with(const IndexSet& other) const {
        IndexSet result(*this);
        result.merge(other);
        return result;
    }

    // Sampling from an empty set means a brain invariant was broken.
    template<typename Rng>
    const T& choose_one(Rng& rng) const {
        if (items_.empty()) {
            LOG_FATAL("choose_one called on an empty set");
        }
        std::uniform_int_distribution<size_t> dist(0, items_.size() - 1);
        return items_[dist(rng)];
    }

    // Up to n distinct members, drawn without replacement.
    template<typename Rng>
    std::vector<T> choose(size_t n, Rng& rng) const {
        std::vector<size_t> order(items_.size());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;

        const size_t take = std::min(n, order.size());
        std::vector<T> result;
        result.reserve(take);
        for (size_t i = 0; i < take; ++i) {
            std::uniform_int_distribution<size_t> dist(i, order.size() - 1);
            std::swap(order[i], order[dist(rng)]);
            result.push_back(items_[order[i]]);
        }
        return result;
    }

    // Membership equality; insertion order is ignored.
    bool operator==(const IndexSet& other) const {
        if (size() != other.size()) return false;
        for (const auto& v : items_) {
            if (!other.has(v)) return false;
        }
        return true;
    }
    bool operator!=(const IndexSet& other) const { return !(*this == other); }

private:
    std::vector<T> items_;
    std::unordered_map<T, size_t, Hash> index_;
};

template<typename T, typename Hash>
std::ostream& operator<<(std::ostream& os, const IndexSet<T, Hash>& set) {
    os << '{';
    bool first = true;
    for (const auto& v : set) {
        if (!first) os << ", ";
        os << v;
        first = false;
    }
    return os << '}';
}

using WordSet = IndexSet<Word, WordHasher>;
using ChainSet = IndexSet<Chain, ChainHasher>;

} // namespace halbrain
