#pragma once

/// @file union_find.hpp
/// @brief Disjoint-set forest used to merge connection points into nets

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

namespace gatesim {

/// Union-find over dense indices 0..size-1 with path halving and union by size
class UnionFind {
  public:
    explicit UnionFind(size_t size = 0) { resize(size); }

    /// Grows the forest; new indices start as singleton sets
    void resize(size_t size) {
        size_t old = parent_.size();
        parent_.resize(size);
        size_.resize(size, 1);
        std::iota(parent_.begin() + static_cast<std::ptrdiff_t>(old), parent_.end(), old);
    }

    /// Adds a singleton set and returns its index
    size_t add() {
        resize(parent_.size() + 1);
        return parent_.size() - 1;
    }

    [[nodiscard]] size_t size() const { return parent_.size(); }

    [[nodiscard]] size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    /// Merges the sets containing a and b. Returns false if already joined.
    bool unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) {
            return false;
        }
        if (size_[a] < size_[b]) {
            std::swap(a, b);
        }
        parent_[b] = a;
        size_[a] += size_[b];
        return true;
    }

  private:
    std::vector<size_t> parent_;
    std::vector<size_t> size_;
};

} // namespace gatesim
