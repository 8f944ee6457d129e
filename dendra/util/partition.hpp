#pragma once

/*
 * View a sequence of divisions d[0] <= d[1] <= ... <= d[n] as the n
 * half-open intervals [d[i], d[i+1]).
 */

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

#include <dendra/assert.hpp>

namespace dendra {
namespace util {

template <typename Divs>
class partition_range {
public:
    using index_type = typename Divs::value_type;
    using value_type = std::pair<index_type, index_type>;

    struct iterator {
        using difference_type = std::ptrdiff_t;
        using value_type = std::pair<index_type, index_type>;
        using pointer = const value_type*;
        using reference = value_type;
        using iterator_category = std::forward_iterator_tag;

        const Divs* divs;
        std::size_t i;

        value_type operator*() const { return {(*divs)[i], (*divs)[i+1]}; }
        iterator& operator++() { ++i; return *this; }
        iterator operator++(int) { iterator c(*this); ++i; return c; }
        bool operator==(const iterator& x) const { return i==x.i; }
        bool operator!=(const iterator& x) const { return i!=x.i; }
    };

    explicit partition_range(const Divs& divs): divs_(&divs) {}

    std::size_t size() const { return divs_->empty()? 0: divs_->size()-1; }
    bool empty() const { return size()==0; }

    value_type operator[](std::size_t i) const {
        dendra_assert(i+1<divs_->size());
        return {(*divs_)[i], (*divs_)[i+1]};
    }

    // Index of the interval containing x, or size() if none does.
    std::size_t index(index_type x) const {
        if (empty() || x<divs_->front() || x>=divs_->back()) return size();
        auto it = std::upper_bound(divs_->begin(), divs_->end(), x);
        return std::size_t(std::distance(divs_->begin(), it))-1;
    }

    iterator begin() const { return {divs_, 0}; }
    iterator end() const { return {divs_, size()}; }

private:
    const Divs* divs_;
};

template <typename Divs>
partition_range<Divs> partition_view(const Divs& divs) {
    return partition_range<Divs>(divs);
}

// Prefix sum of sizes in the form `[0, c[0], c[0]+c[1], ..., sum(c)]`.
template <typename Out, typename Sizes>
std::vector<Out> make_partition(const Sizes& sizes) {
    std::vector<Out> divs;
    divs.reserve(std::size(sizes)+1);
    Out total = 0;
    divs.push_back(total);
    for (const auto& s: sizes) {
        total += Out(s);
        divs.push_back(total);
    }
    return divs;
}

} // namespace util
} // namespace dendra
