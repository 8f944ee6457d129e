#pragma once

/*
 * Presents a half-open interval [a,b) of integral values as a container.
 */

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace dendra {
namespace util {

template <typename I>
struct counter {
    using difference_type = std::ptrdiff_t;
    using value_type = I;
    using pointer = const I*;
    using reference = I;
    using iterator_category = std::random_access_iterator_tag;

    I v_ = I{};

    counter() = default;
    explicit counter(I v): v_(v) {}

    I operator*() const { return v_; }
    I operator[](difference_type n) const { return v_ + n; }

    counter& operator++() { ++v_; return *this; }
    counter operator++(int) { counter c(*this); ++v_; return c; }
    counter& operator--() { --v_; return *this; }
    counter operator--(int) { counter c(*this); --v_; return c; }

    counter& operator+=(difference_type n) { v_ += n; return *this; }
    counter& operator-=(difference_type n) { v_ -= n; return *this; }
    counter operator+(difference_type n) const { return counter(v_ + n); }
    counter operator-(difference_type n) const { return counter(v_ - n); }
    difference_type operator-(counter x) const { return difference_type(v_) - difference_type(x.v_); }

    bool operator==(counter x) const { return v_==x.v_; }
    bool operator!=(counter x) const { return v_!=x.v_; }
    bool operator<(counter x) const { return v_<x.v_; }
};

template <typename I>
struct span {
    using value_type = I;
    using iterator = counter<I>;
    using const_iterator = counter<I>;

    I left, right;

    span(I l, I r): left(l), right(r<l? l: r) {}

    iterator begin() const { return iterator(left); }
    iterator end() const { return iterator(right); }

    std::size_t size() const { return std::size_t(right-left); }
    bool empty() const { return left==right; }

    I operator[](std::size_t i) const { return I(left+i); }
    I front() const { return left; }
    I back() const { return right-1; }
};

template <typename I, typename J>
span<std::common_type_t<I, J>> make_span(I left, J right) {
    return span<std::common_type_t<I, J>>(left, right);
}

template <typename I, typename J>
span<std::common_type_t<I, J>> make_span(std::pair<I, J> interval) {
    return span<std::common_type_t<I, J>>(interval.first, interval.second);
}

template <typename I>
span<I> make_span(I right) {
    return span<I>(I{}, right);
}

template <typename Seq>
auto count_along(const Seq& s) {
    return util::make_span(std::size(s));
}

} // namespace util
} // namespace dendra
