#pragma once

/*
 * Convenience functions, structs used across
 * more than one unit test.
 */

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <dendra/cell_description.hpp>
#include <dendra/common_types.hpp>
#include <dendra/math.hpp>

namespace testing {

// Google Test assertion-returning predicates:

// Assert two sequences compare equal element by element.

template <typename Seq1, typename Seq2>
::testing::AssertionResult seq_eq(Seq1&& seq1, Seq2&& seq2) {
    using std::begin;
    using std::end;

    auto i1 = begin(seq1);
    auto i2 = begin(seq2);

    auto e1 = end(seq1);
    auto e2 = end(seq2);

    for (std::size_t j = 0; i1!=e1 && i2!=e2; ++i1, ++i2, ++j) {
        auto v1 = *i1;
        auto v2 = *i2;

        if (!(v1==v2)) {
            return ::testing::AssertionFailure() << "values " << v1 << " and " << v2 << " differ at index " << j;
        }
    }

    if (i1!=e1 || i2!=e2) {
        return ::testing::AssertionFailure() << "sequences differ in length";
    }
    return ::testing::AssertionSuccess();
}

// Assert two floating point values are within a relative tolerance.

inline ::testing::AssertionResult near_relative(double a, double b, double relerr) {
    double tol = relerr*std::max(std::abs(a), std::abs(b));
    if (std::abs(a-b)>tol) {
        return ::testing::AssertionFailure() << "relative error between floating point numbers " << a << " and " << b << " exceeds tolerance " << relerr;
    }
    return ::testing::AssertionSuccess();
}

} // namespace testing

// Membrane areas [µm²] of the compartments of a network, from its
// radius and length parameters.
template <typename Net>
std::vector<double> membrane_areas(const Net& net) {
    auto r = net.param("radius");
    auto l = net.param("length");
    std::vector<double> a(r.size());
    for (std::size_t i = 0; i<a.size(); ++i) {
        a[i] = dendra::math::area_cylinder(r[i], l[i]);
    }
    return a;
}

// A cell whose branches form an unbranched chain: 0 <- 1 <- 2 ...
inline dendra::cell_description chain_cell(unsigned nbranch, unsigned nseg) {
    std::vector<dendra::fvm_index_type> parents;
    for (unsigned b = 0; b<nbranch; ++b) {
        parents.push_back(dendra::fvm_index_type(b)-1);
    }
    return dendra::cell_description(nseg, parents);
}
