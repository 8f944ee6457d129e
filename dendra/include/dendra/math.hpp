#pragma once

#include <cmath>
#include <limits>
#include <utility>

namespace dendra {
namespace math {

template <typename T>
T constexpr pi() {
    return T(3.1415926535897932384626433832795l);
}

template <typename T = float>
T constexpr infinity() {
    return std::numeric_limits<T>::infinity();
}

template <typename T>
T constexpr square(T a) {
    return a*a;
}

template <typename T>
T constexpr cube(T a) {
    return a*a*a;
}

// Lateral surface area of a cylinder with radius r and length L.
template <typename T>
T constexpr area_cylinder(T r, T L) {
    return T(2) * pi<T>() * r * L;
}

// Value of x/(exp(x)-1) with care taken to handle x=0 case
template <typename T>
inline
T exprelr(T x) {
    // If abs(x) is less than epsilon return 1, else calculate the result directly.
    return (T(1)==T(1)+x)? T(1): x/std::expm1(x);
}

// Exact solution after time dt of dx/dt = (x_inf - x)/tau, starting from x.
// tau = 0 relaxes to x_inf in a single step.
template <typename T>
inline
T exp_relax(T x, T x_inf, T tau, T dt) {
    return x_inf + (x - x_inf)*std::exp(-dt/tau);
}

} // namespace math
} // namespace dendra
