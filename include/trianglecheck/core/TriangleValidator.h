#pragma once

#include "trianglecheck/core/ValidationError.h"

#include <llvm/Support/Error.h>

#include <type_traits>

namespace trianglecheck {

// Integer and floating-point types are side lengths; bool and character
// types are not.
template <typename T>
inline constexpr bool isSideType =
    std::is_arithmetic_v<T> &&
    !std::is_same_v<T, bool> &&
    !std::is_same_v<T, char> &&
    !std::is_same_v<T, signed char> &&
    !std::is_same_v<T, unsigned char> &&
    !std::is_same_v<T, wchar_t> &&
    !std::is_same_v<T, char8_t> &&
    !std::is_same_v<T, char16_t> &&
    !std::is_same_v<T, char32_t>;

namespace detail {

// False for zero, negatives and NaN.
template <typename T>
constexpr bool isPositive(T side) {
    return side > T(0);
}

// x + y > z for positive sides. Integers compare through subtraction so
// that large sides cannot overflow; floating-point uses plain addition.
template <typename T>
constexpr bool sumExceeds(T x, T y, T z) {
    if constexpr (std::is_integral_v<T>)
        return y >= z || x > z - y;
    else
        return x + y > z;
}

// Type the inequality is evaluated in. Integers mixed with floating-point
// sides widen to at least double, since float cannot represent every
// integer above 2^24.
template <typename A, typename B, typename C>
using SumType = std::conditional_t<
    std::is_floating_point_v<std::common_type_t<A, B, C>> &&
        (std::is_integral_v<A> || std::is_integral_v<B> ||
         std::is_integral_v<C>),
    std::common_type_t<A, B, C, double>,
    std::common_type_t<A, B, C>>;

} // namespace detail

// Decides whether three side lengths form a non-degenerate triangle.
//
// Every side must be strictly positive, otherwise an InvalidValue
// ValidationError naming the first offending side is returned. Positivity is
// checked in each argument's own type, before conversion to the common type
// in which the triangle inequality is evaluated (at least double when integer
// and floating-point sides are mixed). No tolerance is applied to
// floating-point sums.
template <typename A, typename B, typename C>
llvm::Expected<bool> canFormTriangle(A a, B b, C c) {
    static_assert(isSideType<A> && isSideType<B> && isSideType<C>,
                  "side lengths must be integer or floating-point values");

    if (!detail::isPositive(a))
        return llvm::make_error<ValidationError>(
            ValidationErrorKind::InvalidValue, 0);
    if (!detail::isPositive(b))
        return llvm::make_error<ValidationError>(
            ValidationErrorKind::InvalidValue, 1);
    if (!detail::isPositive(c))
        return llvm::make_error<ValidationError>(
            ValidationErrorKind::InvalidValue, 2);

    using T = detail::SumType<A, B, C>;
    const T x = static_cast<T>(a);
    const T y = static_cast<T>(b);
    const T z = static_cast<T>(c);

    return detail::sumExceeds(x, y, z) &&
           detail::sumExceeds(x, z, y) &&
           detail::sumExceeds(y, z, x);
}

} // namespace trianglecheck
