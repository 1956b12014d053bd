/**
 * Open Space Program
 * Copyright © 2019-2024 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#pragma once

#include <bit>
#include <cstdint>
#include <type_traits>

namespace udlod::math
{

/**
 * @return Integer 2^exponent
 */
template <typename INT_T>
constexpr INT_T int_2pow(int exponent) noexcept
{
    static_assert(std::is_integral<INT_T>::value, "Integer required");
    return INT_T(1) << exponent;
}

/**
 * @return true if value is power of two
 */
template <typename INT_T>
constexpr bool is_power_of_2(INT_T value) noexcept
{
    static_assert(std::is_integral_v<INT_T>, "Integer required");
    // Test to see if the value contains more than 1 set bit
    return !(value == 0) && !(value & (value - 1));
}

/**
 * @return Exponent of a power of two, eg: 1 -> 0, 8 -> 3
 */
template <typename UINT_T>
constexpr int log2_of_pow2(UINT_T value) noexcept
{
    static_assert(std::is_unsigned_v<UINT_T>, "Unsigned integer required");
    return std::countr_zero(value);
}

/**
 * @brief Round up to the next power of two
 *
 * @param value [in] Value to round up, must not exceed the largest power of two UINT_T can hold
 */
template <typename UINT_T>
constexpr UINT_T ceil_2pow(UINT_T value) noexcept
{
    static_assert(std::is_unsigned_v<UINT_T>, "Unsigned integer required");
    return std::bit_ceil(value);
}

/**
 * @return ceil(numerator / denominator) for unsigned integers
 */
template <typename UINT_T>
constexpr UINT_T div_ceil(UINT_T numerator, UINT_T denominator) noexcept
{
    static_assert(std::is_unsigned_v<UINT_T>, "Unsigned integer required");
    return numerator / denominator + UINT_T(numerator % denominator != 0);
}

} // namespace udlod::math
