/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#ifndef _PULSEC_UTILS_NUMBER_H_
#define _PULSEC_UTILS_NUMBER_H_

#include "utils.h"

#include <stdint.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>

namespace PulseC {

template<typename T1, typename T2>
static inline constexpr auto
max(T1 &&a, T2 &&b)
{
    return (a > b) ? a : b;
}

template<typename First, typename... Rest>
static inline constexpr auto
max(First &&first, Rest&&... rest)
{
    return max(std::forward<First>(first),
               max(std::forward<Rest>(rest)...));
}

// Whether `v` is finite and converts to `int64_t` without overflow.
static inline bool
fits_int64(double v)
{
    // 2^63 is exact in double and is the first value past the range.
    return std::isfinite(v) && std::abs(v) < 9223372036854775808.0;
}

// Ratio `value / unit` as an integer count, rounded up.
// The ratio must satisfy `fits_int64`.
// Ratios within a relative `slack` of an integer are treated as that integer
// so that values that are nominally an exact multiple of `unit`
// (e.g. `1.2e-6 / 1e-7`) are not bumped to the next count by rounding noise.
static inline int64_t
ceil_div(double value, double unit, double slack=1e-9)
{
    double n = value / unit;
    double r = std::nearbyint(n);
    if (std::abs(n - r) <= slack * max(1.0, std::abs(r)))
        return int64_t(r);
    return int64_t(std::ceil(n));
}

}

#endif
