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

#include "macros.h"

#ifndef __PULSEC_UTILS_UTILS_H__
#define __PULSEC_UTILS_UTILS_H__

#include <stdio.h>
#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <stdlib.h>

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace PulseC {

/**
 * Tell the compiler that \param val is likely to be \param exp.
 */
template<typename T1, typename T2>
static PULSEC_INLINE T1 expect(T1 val, T2 exp)
{
#ifdef __GNUC__
    return __builtin_expect(val, exp);
#else
    (void)exp;
    return val;
#endif
}

/**
 * Tell the compiler that \param x is likely to be true.
 */
template<typename T>
static PULSEC_INLINE bool likely(T x)
{
    return expect(bool(x), true);
}

/**
 * Tell the compiler that \param x is likely to be false.
 */
template<typename T>
static PULSEC_INLINE bool unlikely(T x)
{
    return expect(bool(x), false);
}

/**
 * Format any streamable object into a string.
 */
template<typename T>
static inline std::string to_string(const T &v)
{
    std::ostringstream stm;
    stm << v;
    return stm.str();
}

}

#endif
