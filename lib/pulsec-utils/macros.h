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

#ifndef _PULSEC_UTILS_MACROS_H_
#define _PULSEC_UTILS_MACROS_H_

/**
 * \file macros.h
 * \brief Visibility and inlining macros shared by the pulsec libraries.
 */

/**
 * \brief always inline the function.
 *
 * Should only be used for small functions
 */
#define PULSEC_INLINE __attribute__((always_inline)) inline

/**
 * \brief Export symbol.
 *
 * Used on definitions (`PULSEC_EXPORT() void f()`) and, through
 * `PULSEC_EXPORT_`, on class declarations.
 */
#if defined(_WIN32) || defined(_WIN64)
#  define PULSEC_EXPORT(...) __declspec(dllexport)
#else
#  define PULSEC_EXPORT(...) __attribute__((visibility("default")))
#endif
#define PULSEC_EXPORT_ PULSEC_EXPORT()

#define PULSEC_RET_IF_FAIL(exp, ...) do {               \
        if (!PulseC::likely(exp)) {                     \
            return __VA_ARGS__;                         \
        }                                               \
    } while (0)

#endif
