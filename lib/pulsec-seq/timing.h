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

#ifndef __PULSEC_SEQ_TIMING_H__
#define __PULSEC_SEQ_TIMING_H__

#include <pulsec-utils/utils.h>

#include <cmath>
#include <ostream>
#include <string>

namespace PulseC::Seq {

enum class Rounding : uint8_t {
    // Closest tick, rejected if further than the tolerance.
    Nearest,
    // First tick at or after the requested time.
    // Only rejected when the tick count is out of range.
    Up,
};

const char *rounding_name(Rounding rounding);
// Returns `false` if `name` is not a valid rounding name.
bool parse_rounding(const std::string &name, Rounding *out);

static inline std::ostream &operator<<(std::ostream &stm, Rounding rounding)
{
    return stm << rounding_name(rounding);
}

struct Quantised {
    int64_t ticks;
    // Distance between the requested time and the tick, in units of the timebase.
    double error;
};

// Convert `value` to a whole number of `timebase`.
// A zero timebase (no clock) maps everything to tick 0 with no error.
// A ratio that does not fit in `int64_t` gives tick 0 with an infinite error.
Quantised to_ticks(double value, double timebase, Rounding rounding);

// Whether the result of `to_ticks` is acceptable with the tolerance
// (a fraction of the timebase).
static inline bool within_tolerance(const Quantised &q, Rounding rounding,
                                    double tolerance)
{
    if (std::isinf(q.error))
        return false;
    return rounding == Rounding::Up || q.error <= tolerance;
}

}

#endif
