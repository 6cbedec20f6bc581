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

#include "timing.h"

#include <pulsec-utils/number.h>

#include <cmath>
#include <limits>

namespace PulseC::Seq {

PULSEC_EXPORT() const char *rounding_name(Rounding rounding)
{
    switch (rounding) {
    case Rounding::Nearest:
        return "nearest";
    case Rounding::Up:
        return "up";
    default:
        return "unknown";
    }
}

PULSEC_EXPORT() bool parse_rounding(const std::string &name, Rounding *out)
{
    if (name == "nearest") {
        *out = Rounding::Nearest;
    }
    else if (name == "up") {
        *out = Rounding::Up;
    }
    else {
        return false;
    }
    return true;
}

PULSEC_EXPORT() Quantised to_ticks(double value, double timebase, Rounding rounding)
{
    if (timebase <= 0)
        return {0, 0};
    double ratio = value / timebase;
    if (!fits_int64(ratio))
        return {0, std::numeric_limits<double>::infinity()};
    int64_t ticks;
    if (rounding == Rounding::Up) {
        ticks = ceil_div(value, timebase);
    }
    else {
        ticks = int64_t(std::llround(ratio));
    }
    return {ticks, std::abs(ratio - double(ticks))};
}

}
