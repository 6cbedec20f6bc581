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

#ifndef __PULSEC_UTILS_SOURCE_LOC_H__
#define __PULSEC_UTILS_SOURCE_LOC_H__

#include "utils.h"

#include <ostream>

namespace PulseC {

// Call site of a user API.
// Use `SourceLoc loc=SourceLoc::current()` as the last (defaulted) parameter
// so that the location of the caller is recorded.
struct SourceLoc {
    const char *file = nullptr;
    unsigned line = 0;
    const char *func = nullptr;

    static SourceLoc current(const char *file=__builtin_FILE(),
                             unsigned line=__builtin_LINE(),
                             const char *func=__builtin_FUNCTION())
    {
        SourceLoc loc;
        loc.file = file;
        loc.line = line;
        loc.func = func;
        return loc;
    }
    bool valid() const
    {
        return file != nullptr;
    }
};

static inline std::ostream &operator<<(std::ostream &stm, const SourceLoc &loc)
{
    if (!loc.valid())
        return stm << "<unknown>";
    stm << loc.file << ":" << loc.line;
    if (loc.func && *loc.func)
        stm << " (" << loc.func << ")";
    return stm;
}

}

#endif
