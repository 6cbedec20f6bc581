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

#include "validation.h"
#include "node.h"

#include <algorithm>

namespace PulseC::Seq {

PULSEC_EXPORT() const char *code_name(Violation::Code code)
{
    switch (code) {
    case Violation::Code::Overlap:
        return "Overlap";
    case Violation::Code::SameTick:
        return "SameTick";
    case Violation::Code::NegativeTime:
        return "NegativeTime";
    case Violation::Code::NegativeDuration:
        return "NegativeDuration";
    case Violation::Code::PartialSample:
        return "PartialSample";
    case Violation::Code::CrossesWait:
        return "CrossesWait";
    case Violation::Code::AfterStop:
        return "AfterStop";
    case Violation::Code::TickTooShort:
        return "TickTooShort";
    case Violation::Code::SampleTooFast:
        return "SampleTooFast";
    case Violation::Code::ClockTriggerTooShort:
        return "ClockTriggerTooShort";
    case Violation::Code::TriggerTooShort:
        return "TriggerTooShort";
    case Violation::Code::MultipleStatic:
        return "MultipleStatic";
    default:
        return "Unknown";
    }
}

PULSEC_EXPORT() std::ostream &operator<<(std::ostream &stm, const Violation &violation)
{
    return stm << code_name(violation.code) << ": " << violation.message
               << "\n    created at " << violation.loc;
}

PULSEC_EXPORT() void ValidationReport::add(Violation::Code code, const Node &node,
                                           std::string message)
{
    m_violations.push_back(Violation{code, node.ref(), std::move(message), node.loc()});
}

PULSEC_EXPORT() size_t ValidationReport::count(Violation::Code code) const
{
    return std::count_if(m_violations.begin(), m_violations.end(),
                         [&] (auto &v) { return v.code == code; });
}

PULSEC_EXPORT() void ValidationReport::print(std::ostream &stm) const
{
    stm << m_violations.size() << " violation(s) found";
    for (auto &violation: m_violations)
        stm << "\n  " << violation;
}

}
