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

#ifndef __PULSEC_SEQ_VALIDATION_H__
#define __PULSEC_SEQ_VALIDATION_H__

#include "tree.h"

#include <pulsec-utils/source_loc.h>

#include <ostream>
#include <string>
#include <vector>

namespace PulseC::Seq {

class Node;

struct Violation {
    enum class Code : uint8_t {
        // Two ramps on the same output overlap.
        Overlap,
        // Two point instructions on the same output at the same tick.
        SameTick,
        // Instruction scheduled before its clock is responsive after a wait.
        NegativeTime,
        NegativeDuration,
        // Ramp duration not a whole number of sample periods.
        PartialSample,
        // Ramp still running when the next wait happens.
        CrossesWait,
        // Instruction still running when the shot stops.
        AfterStop,
        // Two ticks on a clock line closer than its minimum period.
        TickTooShort,
        // Ramp sampled faster than its clock line allows.
        SampleTooFast,
        // Clock period too short to hold the trigger pulse required by its devices.
        ClockTriggerTooShort,
        // Trigger pulse shorter than the triggered devices require.
        TriggerTooShort,
        // More than one value for a static output.
        MultipleStatic,
    };
    Code code;
    NodeRef node;
    std::string message;
    SourceLoc loc;
};

const char *code_name(Violation::Code code);

std::ostream &operator<<(std::ostream &stm, const Violation &violation);

// The list of every violation found by the validation pass.
class ValidationReport {
public:
    void add(Violation::Code code, const Node &node, std::string message);
    bool empty() const
    {
        return m_violations.empty();
    }
    size_t size() const
    {
        return m_violations.size();
    }
    const std::vector<Violation> &violations() const
    {
        return m_violations;
    }
    size_t count(Violation::Code code) const;
    void clear()
    {
        m_violations.clear();
    }
    void print(std::ostream &stm) const;

private:
    std::vector<Violation> m_violations;
};

static inline std::ostream &operator<<(std::ostream &stm, const ValidationReport &report)
{
    report.print(stm);
    return stm;
}

}

#endif
