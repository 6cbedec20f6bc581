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

#ifndef __PULSEC_SEQ_PHASE_H__
#define __PULSEC_SEQ_PHASE_H__

#include "tree.h"

#include <unordered_set>

namespace PulseC::Seq {

class Node;

enum class Phase : uint8_t {
    AddDevices,
    EstablishCommonLimits,
    EstablishInitialAttributes,
    AddInstructions,
    ConvertTiming,
    CheckInstructionsValid,
    _Max,
};

const char *phase_name(Phase phase);

static inline std::ostream &operator<<(std::ostream &stm, Phase phase)
{
    return stm << phase_name(phase);
}

// Operations whose legality depends on the phase.
enum class Op : uint8_t {
    AddDevice,
    ConfigureDevice,
    Start,
    Stop,
    EstablishCommonLimits,
    EstablishInitialAttributes,
    AddInstruction,
    ConvertTiming,
    CheckInstructionsValid,
    _Max,
};

const char *op_name(Op op);

struct OpInfo {
    Phase phase;
    bool exactly_once;
    // Bitmask of `1 << NodeRef::Type` for the nodes that must have had
    // the operation called on them before the phase is left.
    uint8_t required_on;
    bool required(NodeRef::Type type) const
    {
        return (required_on >> unsigned(type)) & 1;
    }
};

const OpInfo &op_info(Op op);

// Phase state and exactly-once bookkeeping of one shot.
class CompilationContext {
public:
    Phase phase() const
    {
        return m_phase;
    }
    // Throws `WrongPhaseError` if `op` is not legal in the current phase.
    void check_phase(const Node &node, Op op) const;
    // Check the phase and record the call.
    // Throws `AlreadyCalledError` on a repeated exactly-once operation.
    void enter(const Node &node, Op op);
    bool called(NodeRef node, Op op) const;
    // Throws `NotCalledError` if `node` is missing a required operation
    // of the current phase.
    void check_required(const Node &node) const;
    // Move to the next phase. The caller is responsible for checking
    // every node with `check_required` first.
    void advance(const Node &shot);
    bool is_last() const
    {
        return uint8_t(m_phase) + 1 >= uint8_t(Phase::_Max);
    }

private:
    static uint64_t key(NodeRef node, Op op)
    {
        return node.key() | (uint64_t(op) << 40);
    }

    Phase m_phase = Phase::AddDevices;
    std::unordered_set<uint64_t> m_called;
};

}

#endif
