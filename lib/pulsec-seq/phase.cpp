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

#include "phase.h"
#include "error.h"
#include "node.h"

#include <pulsec-utils/log.h>

#include <sstream>

namespace PulseC::Seq {

PULSEC_EXPORT() const char *phase_name(Phase phase)
{
    switch (phase) {
    case Phase::AddDevices:
        return "ADD_DEVICES";
    case Phase::EstablishCommonLimits:
        return "ESTABLISH_COMMON_LIMITS";
    case Phase::EstablishInitialAttributes:
        return "ESTABLISH_INITIAL_ATTRIBUTES";
    case Phase::AddInstructions:
        return "ADD_INSTRUCTIONS";
    case Phase::ConvertTiming:
        return "CONVERT_TIMING";
    case Phase::CheckInstructionsValid:
        return "CHECK_INSTRUCTIONS_VALID";
    default:
        return "UNKNOWN";
    }
}

PULSEC_EXPORT() const char *op_name(Op op)
{
    switch (op) {
    case Op::AddDevice:
        return "add_device";
    case Op::ConfigureDevice:
        return "configure";
    case Op::Start:
        return "start";
    case Op::Stop:
        return "stop";
    case Op::EstablishCommonLimits:
        return "establish_common_limits";
    case Op::EstablishInitialAttributes:
        return "establish_initial_attributes";
    case Op::AddInstruction:
        return "add_instruction";
    case Op::ConvertTiming:
        return "convert_timing";
    case Op::CheckInstructionsValid:
        return "check_instructions_valid";
    default:
        return "unknown";
    }
}

namespace {

constexpr uint8_t on(NodeRef::Type type)
{
    return uint8_t(1 << unsigned(type));
}

constexpr uint8_t on_tree = on(NodeRef::Type::Shot) | on(NodeRef::Type::Device);

// Indexed by `Op`.
const OpInfo op_infos[] = {
    {Phase::AddDevices, false, 0}, // AddDevice
    {Phase::AddDevices, false, 0}, // ConfigureDevice
    {Phase::AddDevices, false, 0}, // Start
    {Phase::AddInstructions, false, 0}, // Stop
    {Phase::EstablishCommonLimits, true, on_tree},
    {Phase::EstablishInitialAttributes, true, on_tree},
    {Phase::AddInstructions, false, 0}, // AddInstruction
    {Phase::ConvertTiming, true, on(NodeRef::Type::Instruction)},
    {Phase::CheckInstructionsValid, true, on_tree},
};

static_assert(sizeof(op_infos) / sizeof(op_infos[0]) == size_t(Op::_Max));

}

PULSEC_EXPORT() const OpInfo &op_info(Op op)
{
    assert(op < Op::_Max);
    return op_infos[(int)op];
}

PULSEC_EXPORT() void CompilationContext::check_phase(const Node &node, Op op) const
{
    auto &info = op_info(op);
    if (likely(info.phase == m_phase))
        return;
    std::ostringstream stm;
    stm << node.describe() << "." << op_name(op) << "() cannot be called in phase "
        << m_phase << " (only in " << info.phase << ")";
    throw WrongPhaseError(node.ref(), stm.str());
}

PULSEC_EXPORT() void CompilationContext::enter(const Node &node, Op op)
{
    check_phase(node, op);
    if (!op_info(op).exactly_once)
        return;
    if (likely(m_called.insert(key(node.ref(), op)).second))
        return;
    std::ostringstream stm;
    stm << node.describe() << " has already had " << op_name(op)
        << "() called once in phase " << m_phase;
    throw AlreadyCalledError(node.ref(), stm.str());
}

PULSEC_EXPORT() bool CompilationContext::called(NodeRef node, Op op) const
{
    return m_called.count(key(node, op)) != 0;
}

PULSEC_EXPORT() void CompilationContext::check_required(const Node &node) const
{
    auto ref = node.ref();
    for (uint8_t i = 0; i < uint8_t(Op::_Max); i++) {
        auto op = Op(i);
        auto &info = op_info(op);
        if (info.phase != m_phase || !info.exactly_once || !info.required(ref.type))
            continue;
        if (called(ref, op))
            continue;
        std::ostringstream stm;
        stm << node.describe() << " has not had " << op_name(op)
            << "() called by the end of phase " << m_phase;
        throw NotCalledError(ref, stm.str());
    }
}

PULSEC_EXPORT() void CompilationContext::advance(const Node &shot)
{
    if (is_last()) {
        std::ostringstream stm;
        stm << shot.describe() << " cannot advance past the last phase " << m_phase;
        throw WrongPhaseError(shot.ref(), stm.str());
    }
    auto next = Phase(uint8_t(m_phase) + 1);
    Log::debug("%s: %s -> %s\n", shot.str().c_str(), phase_name(m_phase),
               phase_name(next));
    m_phase = next;
}

}
