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

#ifndef __PULSEC_SEQ_TREE_H__
#define __PULSEC_SEQ_TREE_H__

#include <pulsec-utils/utils.h>

#include <initializer_list>
#include <ostream>
#include <string>

namespace PulseC::Seq {

enum class DeviceKind : uint8_t {
    Device,
    StaticDevice,
    TriggerableDevice,
    ClockableDevice,
    ClockLine,
    Pseudoclock,
    PseudoclockDevice,
    Output,
    Trigger,
    StaticOutput,
    _Max,
};

enum class InstructionKind : uint8_t {
    Wait,
    Function,
    Constant,
    Static,
    _Max,
};

const char *kind_name(DeviceKind kind);
const char *kind_name(InstructionKind kind);

static inline std::ostream &operator<<(std::ostream &stm, DeviceKind kind)
{
    return stm << kind_name(kind);
}

static inline std::ostream &operator<<(std::ostream &stm, InstructionKind kind)
{
    return stm << kind_name(kind);
}

// A fixed set of variants, stored as a bitmask.
template<typename Kind>
class KindSet {
    static_assert(uint32_t(Kind::_Max) <= 32);
public:
    constexpr KindSet() = default;
    constexpr KindSet(std::initializer_list<Kind> kinds)
    {
        for (auto kind: kinds) {
            m_bits |= bit(kind);
        }
    }
    static constexpr KindSet all()
    {
        KindSet res;
        res.m_bits = (uint32_t(1) << uint32_t(Kind::_Max)) - 1;
        return res;
    }
    constexpr bool contains(Kind kind) const
    {
        return (m_bits & bit(kind)) != 0;
    }
    constexpr bool empty() const
    {
        return m_bits == 0;
    }
    constexpr KindSet operator|(KindSet other) const
    {
        KindSet res;
        res.m_bits = m_bits | other.m_bits;
        return res;
    }
    constexpr KindSet operator-(KindSet other) const
    {
        KindSet res;
        res.m_bits = m_bits & ~other.m_bits;
        return res;
    }
    constexpr bool operator==(KindSet other) const
    {
        return m_bits == other.m_bits;
    }
    // Comma separated list of the names in the set, `nothing` if empty.
    std::string names() const
    {
        std::string res;
        for (uint32_t i = 0; i < uint32_t(Kind::_Max); i++) {
            if (!contains(Kind(i)))
                continue;
            if (!res.empty())
                res += ", ";
            res += kind_name(Kind(i));
        }
        if (res.empty())
            res = "nothing";
        return res;
    }

private:
    static constexpr uint32_t bit(Kind kind)
    {
        return uint32_t(1) << uint32_t(kind);
    }
    uint32_t m_bits = 0;
};

using DeviceKindSet = KindSet<DeviceKind>;
using InstructionKindSet = KindSet<InstructionKind>;

// Every kind of output (i.e. device that also carries instructions).
constexpr DeviceKindSet output_kinds{DeviceKind::Output, DeviceKind::Trigger,
    DeviceKind::StaticOutput};
// Every kind that can receive a trigger pulse.
constexpr DeviceKindSet triggerable_kinds{DeviceKind::TriggerableDevice,
    DeviceKind::ClockableDevice, DeviceKind::PseudoclockDevice};
// Instructions with a time to quantise.
constexpr InstructionKindSet function_kinds{InstructionKind::Function,
    InstructionKind::Constant};

// Accepted-child tables, keyed by the variant of the parent.
DeviceKindSet accepted_devices(DeviceKind parent);
InstructionKindSet accepted_instructions(DeviceKind owner);

// Identity of a node in the arena of a shot.
struct NodeRef {
    enum class Type : uint8_t {
        None,
        Shot,
        Device,
        Instruction,
    };
    Type type = Type::None;
    uint32_t id = 0;

    constexpr NodeRef() = default;
    constexpr NodeRef(Type type, uint32_t id)
        : type(type),
          id(id)
    {}
    uint64_t key() const
    {
        return (uint64_t(type) << 32) | id;
    }
    bool operator==(const NodeRef &other) const
    {
        return type == other.type && id == other.id;
    }
    bool operator!=(const NodeRef &other) const
    {
        return !(*this == other);
    }
};

}

#endif
