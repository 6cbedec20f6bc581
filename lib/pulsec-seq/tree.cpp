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

#include "tree.h"

#include <assert.h>

namespace PulseC::Seq {

PULSEC_EXPORT() const char *kind_name(DeviceKind kind)
{
    switch (kind) {
    case DeviceKind::Device:
        return "Device";
    case DeviceKind::StaticDevice:
        return "StaticDevice";
    case DeviceKind::TriggerableDevice:
        return "TriggerableDevice";
    case DeviceKind::ClockableDevice:
        return "ClockableDevice";
    case DeviceKind::ClockLine:
        return "ClockLine";
    case DeviceKind::Pseudoclock:
        return "Pseudoclock";
    case DeviceKind::PseudoclockDevice:
        return "PseudoclockDevice";
    case DeviceKind::Output:
        return "Output";
    case DeviceKind::Trigger:
        return "Trigger";
    case DeviceKind::StaticOutput:
        return "StaticOutput";
    default:
        return "Unknown";
    }
}

PULSEC_EXPORT() const char *kind_name(InstructionKind kind)
{
    switch (kind) {
    case InstructionKind::Wait:
        return "Wait";
    case InstructionKind::Function:
        return "Function";
    case InstructionKind::Constant:
        return "Constant";
    case InstructionKind::Static:
        return "Static";
    default:
        return "Unknown";
    }
}

namespace {

// Clock lines and pseudoclocks only make sense under their own clock source.
constexpr DeviceKindSet generic_devices =
    DeviceKindSet::all() - DeviceKindSet{DeviceKind::ClockLine, DeviceKind::Pseudoclock};

// Indexed by `DeviceKind`.
constexpr DeviceKindSet device_table[] = {
    generic_devices, // Device
    {DeviceKind::StaticOutput}, // StaticDevice
    generic_devices, // TriggerableDevice
    generic_devices, // ClockableDevice
    {DeviceKind::ClockableDevice}, // ClockLine
    {DeviceKind::ClockLine}, // Pseudoclock
    {DeviceKind::Pseudoclock}, // PseudoclockDevice
    generic_devices, // Output
    triggerable_kinds, // Trigger
    {}, // StaticOutput
};
static_assert(sizeof(device_table) / sizeof(device_table[0]) == size_t(DeviceKind::_Max));

constexpr InstructionKindSet output_instructions = function_kinds;

// Indexed by `DeviceKind`.
constexpr InstructionKindSet instruction_table[] = {
    {}, // Device
    {}, // StaticDevice
    {}, // TriggerableDevice
    {}, // ClockableDevice
    {}, // ClockLine
    {}, // Pseudoclock
    {}, // PseudoclockDevice
    output_instructions, // Output
    {InstructionKind::Constant}, // Trigger
    {InstructionKind::Static}, // StaticOutput
};
static_assert(sizeof(instruction_table) / sizeof(instruction_table[0]) ==
              size_t(DeviceKind::_Max));

}

PULSEC_EXPORT() DeviceKindSet accepted_devices(DeviceKind parent)
{
    assert(parent < DeviceKind::_Max);
    return device_table[(int)parent];
}

PULSEC_EXPORT() InstructionKindSet accepted_instructions(DeviceKind owner)
{
    assert(owner < DeviceKind::_Max);
    return instruction_table[(int)owner];
}

}
