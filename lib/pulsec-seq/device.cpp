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

#include "shot.h"

#include <stdexcept>

namespace PulseC::Seq {

PULSEC_EXPORT() Device::Device(const Params &params)
    : Device(DeviceKind::Device, params)
{
}

PULSEC_EXPORT() Device::Device(DeviceKind kind, const Params &params)
    : m_kind(kind),
      m_name(params.name),
      m_connection(params.connection)
{
}

PULSEC_EXPORT() Device::~Device()
{
}

PULSEC_EXPORT() Node &Device::parent_node() const
{
    return shot().node(m_parent);
}

PULSEC_EXPORT() Pseudoclock *Device::pseudoclock() const
{
    if (m_pseudoclock_id < 0)
        return nullptr;
    return static_cast<Pseudoclock*>(&shot().device(uint32_t(m_pseudoclock_id)));
}

PULSEC_EXPORT() DeviceKindSet Device::accepted_devices() const
{
    return Seq::accepted_devices(m_kind);
}

PULSEC_EXPORT() void Device::print(std::ostream &stm) const
{
    stm << m_kind << "(name=" << m_name << ", parent=";
    if (attached()) {
        stm << shot().name_of(m_parent);
    }
    else {
        stm << "<none>";
    }
    stm << ", connection=" << m_connection;
    print_fields(stm);
    stm << ")";
}

void Device::print_fields(std::ostream&) const
{
}

PULSEC_EXPORT() void Device::set_output_delay(double delay)
{
    if (attached())
        shot().context().check_phase(*this, Op::ConfigureDevice);
    if (!(delay >= 0))
        throw std::runtime_error(str() + ": invalid output delay " + std::to_string(delay));
    m_output_delay = delay;
}

PULSEC_EXPORT() double Device::output_delay(const Device&) const
{
    return m_output_delay;
}

PULSEC_EXPORT() void Device::establish_common_limits()
{
    shot().context().enter(*this, Op::EstablishCommonLimits);
    do_establish_common_limits();
}

PULSEC_EXPORT() void Device::establish_initial_attributes()
{
    shot().context().enter(*this, Op::EstablishInitialAttributes);
    do_establish_initial_attributes();
}

PULSEC_EXPORT() void Device::check_instructions_valid(ValidationReport &report)
{
    shot().context().enter(*this, Op::CheckInstructionsValid);
    do_check_instructions_valid(report);
}

void Device::do_establish_common_limits()
{
    for (auto child: children()) {
        child->establish_common_limits();
    }
}

void Device::do_establish_initial_attributes()
{
    update_timing_attributes();
    for (auto child: children()) {
        child->establish_initial_attributes();
    }
}

void Device::do_check_instructions_valid(ValidationReport &report)
{
    for (auto child: children()) {
        child->check_instructions_valid(report);
    }
}

void Device::update_timing_attributes()
{
    if (m_parent.type != NodeRef::Type::Device) {
        m_t0 = 0;
        m_cumulative_latency = 0;
        return;
    }
    auto &parent = shot().device(m_parent.id);
    auto delay = parent.output_delay(*this);
    m_t0 = parent.t0() + delay;
    m_cumulative_latency = parent.cumulative_latency() + delay;
}

}
