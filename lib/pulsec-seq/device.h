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

#ifndef __PULSEC_SEQ_DEVICE_H__
#define __PULSEC_SEQ_DEVICE_H__

#include "node.h"

#include <string>

namespace PulseC::Seq {

class Pseudoclock;
class ValidationReport;

// Base class of every hardware component in the tree.
// Devices are created by `Shot::add_device` and owned by the shot.
class PULSEC_EXPORT_ Device : public Node, public DeviceHost {
public:
    struct Params {
        std::string name;
        // Opaque identifier of the port on the parent.
        std::string connection;
    };

    Device(const Params &params);
    ~Device() override;

    DeviceKind kind() const
    {
        return m_kind;
    }
    const std::string &name() const
    {
        return m_name;
    }
    const std::string &connection() const
    {
        return m_connection;
    }
    NodeRef parent() const
    {
        return m_parent;
    }
    Node &parent_node() const;
    // The device that generates the clock of this device.
    // `nullptr` outside of a clock domain.
    Pseudoclock *pseudoclock() const;
    bool has_pseudoclock() const
    {
        return m_pseudoclock_id >= 0;
    }

    DeviceKindSet accepted_devices() const override;
    Node &host_node() override
    {
        return *this;
    }
    const Node &host_node() const override
    {
        return *this;
    }
    DeviceHost *device_host() override
    {
        return this;
    }
    const DeviceHost *device_host() const override
    {
        return this;
    }
    void print(std::ostream &stm) const override;

    // Delay between receiving a trigger or clock tick and driving the children.
    double output_delay() const
    {
        return m_output_delay;
    }
    void set_output_delay(double delay);
    // Delay to a specific child, the uniform `output_delay()` by default.
    virtual double output_delay(const Device &child) const;

    // Attributes set by `establish_initial_attributes`.
    double t0() const
    {
        return m_t0;
    }
    double cumulative_latency() const
    {
        return m_cumulative_latency;
    }

    // The compilation passes, each invoked exactly once per device
    // by the parent (or the shot).
    void establish_common_limits();
    void establish_initial_attributes();
    void check_instructions_valid(ValidationReport &report);

protected:
    Device(DeviceKind kind, const Params &params);

    // The default implementations visit every child.
    // Overrides must call them (children first for the limits,
    // after the own attributes for the attributes).
    virtual void do_establish_common_limits();
    virtual void do_establish_initial_attributes();
    virtual void do_check_instructions_valid(ValidationReport &report);

    // Compute `t0` and `cumulative_latency` from the parent.
    virtual void update_timing_attributes();

    // Extra `, key=value` pairs for `print`.
    virtual void print_fields(std::ostream &stm) const;

    double m_t0 = 0;
    double m_cumulative_latency = 0;

private:
    DeviceKind m_kind;
    std::string m_name;
    std::string m_connection;
    NodeRef m_parent;
    int32_t m_pseudoclock_id = -1;
    double m_output_delay = 0;
    friend class Shot;
};

}

#endif
