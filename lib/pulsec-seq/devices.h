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

#ifndef __PULSEC_SEQ_DEVICES_H__
#define __PULSEC_SEQ_DEVICES_H__

#include "device.h"

#include <functional>

namespace PulseC::Seq {

class OutputInstruction;

// Device whose outputs are fixed for the whole shot.
// Needs neither a clock nor a trigger.
class PULSEC_EXPORT_ StaticDevice : public Device {
public:
    StaticDevice(const Params &params);
    ~StaticDevice() override;
};

class PULSEC_EXPORT_ TriggerableDevice : public Device {
public:
    struct Params {
        std::string name;
        std::string connection;
        // Shortest high (or low) pulse that triggers the device.
        double minimum_trigger_duration;
    };

    TriggerableDevice(const Params &params);
    ~TriggerableDevice() override;

    double minimum_trigger_duration() const
    {
        return m_minimum_trigger_duration;
    }

protected:
    TriggerableDevice(DeviceKind kind, const Params &params);
    void print_fields(std::ostream &stm) const override;

private:
    double m_minimum_trigger_duration;
};

class PULSEC_EXPORT_ ClockableDevice : public TriggerableDevice {
public:
    struct Params {
        std::string name;
        std::string connection;
        // Shortest clock pulse the device can register.
        double minimum_trigger_duration;
        // Shortest interval between two clock ticks the device accepts.
        double minimum_period;
    };

    ClockableDevice(const Params &params);
    ~ClockableDevice() override;

    double minimum_period() const
    {
        return m_minimum_period;
    }

protected:
    void print_fields(std::ostream &stm) const override;

private:
    double m_minimum_period;
};

// A physical clock signal of a pseudoclock,
// shared by every clockable device connected to it.
class PULSEC_EXPORT_ ClockLine : public Device {
public:
    ClockLine(const Params &params);
    ~ClockLine() override;

    Pseudoclock &clock() const;

    // Limits of the line, valid after `establish_common_limits`.
    // A whole number of timebase.
    double common_minimum_period() const
    {
        return m_common_minimum_period;
    }
    int64_t common_minimum_period_ticks() const
    {
        return m_common_minimum_period_ticks;
    }
    double common_minimum_trigger_duration() const
    {
        return m_common_minimum_trigger_duration;
    }
    // The node that sets the period (the pseudoclock if no device is slower).
    NodeRef period_limiting_device() const
    {
        return m_period_limiting_device;
    }
    // `NodeRef()` if no device needs a trigger pulse.
    NodeRef trigger_limiting_device() const
    {
        return m_trigger_limiting_device;
    }

protected:
    void do_establish_common_limits() override;
    void do_check_instructions_valid(ValidationReport &report) override;

private:
    void check_ticks(ValidationReport &report) const;

    double m_common_minimum_period = 0;
    int64_t m_common_minimum_period_ticks = 0;
    double m_common_minimum_trigger_duration = 0;
    NodeRef m_period_limiting_device;
    NodeRef m_trigger_limiting_device;
};

// A logical clock source producing ticks on a grid of width `timebase`.
class PULSEC_EXPORT_ Pseudoclock : public Device {
public:
    struct Params {
        std::string name;
        std::string connection;
        double timebase;
        // Time after a wait before the clock responds to a new trigger.
        double minimum_wait_duration;
        // Shortest period the clock itself can produce.
        double minimum_period = 0;
    };

    Pseudoclock(const Params &params);
    ~Pseudoclock() override;

    double timebase() const
    {
        return m_timebase;
    }
    double minimum_wait_duration() const
    {
        return m_minimum_wait_duration;
    }
    double minimum_period() const
    {
        return m_minimum_period;
    }

    std::vector<ClockLine*> clock_lines() const;
    // Largest limits over all the clock lines.
    double common_minimum_period() const
    {
        return m_common_minimum_period;
    }
    double common_minimum_trigger_duration() const
    {
        return m_common_minimum_trigger_duration;
    }

protected:
    void do_establish_common_limits() override;
    void print_fields(std::ostream &stm) const override;

private:
    double m_timebase;
    double m_minimum_wait_duration;
    double m_minimum_period;
    double m_common_minimum_period = 0;
    double m_common_minimum_trigger_duration = 0;
};

// The hardware that hosts one or more pseudoclocks.
class PULSEC_EXPORT_ PseudoclockDevice : public TriggerableDevice {
public:
    PseudoclockDevice(const Params &params);
    ~PseudoclockDevice() override;

    std::vector<Pseudoclock*> pseudoclocks() const;

    // Time at which the parent triggers the device, relative to the parent.
    double initial_trigger_time() const
    {
        return m_initial_trigger_time;
    }
    void set_initial_trigger_time(double t);

protected:
    void update_timing_attributes() override;

private:
    double m_initial_trigger_time = 0;
};

class PULSEC_EXPORT_ Output : public Device, public InstructionHost {
public:
    using func_t = std::function<double(double)>;

    Output(const Params &params);
    ~Output() override;

    InstructionKindSet accepted_instructions() const override;
    Node &host_node() override
    {
        return *this;
    }
    const Node &host_node() const override
    {
        return *this;
    }
    InstructionHost *instruction_host() override
    {
        return this;
    }
    const InstructionHost *instruction_host() const override
    {
        return this;
    }

    std::vector<OutputInstruction*> instructions() const;

    // Set the output to `value` at `t`. Returns the duration (0).
    double constant(double t, double value, SourceLoc loc=SourceLoc::current());
    // Ramp the output along `func` (a function of the time since `t`),
    // sampled at `samplerate`. Returns `duration`.
    double function(double t, double duration, func_t func, double samplerate,
                    SourceLoc loc=SourceLoc::current());

protected:
    Output(DeviceKind kind, const Params &params);
    void do_check_instructions_valid(ValidationReport &report) override;
};

// Output that drives the trigger inputs of its children.
class PULSEC_EXPORT_ Trigger : public Output {
public:
    Trigger(const Params &params);
    ~Trigger() override;

    // Largest `minimum_trigger_duration` of the triggered children.
    double common_minimum_trigger_duration() const
    {
        return m_common_minimum_trigger_duration;
    }
    NodeRef trigger_limiting_device() const
    {
        return m_trigger_limiting_device;
    }

    // A high pulse of length `duration` starting at `t`. Returns `duration`.
    double trigger(double t, double duration, SourceLoc loc=SourceLoc::current());

protected:
    void do_establish_common_limits() override;
    void do_check_instructions_valid(ValidationReport &report) override;

private:
    double m_common_minimum_trigger_duration = 0;
    NodeRef m_trigger_limiting_device;
};

// Output that only takes a single value for the whole shot.
class PULSEC_EXPORT_ StaticOutput : public Output {
public:
    StaticOutput(const Params &params);
    ~StaticOutput() override;

    void constant(double value, SourceLoc loc=SourceLoc::current());

protected:
    void do_check_instructions_valid(ValidationReport &report) override;
};

}

#endif
