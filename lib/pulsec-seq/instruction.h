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

#ifndef __PULSEC_SEQ_INSTRUCTION_H__
#define __PULSEC_SEQ_INSTRUCTION_H__

#include "error.h"
#include "node.h"

#include <functional>

namespace PulseC::Seq {

class Output;
class Pseudoclock;
class Wait;

class PULSEC_EXPORT_ Instruction : public Node {
public:
    ~Instruction() override;

    InstructionKind kind() const
    {
        return m_kind;
    }
    // Nominal time requested by the user.
    double t() const
    {
        return m_t;
    }
    // Creation order within the shot, unique.
    uint32_t instruction_number() const
    {
        return ref().id;
    }
    NodeRef owner() const
    {
        return m_owner;
    }
    Node &owner_node() const;
    // `nullptr` for waits and for static instructions.
    Pseudoclock *pseudoclock() const;
    // Timebase used to quantise the instruction, 0 if it has no clock.
    virtual double timebase() const;

    // Results of `convert_timing`.
    bool converted() const
    {
        return m_converted;
    }
    // Number of waits before the instruction.
    uint32_t segment() const
    {
        return m_segment;
    }
    // Time since the clock became responsive at the start of the segment.
    double relative_t() const
    {
        return m_relative_t;
    }
    // `relative_t` in units of the timebase.
    int64_t quantised_t() const
    {
        return m_quantised_t;
    }

    // `waits` must be sorted by time.
    void convert_timing(const std::vector<const Wait*> &waits);

    void print(std::ostream &stm) const override;

protected:
    Instruction(InstructionKind kind, double t);

    // Overrides that quantise additional fields must call the base version first.
    virtual void do_convert_timing(const std::vector<const Wait*> &waits);
    virtual void print_fields(std::ostream &stm) const;

    // Start of `segment` in nominal time, including the wait dead time.
    double segment_start(const std::vector<const Wait*> &waits, uint32_t segment) const;
    // Throws `QuantisationError` if `value` is not close enough to a tick.
    int64_t quantise(double value, Error::Quantisation code, const char *what) const;

    uint32_t m_segment = 0;
    double m_relative_t = 0;
    int64_t m_quantised_t = 0;

private:
    InstructionKind m_kind;
    double m_t;
    NodeRef m_owner;
    int32_t m_pseudoclock_id = -1;
    bool m_converted = false;
    friend class Shot;
};

// End of a segment. Owned by the shot.
class PULSEC_EXPORT_ Wait : public Instruction {
public:
    Wait(double t, std::string name);
    ~Wait() override;

    const std::string &name() const
    {
        return m_name;
    }
    // Index of the segment that starts after this wait.
    uint32_t boundary() const
    {
        return segment() + 1;
    }
    // Waits are timed by the master clock.
    double timebase() const override;

protected:
    void do_convert_timing(const std::vector<const Wait*> &waits) override;
    void print_fields(std::ostream &stm) const override;

private:
    std::string m_name;
};

// Anything that drives an output.
class PULSEC_EXPORT_ OutputInstruction : public Instruction {
public:
    ~OutputInstruction() override;

    Output &output() const;

protected:
    using Instruction::Instruction;
};

// A ramp following a function of the time since its start.
class PULSEC_EXPORT_ Function : public OutputInstruction {
public:
    using func_t = std::function<double(double)>;

    Function(double t, double duration, func_t func, double samplerate);
    ~Function() override;

    double duration() const
    {
        return m_duration;
    }
    double samplerate() const
    {
        return m_samplerate;
    }
    const func_t &function() const
    {
        return m_func;
    }
    double evaluate(double t) const
    {
        return m_func(t);
    }

    int64_t quantised_duration() const
    {
        return m_quantised_duration;
    }
    // 0 if the instruction is not sampled.
    int64_t quantised_sample_period() const
    {
        return m_quantised_sample_period;
    }
    // Takes no time on the output.
    bool is_point() const
    {
        return m_quantised_duration == 0;
    }
    int64_t quantised_end() const
    {
        return m_quantised_t + m_quantised_duration;
    }
    // Ticks at which the function is evaluated, both ends included.
    std::vector<int64_t> sample_times() const;

protected:
    Function(InstructionKind kind, double t, double duration, func_t func,
             double samplerate);
    void do_convert_timing(const std::vector<const Wait*> &waits) override;
    void print_fields(std::ostream &stm) const override;

private:
    double m_duration;
    func_t m_func;
    double m_samplerate;
    int64_t m_quantised_duration = 0;
    int64_t m_quantised_sample_period = 0;
};

// Set an output to a value.
class PULSEC_EXPORT_ Constant : public Function {
public:
    Constant(double t, double value);
    ~Constant() override;

    double value() const
    {
        return m_value;
    }

protected:
    void print_fields(std::ostream &stm) const override;

private:
    double m_value;
};

// The value of a static output for the whole shot.
class PULSEC_EXPORT_ Static : public OutputInstruction {
public:
    Static(double value);
    ~Static() override;

    double value() const
    {
        return m_value;
    }
    double timebase() const override
    {
        return 0;
    }

protected:
    void do_convert_timing(const std::vector<const Wait*> &waits) override;
    void print_fields(std::ostream &stm) const override;

private:
    double m_value;
};

}

#endif
