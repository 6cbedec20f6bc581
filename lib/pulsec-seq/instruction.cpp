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

#include <algorithm>
#include <cmath>
#include <sstream>

namespace PulseC::Seq {

PULSEC_EXPORT() Instruction::Instruction(InstructionKind kind, double t)
    : m_kind(kind),
      m_t(t)
{
}

PULSEC_EXPORT() Instruction::~Instruction()
{
}

PULSEC_EXPORT() Node &Instruction::owner_node() const
{
    return shot().node(m_owner);
}

PULSEC_EXPORT() Pseudoclock *Instruction::pseudoclock() const
{
    if (m_pseudoclock_id < 0)
        return nullptr;
    return static_cast<Pseudoclock*>(&shot().device(uint32_t(m_pseudoclock_id)));
}

PULSEC_EXPORT() double Instruction::timebase() const
{
    if (auto pc = pseudoclock())
        return pc->timebase();
    return 0;
}

PULSEC_EXPORT() void Instruction::convert_timing(const std::vector<const Wait*> &waits)
{
    shot().context().enter(*this, Op::ConvertTiming);
    do_convert_timing(waits);
    m_converted = true;
}

PULSEC_EXPORT() void Instruction::print(std::ostream &stm) const
{
    stm << m_kind << "(parent=";
    if (attached()) {
        stm << shot().name_of(m_owner);
    }
    else {
        stm << "<none>";
    }
    print_fields(stm);
    stm << ")";
}

void Instruction::print_fields(std::ostream &stm) const
{
    stm << ", t=" << m_t;
}

double Instruction::segment_start(const std::vector<const Wait*> &waits,
                                  uint32_t segment) const
{
    if (segment == 0)
        return 0;
    return waits[segment - 1]->t() + shot().wait_dead_time();
}

int64_t Instruction::quantise(double value, Error::Quantisation code,
                              const char *what) const
{
    auto &config = shot().config();
    auto tb = timebase();
    auto q = to_ticks(value, tb, config.rounding);
    if (likely(within_tolerance(q, config.rounding, config.quantisation_tolerance)))
        return q.ticks;
    std::ostringstream stm;
    if (std::isinf(q.error)) {
        stm << describe() << ": " << what << " " << value
            << " is out of range for the timebase " << tb;
        throw QuantisationError(code, ref(), stm.str());
    }
    stm << describe() << ": " << what << " " << value
        << " is not a multiple of the timebase " << tb << " (off by " << q.error
        << " of a tick, tolerance " << config.quantisation_tolerance << ")";
    throw QuantisationError(code, ref(), stm.str());
}

void Instruction::do_convert_timing(const std::vector<const Wait*> &waits)
{
    // Instructions at the time of a wait belong to the segment after it.
    auto it = std::upper_bound(waits.begin(), waits.end(), m_t,
                               [] (double t, const Wait *wait) { return t < wait->t(); });
    m_segment = uint32_t(it - waits.begin());
    m_relative_t = m_t - segment_start(waits, m_segment);
    m_quantised_t = quantise(m_relative_t, Error::Quantisation::Time, "time");
}

PULSEC_EXPORT() Wait::Wait(double t, std::string name)
    : Instruction(InstructionKind::Wait, t),
      m_name(std::move(name))
{
}

PULSEC_EXPORT() Wait::~Wait()
{
}

PULSEC_EXPORT() double Wait::timebase() const
{
    if (auto pc = shot().master_clock())
        return pc->timebase();
    return 0;
}

void Wait::do_convert_timing(const std::vector<const Wait*> &waits)
{
    // A wait ends the segment it is in.
    auto it = std::lower_bound(waits.begin(), waits.end(), t(),
                               [] (const Wait *wait, double t) { return wait->t() < t; });
    m_segment = uint32_t(it - waits.begin());
    m_relative_t = t() - segment_start(waits, m_segment);
    m_quantised_t = quantise(m_relative_t, Error::Quantisation::Time, "time");
}

void Wait::print_fields(std::ostream &stm) const
{
    Instruction::print_fields(stm);
    stm << ", name=" << m_name;
}

PULSEC_EXPORT() OutputInstruction::~OutputInstruction()
{
}

PULSEC_EXPORT() Output &OutputInstruction::output() const
{
    return static_cast<Output&>(owner_node());
}

PULSEC_EXPORT() Function::Function(double t, double duration, func_t func, double samplerate)
    : Function(InstructionKind::Function, t, duration, std::move(func), samplerate)
{
}

PULSEC_EXPORT() Function::Function(InstructionKind kind, double t, double duration,
                                   func_t func, double samplerate)
    : OutputInstruction(kind, t),
      m_duration(duration),
      m_func(std::move(func)),
      m_samplerate(samplerate)
{
    if (!m_func)
        throw std::runtime_error("Function instruction requires a function.");
    if (!(samplerate >= 0))
        throw std::runtime_error("Invalid sample rate " + std::to_string(samplerate));
}

PULSEC_EXPORT() Function::~Function()
{
}

PULSEC_EXPORT() std::vector<int64_t> Function::sample_times() const
{
    std::vector<int64_t> res;
    if (m_quantised_sample_period <= 0 || m_quantised_duration <= 0) {
        res.push_back(m_quantised_t);
        return res;
    }
    for (int64_t tick = 0; tick <= m_quantised_duration; tick += m_quantised_sample_period)
        res.push_back(m_quantised_t + tick);
    return res;
}

void Function::do_convert_timing(const std::vector<const Wait*> &waits)
{
    Instruction::do_convert_timing(waits);
    m_quantised_duration = quantise(m_duration, Error::Quantisation::Duration, "duration");
    if (m_samplerate > 0) {
        m_quantised_sample_period = quantise(1 / m_samplerate,
                                             Error::Quantisation::SamplePeriod,
                                             "sample period");
    }
    else {
        m_quantised_sample_period = 0;
    }
}

void Function::print_fields(std::ostream &stm) const
{
    Instruction::print_fields(stm);
    stm << ", duration=" << m_duration << ", samplerate=" << m_samplerate;
}

PULSEC_EXPORT() Constant::Constant(double t, double value)
    : Function(InstructionKind::Constant, t, 0, [value] (double) { return value; }, 0),
      m_value(value)
{
}

PULSEC_EXPORT() Constant::~Constant()
{
}

void Constant::print_fields(std::ostream &stm) const
{
    Instruction::print_fields(stm);
    stm << ", value=" << m_value;
}

PULSEC_EXPORT() Static::Static(double value)
    : OutputInstruction(InstructionKind::Static, 0),
      m_value(value)
{
}

PULSEC_EXPORT() Static::~Static()
{
}

void Static::do_convert_timing(const std::vector<const Wait*>&)
{
    m_segment = 0;
    m_relative_t = 0;
    m_quantised_t = 0;
}

void Static::print_fields(std::ostream &stm) const
{
    stm << ", value=" << m_value;
}

}
