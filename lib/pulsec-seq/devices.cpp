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

#include <pulsec-utils/log.h>
#include <pulsec-utils/number.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace PulseC::Seq {

static Shot &shot_of(const Device &dev)
{
    if (unlikely(!dev.attached()))
        throw std::runtime_error(dev.str() + " must be added to a shot first.");
    return dev.shot();
}

PULSEC_EXPORT() StaticDevice::StaticDevice(const Params &params)
    : Device(DeviceKind::StaticDevice, params)
{
}

PULSEC_EXPORT() StaticDevice::~StaticDevice()
{
}

PULSEC_EXPORT() TriggerableDevice::TriggerableDevice(const Params &params)
    : TriggerableDevice(DeviceKind::TriggerableDevice, params)
{
}

PULSEC_EXPORT() TriggerableDevice::TriggerableDevice(DeviceKind kind, const Params &params)
    : Device(kind, {params.name, params.connection}),
      m_minimum_trigger_duration(params.minimum_trigger_duration)
{
    if (!(m_minimum_trigger_duration >= 0)) {
        throw std::runtime_error(params.name + ": invalid minimum trigger duration " +
                                 std::to_string(m_minimum_trigger_duration));
    }
}

PULSEC_EXPORT() TriggerableDevice::~TriggerableDevice()
{
}

void TriggerableDevice::print_fields(std::ostream &stm) const
{
    stm << ", minimum_trigger_duration=" << m_minimum_trigger_duration;
}

PULSEC_EXPORT() ClockableDevice::ClockableDevice(const Params &params)
    : TriggerableDevice(DeviceKind::ClockableDevice,
                        {params.name, params.connection, params.minimum_trigger_duration}),
      m_minimum_period(params.minimum_period)
{
    if (!(m_minimum_period >= 0)) {
        throw std::runtime_error(params.name + ": invalid minimum period " +
                                 std::to_string(m_minimum_period));
    }
}

PULSEC_EXPORT() ClockableDevice::~ClockableDevice()
{
}

void ClockableDevice::print_fields(std::ostream &stm) const
{
    TriggerableDevice::print_fields(stm);
    stm << ", minimum_period=" << m_minimum_period;
}

PULSEC_EXPORT() ClockLine::ClockLine(const Params &params)
    : Device(DeviceKind::ClockLine, params)
{
}

PULSEC_EXPORT() ClockLine::~ClockLine()
{
}

PULSEC_EXPORT() Pseudoclock &ClockLine::clock() const
{
    // A clock line is only accepted under a pseudoclock.
    assert(parent().type == NodeRef::Type::Device);
    auto &dev = shot().device(parent().id);
    assert(dev.kind() == DeviceKind::Pseudoclock);
    return static_cast<Pseudoclock&>(dev);
}

void ClockLine::do_establish_common_limits()
{
    Device::do_establish_common_limits();
    auto &pc = clock();
    m_common_minimum_period = pc.minimum_period();
    m_period_limiting_device = pc.ref();
    m_common_minimum_trigger_duration = 0;
    m_trigger_limiting_device = NodeRef();
    for (auto dev: descendant_devices()) {
        if (dev->kind() != DeviceKind::ClockableDevice)
            continue;
        auto clocked = static_cast<const ClockableDevice*>(dev);
        if (clocked->minimum_period() > m_common_minimum_period) {
            m_common_minimum_period = clocked->minimum_period();
            m_period_limiting_device = clocked->ref();
        }
        if (clocked->minimum_trigger_duration() > m_common_minimum_trigger_duration) {
            m_common_minimum_trigger_duration = clocked->minimum_trigger_duration();
            m_trigger_limiting_device = clocked->ref();
        }
    }
    // The trigger duration is a property of the duty cycle
    // and is not tied to the timebase.
    m_common_minimum_period_ticks = ceil_div(m_common_minimum_period, pc.timebase());
    m_common_minimum_period = double(m_common_minimum_period_ticks) * pc.timebase();
}

void ClockLine::do_check_instructions_valid(ValidationReport &report)
{
    Device::do_check_instructions_valid(report);
    if (m_common_minimum_trigger_duration > 0 &&
        2 * m_common_minimum_trigger_duration > m_common_minimum_period * (1 + 1e-9)) {
        std::ostringstream stm;
        stm << str() << ": minimum period " << m_common_minimum_period
            << " cannot hold high and low pulses of " << m_common_minimum_trigger_duration
            << " required by " << shot().name_of(m_trigger_limiting_device);
        report.add(Violation::Code::ClockTriggerTooShort, *this, stm.str());
    }
    check_ticks(report);
}

namespace {

struct TickSource {
    uint32_t segment;
    int64_t tick;
    const Function *inst;
};

}

void ClockLine::check_ticks(ValidationReport &report) const
{
    std::vector<TickSource> ticks;
    for (auto inst: descendant_instructions()) {
        if (!function_kinds.contains(inst->kind()))
            continue;
        auto func = static_cast<const Function*>(inst);
        ticks.push_back({func->segment(), func->quantised_t(), func});
        if (func->is_point())
            continue;
        ticks.push_back({func->segment(), func->quantised_end(), func});
        auto sample_period = func->quantised_sample_period();
        if (sample_period > 0 && sample_period < m_common_minimum_period_ticks) {
            std::ostringstream stm;
            stm << func->str() << ": sample period of " << sample_period
                << " ticks is shorter than the minimum period of " << str()
                << " (" << m_common_minimum_period_ticks << " ticks, limited by "
                << shot().name_of(m_period_limiting_device) << ")";
            report.add(Violation::Code::SampleTooFast, *func, stm.str());
        }
    }
    if (m_common_minimum_period_ticks <= 1)
        return;
    std::sort(ticks.begin(), ticks.end(), [] (auto &a, auto &b) {
        if (a.segment != b.segment)
            return a.segment < b.segment;
        if (a.tick != b.tick)
            return a.tick < b.tick;
        return a.inst->instruction_number() < b.inst->instruction_number();
    });
    for (size_t i = 1; i < ticks.size(); i++) {
        auto &prev = ticks[i - 1];
        auto &cur = ticks[i];
        if (prev.segment != cur.segment || prev.tick == cur.tick)
            continue;
        if (cur.tick - prev.tick >= m_common_minimum_period_ticks)
            continue;
        std::ostringstream stm;
        stm << cur.inst->str() << ": ticks " << prev.tick << " and " << cur.tick
            << " in segment " << cur.segment << " are closer than the minimum period of "
            << str() << " (" << m_common_minimum_period_ticks << " ticks, limited by "
            << shot().name_of(m_period_limiting_device) << ")";
        report.add(Violation::Code::TickTooShort, *cur.inst, stm.str());
    }
}

PULSEC_EXPORT() Pseudoclock::Pseudoclock(const Params &params)
    : Device(DeviceKind::Pseudoclock, {params.name, params.connection}),
      m_timebase(params.timebase),
      m_minimum_wait_duration(params.minimum_wait_duration),
      m_minimum_period(params.minimum_period)
{
    if (!(m_timebase > 0))
        throw std::runtime_error(params.name + ": invalid timebase " +
                                 std::to_string(m_timebase));
    if (!(m_minimum_wait_duration >= 0))
        throw std::runtime_error(params.name + ": invalid minimum wait duration " +
                                 std::to_string(m_minimum_wait_duration));
    if (!(m_minimum_period >= 0))
        throw std::runtime_error(params.name + ": invalid minimum period " +
                                 std::to_string(m_minimum_period));
}

PULSEC_EXPORT() Pseudoclock::~Pseudoclock()
{
}

PULSEC_EXPORT() std::vector<ClockLine*> Pseudoclock::clock_lines() const
{
    std::vector<ClockLine*> res;
    for (auto child: children())
        res.push_back(static_cast<ClockLine*>(child));
    return res;
}

void Pseudoclock::do_establish_common_limits()
{
    Device::do_establish_common_limits();
    m_common_minimum_period = 0;
    m_common_minimum_trigger_duration = 0;
    for (auto line: clock_lines()) {
        m_common_minimum_period = max(m_common_minimum_period,
                                      line->common_minimum_period());
        m_common_minimum_trigger_duration = max(m_common_minimum_trigger_duration,
                                                line->common_minimum_trigger_duration());
    }
}

void Pseudoclock::print_fields(std::ostream &stm) const
{
    stm << ", timebase=" << m_timebase
        << ", minimum_wait_duration=" << m_minimum_wait_duration;
    if (m_minimum_period > 0) {
        stm << ", minimum_period=" << m_minimum_period;
    }
}

PULSEC_EXPORT() PseudoclockDevice::PseudoclockDevice(const Params &params)
    : TriggerableDevice(DeviceKind::PseudoclockDevice, params)
{
}

PULSEC_EXPORT() PseudoclockDevice::~PseudoclockDevice()
{
}

PULSEC_EXPORT() std::vector<Pseudoclock*> PseudoclockDevice::pseudoclocks() const
{
    std::vector<Pseudoclock*> res;
    for (auto child: children())
        res.push_back(static_cast<Pseudoclock*>(child));
    return res;
}

PULSEC_EXPORT() void PseudoclockDevice::set_initial_trigger_time(double t)
{
    if (attached())
        shot().context().check_phase(*this, Op::ConfigureDevice);
    if (!(t >= 0))
        throw std::runtime_error(str() + ": invalid initial trigger time " +
                                 std::to_string(t));
    m_initial_trigger_time = t;
}

void PseudoclockDevice::update_timing_attributes()
{
    Device::update_timing_attributes();
    m_t0 += m_initial_trigger_time;
}

PULSEC_EXPORT() Output::Output(const Params &params)
    : Output(DeviceKind::Output, params)
{
}

PULSEC_EXPORT() Output::Output(DeviceKind kind, const Params &params)
    : Device(kind, params)
{
}

PULSEC_EXPORT() Output::~Output()
{
}

PULSEC_EXPORT() InstructionKindSet Output::accepted_instructions() const
{
    return Seq::accepted_instructions(kind());
}

PULSEC_EXPORT() std::vector<OutputInstruction*> Output::instructions() const
{
    std::vector<OutputInstruction*> res;
    for (auto inst: own_instructions())
        res.push_back(static_cast<OutputInstruction*>(inst));
    return res;
}

PULSEC_EXPORT() double Output::constant(double t, double value, SourceLoc loc)
{
    shot_of(*this).add_instruction(*this, std::make_unique<Constant>(t, value), loc);
    return 0;
}

PULSEC_EXPORT() double Output::function(double t, double duration, func_t func,
                                        double samplerate, SourceLoc loc)
{
    shot_of(*this).add_instruction(
        *this, std::make_unique<Function>(t, duration, std::move(func), samplerate), loc);
    return duration;
}

static void check_function(const Function &func, const Shot &shot,
                           ValidationReport &report)
{
    auto tolerance = shot.config().quantisation_tolerance * func.timebase();
    if (func.quantised_t() < 0) {
        std::ostringstream stm;
        stm << func.str() << ": starts " << -func.relative_t()
            << " before its clock is responsive in segment " << func.segment();
        report.add(Violation::Code::NegativeTime, func, stm.str());
    }
    if (func.quantised_duration() < 0) {
        std::ostringstream stm;
        stm << func.str() << ": negative duration";
        report.add(Violation::Code::NegativeDuration, func, stm.str());
    }
    else if (!func.is_point()) {
        auto sample_period = func.quantised_sample_period();
        if (sample_period > 0 && func.quantised_duration() % sample_period != 0) {
            std::ostringstream stm;
            stm << func.str() << ": duration of " << func.quantised_duration()
                << " ticks is not a whole number of sample periods ("
                << sample_period << " ticks)";
            report.add(Violation::Code::PartialSample, func, stm.str());
        }
    }
    auto end = func.t() + max(func.duration(), 0.0);
    auto &waits = shot.waits();
    if (func.duration() > 0 && func.segment() < waits.size()) {
        auto wait = waits[func.segment()];
        if (end > wait->t() + tolerance) {
            std::ostringstream stm;
            stm << func.str() << ": still running at " << wait->str();
            report.add(Violation::Code::CrossesWait, func, stm.str());
        }
    }
    if (end > shot.stop_time() + tolerance) {
        std::ostringstream stm;
        stm << func.str() << ": ends at " << end << " after the end of the shot at "
            << shot.stop_time();
        report.add(Violation::Code::AfterStop, func, stm.str());
    }
}

void Output::do_check_instructions_valid(ValidationReport &report)
{
    Device::do_check_instructions_valid(report);
    auto &shot = this->shot();
    uint32_t segment = 0;
    const Function *ramp = nullptr;
    const Function *point = nullptr;
    auto warn_shared = [&] (const Function &a, const Function &b) {
        Log::warn("%s and %s share tick %lld, the one created later takes effect.\n",
                  a.describe().c_str(), b.describe().c_str(),
                  (long long)b.quantised_t());
    };
    // Instructions are sorted by segment, tick and creation order.
    for (auto inst: instructions()) {
        if (!function_kinds.contains(inst->kind()))
            continue;
        auto &func = *static_cast<const Function*>(inst);
        check_function(func, shot, report);
        if (func.segment() != segment) {
            segment = func.segment();
            ramp = nullptr;
            point = nullptr;
        }
        auto tick = func.quantised_t();
        if (func.is_point()) {
            if (point && point->quantised_t() == tick) {
                std::ostringstream stm;
                stm << func.str() << ": set at tick " << tick << " together with "
                    << point->describe();
                report.add(Violation::Code::SameTick, func, stm.str());
            }
            else if (ramp && tick >= ramp->quantised_t() && tick <= ramp->quantised_end()) {
                warn_shared(*ramp, func);
            }
            point = &func;
            continue;
        }
        if (ramp && tick < ramp->quantised_end()) {
            std::ostringstream stm;
            stm << func.str() << ": starts at tick " << tick << " before the end of "
                << ramp->describe() << " at tick " << ramp->quantised_end();
            report.add(Violation::Code::Overlap, func, stm.str());
        }
        else if (point && point->quantised_t() == tick) {
            warn_shared(*point, func);
        }
        if (!ramp || func.quantised_end() > ramp->quantised_end()) {
            ramp = &func;
        }
    }
}

PULSEC_EXPORT() Trigger::Trigger(const Params &params)
    : Output(DeviceKind::Trigger, params)
{
}

PULSEC_EXPORT() Trigger::~Trigger()
{
}

PULSEC_EXPORT() double Trigger::trigger(double t, double duration, SourceLoc loc)
{
    constant(t, 1, loc);
    constant(t + duration, 0, loc);
    return duration;
}

void Trigger::do_establish_common_limits()
{
    Output::do_establish_common_limits();
    m_common_minimum_trigger_duration = 0;
    m_trigger_limiting_device = NodeRef();
    for (auto child: children()) {
        assert(triggerable_kinds.contains(child->kind()));
        auto triggered = static_cast<const TriggerableDevice*>(child);
        if (triggered->minimum_trigger_duration() > m_common_minimum_trigger_duration) {
            m_common_minimum_trigger_duration = triggered->minimum_trigger_duration();
            m_trigger_limiting_device = triggered->ref();
        }
    }
}

void Trigger::do_check_instructions_valid(ValidationReport &report)
{
    Output::do_check_instructions_valid(report);
    if (m_common_minimum_trigger_duration <= 0)
        return;
    const Constant *high = nullptr;
    for (auto inst: instructions()) {
        auto &level = *static_cast<const Constant*>(inst);
        if (high && high->segment() != level.segment())
            high = nullptr;
        if (level.value() != 0) {
            if (!high)
                high = &level;
            continue;
        }
        if (!high)
            continue;
        auto width = double(level.quantised_t() - high->quantised_t()) * level.timebase();
        if (width < m_common_minimum_trigger_duration * (1 - 1e-9)) {
            std::ostringstream stm;
            stm << high->str() << ": trigger pulse of " << width
                << " is shorter than the " << m_common_minimum_trigger_duration
                << " required by " << shot().name_of(m_trigger_limiting_device);
            report.add(Violation::Code::TriggerTooShort, *high, stm.str());
        }
        high = nullptr;
    }
}

PULSEC_EXPORT() StaticOutput::StaticOutput(const Params &params)
    : Output(DeviceKind::StaticOutput, params)
{
}

PULSEC_EXPORT() StaticOutput::~StaticOutput()
{
}

PULSEC_EXPORT() void StaticOutput::constant(double value, SourceLoc loc)
{
    shot_of(*this).add_instruction(*this, std::make_unique<Static>(value), loc);
}

void StaticOutput::do_check_instructions_valid(ValidationReport &report)
{
    Output::do_check_instructions_valid(report);
    const Static *first = nullptr;
    for (auto inst: instructions()) {
        if (inst->kind() != InstructionKind::Static)
            continue;
        auto &value = *static_cast<const Static*>(inst);
        if (!first) {
            first = &value;
            continue;
        }
        std::ostringstream stm;
        stm << value.str() << ": output already set by " << first->describe();
        report.add(Violation::Code::MultipleStatic, value, stm.str());
    }
}

}
