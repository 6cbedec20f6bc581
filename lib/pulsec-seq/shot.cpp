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

#include <algorithm>
#include <cmath>
#include <sstream>

namespace PulseC::Seq {

PULSEC_EXPORT() Shot::Shot(std::string name, ShotConfig config, SourceLoc loc)
    : m_name(std::move(name)),
      m_config(config),
      m_stop_time(INFINITY)
{
    Node::m_shot = this;
    Node::m_ref = NodeRef(NodeRef::Type::Shot, 0);
    Node::m_loc = loc;
    m_config.check();
}

PULSEC_EXPORT() Shot::Shot(std::string name, double epsilon, SourceLoc loc)
    : Shot(std::move(name), ShotConfig{epsilon}, loc)
{
}

PULSEC_EXPORT() Shot::~Shot()
{
}

PULSEC_EXPORT() Node &Shot::node(NodeRef ref) const
{
    switch (ref.type) {
    case NodeRef::Type::Shot:
        return const_cast<Shot&>(*this);
    case NodeRef::Type::Device:
        return device(ref.id);
    case NodeRef::Type::Instruction:
        return instruction(ref.id);
    default:
        throw std::runtime_error("Invalid node reference.");
    }
}

PULSEC_EXPORT() std::string Shot::name_of(NodeRef ref) const
{
    switch (ref.type) {
    case NodeRef::Type::Shot:
        return m_name;
    case NodeRef::Type::Device:
        return device(ref.id).name();
    case NodeRef::Type::Instruction:
        return instruction(ref.id).str();
    default:
        return "<none>";
    }
}

PULSEC_EXPORT() DeviceKindSet Shot::accepted_devices() const
{
    return {DeviceKind::PseudoclockDevice, DeviceKind::StaticDevice};
}

PULSEC_EXPORT() InstructionKindSet Shot::accepted_instructions() const
{
    return {InstructionKind::Wait};
}

PULSEC_EXPORT() void Shot::print(std::ostream &stm) const
{
    stm << "Shot(name=" << m_name << ")";
}

void Shot::check_foreign(const Node &node) const
{
    if (likely(node.attached() && &node.shot() == this))
        return;
    throw StructuralError(Error::Structural::ForeignNode, node.ref(),
                          node.describe() + " does not belong to " + str());
}

PULSEC_EXPORT() Device &Shot::add_device(DeviceHost &parent, std::unique_ptr<Device> device,
                                         SourceLoc loc)
{
    auto &parent_node = parent.host_node();
    check_foreign(parent_node);
    assert(device && !device->attached());
    m_ctx.check_phase(parent_node, Op::AddDevice);
    auto kind = device->kind();
    auto accepted = parent.accepted_devices();
    if (!accepted.contains(kind)) {
        std::ostringstream stm;
        stm << "Device of kind " << kind << " (" << device->name() << ", created at "
            << loc << ") not permitted as child of " << parent_node.describe()
            << " (accepts " << accepted.names() << ")";
        throw StructuralError(Error::Structural::DeviceNotAccepted, parent_node.ref(),
                              stm.str());
    }
    bool is_master = &parent_node == this && kind == DeviceKind::PseudoclockDevice;
    if (is_master && m_master_id >= 0) {
        auto &master = *m_devices[m_master_id];
        throw StructuralError(Error::Structural::DuplicateMaster, master.ref(),
                              "Cannot add second master pseudoclock device '" +
                              device->name() + "'. Already have master pseudoclock "
                              "device '" + master.name() + "'");
    }
    auto id = uint32_t(m_devices.size());
    device->m_shot = this;
    device->m_ref = NodeRef(NodeRef::Type::Device, id);
    device->m_loc = loc;
    device->m_parent = parent_node.ref();
    if (kind == DeviceKind::Pseudoclock) {
        device->m_pseudoclock_id = int32_t(id);
    }
    else if (parent_node.ref().type == NodeRef::Type::Device) {
        device->m_pseudoclock_id = static_cast<Device&>(parent_node).m_pseudoclock_id;
    }
    if (is_master)
        m_master_id = int32_t(id);
    m_devices.push_back(std::move(device));
    parent.m_children.push_back(id);
    return *m_devices.back();
}

PULSEC_EXPORT() Instruction &Shot::add_instruction(InstructionHost &owner,
                                                   std::unique_ptr<Instruction> inst,
                                                   SourceLoc loc)
{
    auto &owner_node = owner.host_node();
    check_foreign(owner_node);
    assert(inst && !inst->attached());
    m_ctx.check_phase(owner_node, Op::AddInstruction);
    auto kind = inst->kind();
    auto accepted = owner.accepted_instructions();
    if (!accepted.contains(kind)) {
        std::ostringstream stm;
        stm << "Instruction of kind " << kind << " (created at " << loc
            << ") not permitted on " << owner_node.describe()
            << " (accepts " << accepted.names() << ")";
        throw StructuralError(Error::Structural::InstructionNotAccepted, owner_node.ref(),
                              stm.str());
    }
    int32_t pseudoclock_id = -1;
    if (owner_node.ref().type == NodeRef::Type::Device) {
        auto &dev = static_cast<Device&>(owner_node);
        pseudoclock_id = dev.m_pseudoclock_id;
        if (pseudoclock_id < 0 && kind != InstructionKind::Static) {
            std::ostringstream stm;
            stm << "Instruction of kind " << kind << " (created at " << loc
                << ") on " << owner_node.describe() << " which has no pseudoclock";
            throw StructuralError(Error::Structural::NoPseudoclock, owner_node.ref(),
                                  stm.str());
        }
    }
    auto id = uint32_t(m_instructions.size());
    inst->m_shot = this;
    inst->m_ref = NodeRef(NodeRef::Type::Instruction, id);
    inst->m_loc = loc;
    inst->m_owner = owner_node.ref();
    inst->m_pseudoclock_id = pseudoclock_id;
    m_instructions.push_back(std::move(inst));
    owner.m_instructions.push_back(id);
    return *m_instructions.back();
}

PULSEC_EXPORT() PseudoclockDevice *Shot::master_pseudoclock() const
{
    if (m_master_id < 0)
        return nullptr;
    return static_cast<PseudoclockDevice*>(m_devices[m_master_id].get());
}

PULSEC_EXPORT() Pseudoclock *Shot::master_clock() const
{
    auto master = master_pseudoclock();
    if (!master)
        return nullptr;
    auto pcs = master->pseudoclocks();
    if (pcs.empty())
        return nullptr;
    return pcs.front();
}

PULSEC_EXPORT() std::vector<Output*> Shot::outputs() const
{
    std::vector<Output*> res;
    for (auto dev: descendant_devices(true)) {
        if (output_kinds.contains(dev->kind())) {
            res.push_back(static_cast<Output*>(dev));
        }
    }
    return res;
}

PULSEC_EXPORT() void Shot::start()
{
    m_ctx.check_phase(*this, Op::Start);
    next_phase();
    establish_common_limits();
    next_phase();
    establish_initial_attributes();
    next_phase();
}

PULSEC_EXPORT() Wait &Shot::wait(double t, std::string name, SourceLoc loc)
{
    auto &inst = add_instruction(*this, std::make_unique<Wait>(t, std::move(name)), loc);
    return static_cast<Wait&>(inst);
}

PULSEC_EXPORT() void Shot::stop(double t)
{
    m_ctx.check_phase(*this, Op::Stop);
    for (auto &inst: m_instructions) {
        if (likely(inst->t() <= t))
            continue;
        std::ostringstream stm;
        stm << "Stop time " << t << " of " << str() << " is before "
            << inst->describe();
        throw StructuralError(Error::Structural::StopBeforeEnd, inst->ref(), stm.str());
    }
    m_stop_time = t;
    next_phase();
    convert_timing();
    next_phase();
    check_instructions_valid();
    check_all_required();
    if (m_report.empty()) {
        Log::debug("%s: compiled %zu instructions\n", m_name.c_str(),
                   m_instructions.size());
        return;
    }
    for (auto &violation: m_report.violations())
        Log::error("%s\n", to_string(violation).c_str());
    throw ValidationError(m_report);
}

void Shot::check_all_required() const
{
    m_ctx.check_required(*this);
    for (auto &dev: m_devices)
        m_ctx.check_required(*dev);
    for (auto &inst: m_instructions) {
        m_ctx.check_required(*inst);
    }
}

PULSEC_EXPORT() void Shot::next_phase()
{
    check_all_required();
    m_ctx.advance(*this);
}

PULSEC_EXPORT() void Shot::establish_common_limits()
{
    m_ctx.enter(*this, Op::EstablishCommonLimits);
    for (auto child: children()) {
        child->establish_common_limits();
    }
}

PULSEC_EXPORT() void Shot::establish_initial_attributes()
{
    m_ctx.enter(*this, Op::EstablishInitialAttributes);
    m_nominal_wait_delay = 0;
    for (auto dev: descendant_devices(true)) {
        if (dev->kind() != DeviceKind::Pseudoclock)
            continue;
        auto pc = static_cast<const Pseudoclock*>(dev);
        m_nominal_wait_delay = std::max(m_nominal_wait_delay, pc->minimum_wait_duration());
    }
    for (auto child: children()) {
        child->establish_initial_attributes();
    }
}

void Shot::collect_waits()
{
    m_waits.clear();
    for (auto inst: own_instructions())
        m_waits.push_back(static_cast<const Wait*>(inst));
    std::stable_sort(m_waits.begin(), m_waits.end(), [] (auto a, auto b) {
        return a->t() < b->t();
    });
    for (size_t i = 1; i < m_waits.size(); i++) {
        auto prev = m_waits[i - 1];
        auto wait = m_waits[i];
        if (likely(prev->t() != wait->t()))
            continue;
        throw StructuralError(Error::Structural::DuplicateWait, prev->ref(), wait->ref(),
                              "Waits " + prev->describe() + " and " + wait->describe() +
                              " are at the same time");
    }
}

void Shot::sort_instructions()
{
    for (auto output: outputs()) {
        auto &ids = output->m_instructions;
        std::sort(ids.begin(), ids.end(), [&] (uint32_t a, uint32_t b) {
            auto &ia = *m_instructions[a];
            auto &ib = *m_instructions[b];
            if (ia.segment() != ib.segment())
                return ia.segment() < ib.segment();
            if (ia.quantised_t() != ib.quantised_t())
                return ia.quantised_t() < ib.quantised_t();
            return a < b;
        });
    }
}

PULSEC_EXPORT() void Shot::convert_timing()
{
    m_ctx.check_phase(*this, Op::ConvertTiming);
    collect_waits();
    if (!m_config.batch_quantisation_errors) {
        for (auto inst: descendant_instructions(true))
            inst->convert_timing(m_waits);
        sort_instructions();
        return;
    }
    std::vector<QuantisationError> errors;
    for (auto inst: descendant_instructions(true)) {
        try {
            inst->convert_timing(m_waits);
        }
        catch (const QuantisationError &err) {
            Log::error("%s\n", err.what());
            errors.push_back(err);
        }
    }
    if (!errors.empty()) {
        std::ostringstream stm;
        stm << errors.size() << " instruction(s) cannot be quantised:";
        for (auto &err: errors)
            stm << "\n  " << err.what();
        throw QuantisationError(Error::Quantisation::Batch, errors.front().node1, stm.str());
    }
    sort_instructions();
}

PULSEC_EXPORT() void Shot::check_instructions_valid()
{
    m_ctx.enter(*this, Op::CheckInstructionsValid);
    m_report.clear();
    for (auto wait: m_waits) {
        if (wait->quantised_t() >= 0)
            continue;
        std::ostringstream stm;
        stm << wait->str() << ": issued " << -wait->relative_t()
            << " before the clock resumes in segment " << wait->segment();
        m_report.add(Violation::Code::NegativeTime, *wait, stm.str());
    }
    for (auto child: children()) {
        child->check_instructions_valid(m_report);
    }
}

PULSEC_EXPORT() void Shot::print_compiled(std::ostream &stm) const
{
    stm << *this << ":\n";
    for (auto wait: m_waits) {
        stm << "  " << *wait << " ends segment " << wait->segment()
            << " at tick " << wait->quantised_t() << "\n";
    }
    for (auto output: outputs()) {
        stm << "  " << *output << ":\n";
        for (auto inst: output->instructions()) {
            stm << "    [" << inst->segment() << "] " << inst->quantised_t() << ": "
                << *inst;
            if (function_kinds.contains(inst->kind())) {
                auto func = static_cast<const Function*>(inst);
                if (!func->is_point()) {
                    stm << " for " << func->quantised_duration() << " ticks every "
                        << func->quantised_sample_period();
                }
            }
            stm << "\n";
        }
    }
}

}
