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

#ifndef __PULSEC_SEQ_SHOT_H__
#define __PULSEC_SEQ_SHOT_H__

#include "config.h"
#include "devices.h"
#include "instruction.h"
#include "phase.h"
#include "validation.h"

#include <memory>
#include <string>
#include <vector>

namespace PulseC::Seq {

// Root of the tree and owner of every node of one compilation.
// A shot cannot be reused after an error.
class PULSEC_EXPORT_ Shot : public Node, public DeviceHost, public InstructionHost {
public:
    Shot(std::string name, ShotConfig config=ShotConfig(),
         SourceLoc loc=SourceLoc::current());
    Shot(std::string name, double epsilon, SourceLoc loc=SourceLoc::current());
    ~Shot() override;

    const std::string &name() const
    {
        return m_name;
    }
    const ShotConfig &config() const
    {
        return m_config;
    }
    double epsilon() const
    {
        return m_config.epsilon;
    }
    Phase phase() const
    {
        return m_ctx.phase();
    }
    CompilationContext &context()
    {
        return m_ctx;
    }
    const CompilationContext &context() const
    {
        return m_ctx;
    }

    // Arena access, indexed by `NodeRef::id`.
    size_t num_devices() const
    {
        return m_devices.size();
    }
    Device &device(uint32_t id) const
    {
        assert(id < m_devices.size());
        return *m_devices[id];
    }
    size_t num_instructions() const
    {
        return m_instructions.size();
    }
    Instruction &instruction(uint32_t id) const
    {
        assert(id < m_instructions.size());
        return *m_instructions[id];
    }
    Node &node(NodeRef ref) const;
    // Name of a shot or a device, the printed form of an instruction.
    std::string name_of(NodeRef ref) const;

    // Insert `device` as the last child of `parent`.
    // Throws `StructuralError` if `parent` does not accept it,
    // in which case neither `parent` nor the shot is modified.
    Device &add_device(DeviceHost &parent, std::unique_ptr<Device> device,
                       SourceLoc loc=SourceLoc::current());
    template<typename T>
    T &add_device(DeviceHost &parent, const typename T::Params &params,
                  SourceLoc loc=SourceLoc::current())
    {
        auto &dev = add_device(parent, std::unique_ptr<Device>(new T(params)), loc);
        return static_cast<T&>(dev);
    }
    Instruction &add_instruction(InstructionHost &owner, std::unique_ptr<Instruction> inst,
                                 SourceLoc loc=SourceLoc::current());

    DeviceKindSet accepted_devices() const override;
    InstructionKindSet accepted_instructions() const override;
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
    InstructionHost *instruction_host() override
    {
        return this;
    }
    const InstructionHost *instruction_host() const override
    {
        return this;
    }
    void print(std::ostream &stm) const override;

    // The pseudoclock device directly under the shot, if any.
    PseudoclockDevice *master_pseudoclock() const;
    // The first pseudoclock of the master pseudoclock device, if any.
    Pseudoclock *master_clock() const;

    // Valid after `establish_initial_attributes`.
    double nominal_wait_delay() const
    {
        return m_nominal_wait_delay;
    }
    // Time between a wait and the start of the next segment.
    double wait_dead_time() const
    {
        return m_nominal_wait_delay + m_config.epsilon;
    }
    // Sorted by time after `convert_timing`.
    const std::vector<const Wait*> &waits() const
    {
        return m_waits;
    }
    // Infinity until `stop` is called.
    double stop_time() const
    {
        return m_stop_time;
    }
    const ValidationReport &validation_report() const
    {
        return m_report;
    }
    // Every output in the tree, depth first.
    std::vector<Output*> outputs() const;

    // Run the limit and attribute passes and move to ADD_INSTRUCTIONS.
    void start();
    Wait &wait(double t, std::string name, SourceLoc loc=SourceLoc::current());
    // Resolve the timing and validate the instructions.
    // Throws `ValidationError` if any violation is found.
    void stop(double t);

    // For drivers that run the passes one by one.
    // Throws `NotCalledError` if any node misses a required operation
    // of the current phase.
    void next_phase();
    void establish_common_limits();
    void establish_initial_attributes();
    void convert_timing();
    void check_instructions_valid();

    // Human readable dump of the quantised instructions of every output.
    void print_compiled(std::ostream &stm) const;

private:
    void check_all_required() const;
    void check_foreign(const Node &node) const;
    void collect_waits();
    void sort_instructions();

    std::string m_name;
    ShotConfig m_config;
    CompilationContext m_ctx;
    std::vector<std::unique_ptr<Device>> m_devices;
    std::vector<std::unique_ptr<Instruction>> m_instructions;
    int32_t m_master_id = -1;
    double m_nominal_wait_delay = 0;
    double m_stop_time;
    std::vector<const Wait*> m_waits;
    ValidationReport m_report;
};

}

#endif
