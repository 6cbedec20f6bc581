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

namespace PulseC::Seq {

PULSEC_EXPORT() Node::~Node()
{
}

PULSEC_EXPORT() std::string Node::str() const
{
    return to_string(*this);
}

PULSEC_EXPORT() std::string Node::describe() const
{
    std::ostringstream stm;
    print(stm);
    stm << " (created at " << m_loc << ")";
    return stm.str();
}

PULSEC_EXPORT() DeviceHost::~DeviceHost()
{
}

PULSEC_EXPORT() std::vector<Device*> DeviceHost::children() const
{
    std::vector<Device*> res;
    if (m_children.empty())
        return res;
    auto &shot = host_node().shot();
    for (auto id: m_children)
        res.push_back(&shot.device(id));
    return res;
}

static void collect_devices(const DeviceHost &host, bool recurse,
                            std::vector<Device*> &res)
{
    for (auto dev: host.children()) {
        if (!recurse && dev->kind() == DeviceKind::Pseudoclock)
            continue;
        res.push_back(dev);
        collect_devices(*dev, recurse, res);
    }
}

static void collect_instructions(const DeviceHost &host, bool recurse,
                                 std::vector<Instruction*> &res)
{
    for (auto dev: host.children()) {
        if (!recurse && dev->kind() == DeviceKind::Pseudoclock)
            continue;
        if (auto ihost = dev->instruction_host()) {
            auto insts = ihost->own_instructions();
            res.insert(res.end(), insts.begin(), insts.end());
        }
        collect_instructions(*dev, recurse, res);
    }
}

PULSEC_EXPORT() std::vector<Device*>
DeviceHost::descendant_devices(bool recurse_into_pseudoclocks) const
{
    std::vector<Device*> res;
    collect_devices(*this, recurse_into_pseudoclocks, res);
    return res;
}

PULSEC_EXPORT() std::vector<Instruction*>
DeviceHost::descendant_instructions(bool recurse_into_pseudoclocks) const
{
    std::vector<Instruction*> res;
    if (auto ihost = host_node().instruction_host())
        res = ihost->own_instructions();
    collect_instructions(*this, recurse_into_pseudoclocks, res);
    return res;
}

PULSEC_EXPORT() InstructionHost::~InstructionHost()
{
}

PULSEC_EXPORT() std::vector<Instruction*> InstructionHost::own_instructions() const
{
    std::vector<Instruction*> res;
    if (m_instructions.empty())
        return res;
    auto &shot = host_node().shot();
    for (auto id: m_instructions)
        res.push_back(&shot.instruction(id));
    return res;
}

}
