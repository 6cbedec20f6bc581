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

#ifndef __PULSEC_SEQ_NODE_H__
#define __PULSEC_SEQ_NODE_H__

#include "tree.h"

#include <pulsec-utils/source_loc.h>

#include <assert.h>

#include <ostream>
#include <string>
#include <vector>

namespace PulseC::Seq {

class Shot;
class Device;
class Instruction;
class DeviceHost;
class InstructionHost;

// Anything that lives in the tree of a shot.
// Nodes are owned by the shot and refer to each other by index.
class PULSEC_EXPORT_ Node {
public:
    virtual ~Node();

    NodeRef ref() const
    {
        return m_ref;
    }
    bool attached() const
    {
        return m_shot != nullptr;
    }
    Shot &shot() const
    {
        assert(m_shot);
        return *m_shot;
    }
    // Where the user created the node.
    const SourceLoc &loc() const
    {
        return m_loc;
    }

    // Capabilities.
    virtual DeviceHost *device_host()
    {
        return nullptr;
    }
    virtual const DeviceHost *device_host() const
    {
        return nullptr;
    }
    virtual InstructionHost *instruction_host()
    {
        return nullptr;
    }
    virtual const InstructionHost *instruction_host() const
    {
        return nullptr;
    }

    virtual void print(std::ostream &stm) const = 0;
    std::string str() const;
    // The printed form followed by the creation site, for error messages.
    std::string describe() const;

protected:
    Node() = default;

private:
    Node(const Node&) = delete;
    void operator=(const Node&) = delete;

    Shot *m_shot = nullptr;
    NodeRef m_ref;
    SourceLoc m_loc;
    friend class Shot;
};

static inline std::ostream &operator<<(std::ostream &stm, const Node &node)
{
    node.print(stm);
    return stm;
}

// Capability of owning child devices.
class PULSEC_EXPORT_ DeviceHost {
public:
    virtual ~DeviceHost();

    virtual DeviceKindSet accepted_devices() const = 0;
    virtual Node &host_node() = 0;
    virtual const Node &host_node() const = 0;

    // Children in insertion order.
    const std::vector<uint32_t> &child_ids() const
    {
        return m_children;
    }
    std::vector<Device*> children() const;
    // Depth-first pre-order, not including this node.
    // Pseudoclocks (and everything under them) are skipped
    // unless `recurse_into_pseudoclocks` is `true`.
    std::vector<Device*> descendant_devices(bool recurse_into_pseudoclocks=false) const;
    // Instructions of this node (if any) and of its descendants,
    // with the same traversal rule as `descendant_devices`.
    std::vector<Instruction*> descendant_instructions(bool recurse_into_pseudoclocks=false) const;

private:
    std::vector<uint32_t> m_children;
    friend class Shot;
};

// Capability of owning instructions.
class PULSEC_EXPORT_ InstructionHost {
public:
    virtual ~InstructionHost();

    virtual InstructionKindSet accepted_instructions() const = 0;
    virtual Node &host_node() = 0;
    virtual const Node &host_node() const = 0;

    // Creation order until the timing is converted,
    // ordered by segment, tick and creation order afterward.
    const std::vector<uint32_t> &instruction_ids() const
    {
        return m_instructions;
    }
    std::vector<Instruction*> own_instructions() const;

private:
    std::vector<uint32_t> m_instructions;
    friend class Shot;
};

}

#endif
