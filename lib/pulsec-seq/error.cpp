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

#include "error.h"

#include <pulsec-utils/utils.h>

namespace PulseC::Seq {

Error::Error(Type type, uint16_t code, NodeRef node1, const char *what)
    : std::runtime_error(what),
      type(type),
      code(code),
      node1(node1)
{
}

Error::Error(Type type, uint16_t code, NodeRef node1, const std::string &what)
    : std::runtime_error(what),
      type(type),
      code(code),
      node1(node1)
{
}

Error::Error(Type type, uint16_t code, NodeRef node1, NodeRef node2, const char *what)
    : std::runtime_error(what),
      type(type),
      code(code),
      node1(node1),
      node2(node2)
{
}

Error::Error(Type type, uint16_t code, NodeRef node1, NodeRef node2,
             const std::string &what)
    : std::runtime_error(what),
      type(type),
      code(code),
      node1(node1),
      node2(node2)
{
}

Error::Error(const Error &other)
    : std::runtime_error(other),
      type(other.type),
      code(other.code),
      node1(other.node1),
      node2(other.node2)
{
}

Error::~Error()
{
}

StructuralError::StructuralError(Structural code, NodeRef node1, const std::string &what)
    : Error(Type::Structural, code, node1, what)
{
}

StructuralError::StructuralError(Structural code, NodeRef node1, NodeRef node2,
                                 const std::string &what)
    : Error(Type::Structural, code, node1, node2, what)
{
}

StructuralError::~StructuralError()
{
}

PhaseError::PhaseError(Call code, NodeRef node1, const std::string &what)
    : Error(Type::Phase, code, node1, what)
{
}

PhaseError::~PhaseError()
{
}

WrongPhaseError::WrongPhaseError(NodeRef node1, const std::string &what)
    : PhaseError(Call::WrongPhase, node1, what)
{
}

WrongPhaseError::~WrongPhaseError()
{
}

AlreadyCalledError::AlreadyCalledError(NodeRef node1, const std::string &what)
    : PhaseError(Call::AlreadyCalled, node1, what)
{
}

AlreadyCalledError::~AlreadyCalledError()
{
}

NotCalledError::NotCalledError(NodeRef node1, const std::string &what)
    : PhaseError(Call::NotCalled, node1, what)
{
}

NotCalledError::~NotCalledError()
{
}

QuantisationError::QuantisationError(Quantisation code, NodeRef node1,
                                     const std::string &what)
    : Error(Type::Quantisation, code, node1, what)
{
}

QuantisationError::~QuantisationError()
{
}

static NodeRef first_node(const ValidationReport &report)
{
    if (report.empty())
        return NodeRef();
    return report.violations().front().node;
}

ValidationError::ValidationError(ValidationReport report)
    : Error(Type::Validation, uint16_t(report.size()), first_node(report),
            to_string(report)),
      m_report(std::move(report))
{
}

ValidationError::ValidationError(const ValidationError &other)
    : Error(other),
      m_report(other.m_report)
{
}

ValidationError::~ValidationError()
{
}

}
