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

#ifndef __PULSEC_SEQ_ERROR_H__
#define __PULSEC_SEQ_ERROR_H__

#include "tree.h"
#include "validation.h"

#include <stdexcept>
#include <type_traits>

namespace PulseC::Seq {

struct PULSEC_EXPORT_ Error : std::runtime_error {
    enum class Type : uint8_t {
        Structural,
        Phase,
        Quantisation,
        Validation,
    };
    enum class Structural : uint8_t {
        DeviceNotAccepted,
        InstructionNotAccepted,
        DuplicateMaster,
        DuplicateWait,
        NoPseudoclock,
        ForeignNode,
        StopBeforeEnd,
    };
    enum class Call : uint8_t {
        WrongPhase,
        AlreadyCalled,
        NotCalled,
    };
    enum class Quantisation : uint8_t {
        Time,
        Duration,
        SamplePeriod,
        Batch,
    };

    Error(Type type, uint16_t code, NodeRef node1, const char *what);
    Error(Type type, uint16_t code, NodeRef node1, const std::string &what);
    Error(Type type, uint16_t code, NodeRef node1, NodeRef node2, const char *what);
    Error(Type type, uint16_t code, NodeRef node1, NodeRef node2, const std::string &what);
    template<typename Code, typename... Args,
             typename=std::enable_if_t<!std::is_same_v<
                 std::remove_cv_t<std::remove_reference_t<Code>>,uint16_t>>>
        Error(Type type, Code code, Args&&... args)
        : Error(type, uint16_t(code), std::forward<Args>(args)...)
    {}
    Error(const Error&);
    ~Error() override;

    Type type;
    uint16_t code;
    NodeRef node1;
    NodeRef node2;
};

// Illegal composition of the tree or of the instruction list.
struct PULSEC_EXPORT_ StructuralError : Error {
    StructuralError(Structural code, NodeRef node1, const std::string &what);
    StructuralError(Structural code, NodeRef node1, NodeRef node2, const std::string &what);
    ~StructuralError() override;
};

// Violation of the compilation call discipline.
// These always indicate a programming error in the tree construction
// or in the phase hooks of a device.
struct PULSEC_EXPORT_ PhaseError : Error {
    PhaseError(Call code, NodeRef node1, const std::string &what);
    ~PhaseError() override;
};

struct PULSEC_EXPORT_ WrongPhaseError : PhaseError {
    WrongPhaseError(NodeRef node1, const std::string &what);
    ~WrongPhaseError() override;
};

struct PULSEC_EXPORT_ AlreadyCalledError : PhaseError {
    AlreadyCalledError(NodeRef node1, const std::string &what);
    ~AlreadyCalledError() override;
};

struct PULSEC_EXPORT_ NotCalledError : PhaseError {
    NotCalledError(NodeRef node1, const std::string &what);
    ~NotCalledError() override;
};

// A requested time that cannot be represented on the timebase of its clock.
struct PULSEC_EXPORT_ QuantisationError : Error {
    QuantisationError(Quantisation code, NodeRef node1, const std::string &what);
    ~QuantisationError() override;
};

// Raised at the end of the validation with every violation found.
struct PULSEC_EXPORT_ ValidationError : Error {
    ValidationError(ValidationReport report);
    ValidationError(const ValidationError&);
    ~ValidationError() override;

    const ValidationReport &report() const
    {
        return m_report;
    }

private:
    ValidationReport m_report;
};

}

#endif
