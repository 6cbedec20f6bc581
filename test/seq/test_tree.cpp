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

#define CATCH_CONFIG_MAIN

#include "../error_helper.h"
#include "shot_helper.h"

#include "../../lib/pulsec-seq/error.h"

#include <algorithm>
#include <memory>
#include <set>

using namespace std::literals::string_literals;

// One device of every kind, not attached to any shot.
static std::unique_ptr<Seq::Device> create_device(Seq::DeviceKind kind, const std::string &name)
{
    switch (kind) {
    case Seq::DeviceKind::Device:
        return std::make_unique<Seq::Device>(Seq::Device::Params{name, "c"});
    case Seq::DeviceKind::StaticDevice:
        return std::make_unique<Seq::StaticDevice>(Seq::StaticDevice::Params{name, "c"});
    case Seq::DeviceKind::TriggerableDevice:
        return std::make_unique<Seq::TriggerableDevice>(
            Seq::TriggerableDevice::Params{name, "c", 1e-6});
    case Seq::DeviceKind::ClockableDevice:
        return std::make_unique<Seq::ClockableDevice>(
            Seq::ClockableDevice::Params{name, "c", 1e-7, 1e-6});
    case Seq::DeviceKind::ClockLine:
        return std::make_unique<Seq::ClockLine>(Seq::ClockLine::Params{name, "c"});
    case Seq::DeviceKind::Pseudoclock:
        return std::make_unique<Seq::Pseudoclock>(Seq::Pseudoclock::Params{name, "c", 1e-7, 0.1});
    case Seq::DeviceKind::PseudoclockDevice:
        return std::make_unique<Seq::PseudoclockDevice>(
            Seq::PseudoclockDevice::Params{name, "c", 1e-6});
    case Seq::DeviceKind::Output:
        return std::make_unique<Seq::Output>(Seq::Output::Params{name, "c"});
    case Seq::DeviceKind::Trigger:
        return std::make_unique<Seq::Trigger>(Seq::Trigger::Params{name, "c"});
    case Seq::DeviceKind::StaticOutput:
        return std::make_unique<Seq::StaticOutput>(Seq::StaticOutput::Params{name, "c"});
    default:
        abort();
    }
}

// Put a device of `kind` at a place in the tree that accepts it.
static Seq::Device &add_parent(Seq::Shot &shot, Seq::DeviceKind kind)
{
    if (shot.accepted_devices().contains(kind))
        return shot.add_device(shot, create_device(kind, "parent"));
    if (kind == Seq::DeviceKind::StaticOutput) {
        auto &sd = shot.add_device<Seq::StaticDevice>(shot, {"static", "s"});
        return shot.add_device(sd, create_device(kind, "parent"));
    }
    auto &pb = shot.add_device<Seq::PseudoclockDevice>(shot, {"pb", "m", 0});
    if (kind == Seq::DeviceKind::Pseudoclock)
        return shot.add_device(pb, create_device(kind, "parent"));
    auto &clock = shot.add_device<Seq::Pseudoclock>(pb, {"clock", "c", 1e-7, 0});
    if (kind == Seq::DeviceKind::ClockLine)
        return shot.add_device(clock, create_device(kind, "parent"));
    auto &line = shot.add_device<Seq::ClockLine>(clock, {"line", "l"});
    if (kind == Seq::DeviceKind::ClockableDevice)
        return shot.add_device(line, create_device(kind, "parent"));
    auto &clocked = shot.add_device<Seq::ClockableDevice>(line, {"clocked", "c", 0, 0});
    return shot.add_device(clocked, create_device(kind, "parent"));
}

TEST_CASE("kind_names") {
    REQUIRE(Seq::kind_name(Seq::DeviceKind::ClockLine) == "ClockLine"s);
    REQUIRE(Seq::kind_name(Seq::InstructionKind::Constant) == "Constant"s);
    REQUIRE(Seq::accepted_devices(Seq::DeviceKind::StaticOutput).names() == "nothing");
    REQUIRE(Seq::accepted_devices(Seq::DeviceKind::Trigger).names() ==
            "TriggerableDevice, ClockableDevice, PseudoclockDevice");
    REQUIRE(Seq::accepted_instructions(Seq::DeviceKind::Output).names() ==
            "Function, Constant");
}

TEST_CASE("add_device_acceptance") {
    for (uint8_t p = 0; p < uint8_t(Seq::DeviceKind::_Max); p++) {
        auto parent_kind = Seq::DeviceKind(p);
        auto accepted = Seq::accepted_devices(parent_kind);
        for (uint8_t c = 0; c < uint8_t(Seq::DeviceKind::_Max); c++) {
            auto child_kind = Seq::DeviceKind(c);
            Seq::Shot shot("shot");
            auto parent = &add_parent(shot, parent_kind);
            REQUIRE(parent->kind() == parent_kind);
            auto nchildren = parent->child_ids().size();
            auto ndevices = shot.num_devices();
            if (accepted.contains(child_kind)) {
                auto &child = shot.add_device(*parent, create_device(child_kind, "child"));
                REQUIRE(child.parent() == parent->ref());
                REQUIRE(parent->child_ids().size() == nchildren + 1);
                REQUIRE(parent->child_ids().back() == child.ref().id);
                REQUIRE(&child.shot() == &shot);
                if (child_kind == Seq::DeviceKind::Pseudoclock) {
                    REQUIRE(child.pseudoclock() == &child);
                }
                else {
                    REQUIRE(child.pseudoclock() == parent->pseudoclock());
                }
            }
            else {
                auto err = expect_error<Seq::StructuralError>([&] {
                    shot.add_device(*parent, create_device(child_kind, "child"));
                });
                REQUIRE(err.type == Seq::Error::Type::Structural);
                REQUIRE(err.code == uint16_t(Seq::Error::Structural::DeviceNotAccepted));
                REQUIRE(err.node1 == parent->ref());
                REQUIRE(parent->child_ids().size() == nchildren);
                REQUIRE(shot.num_devices() == ndevices);
            }
        }
    }
}

TEST_CASE("trigger_rejects_plain_device") {
    SimpleShot s;
    auto &trig = s.shot.add_device<Seq::Trigger>(*s.dev, {"trig", "port0"});
    auto err = expect_error<Seq::StructuralError>([&] {
        s.shot.add_device<Seq::Device>(trig, {"plain", "in"});
    });
    std::string msg = err.what();
    REQUIRE(msg.find("Device of kind Device (plain") == 0);
    REQUIRE(msg.find("Trigger(name=trig, parent=daq, connection=port0)") !=
            std::string::npos);
    REQUIRE(msg.find("accepts TriggerableDevice, ClockableDevice, PseudoclockDevice") !=
            std::string::npos);
    REQUIRE(trig.children().empty());

    auto &camera = s.shot.add_device<Seq::TriggerableDevice>(trig, {"camera", "in", 1e-6});
    REQUIRE(trig.children() == std::vector<Seq::Device*>{&camera});
}

TEST_CASE("master_pseudoclock") {
    Seq::Shot shot("shot");
    REQUIRE(!shot.master_pseudoclock());
    REQUIRE(!shot.master_clock());
    auto &pb = shot.add_device<Seq::PseudoclockDevice>(shot, {"pb", "m", 0});
    REQUIRE(shot.master_pseudoclock() == &pb);
    REQUIRE(!shot.master_clock());
    auto &clock = shot.add_device<Seq::Pseudoclock>(pb, {"clock", "c", 1e-7, 0});
    REQUIRE(shot.master_clock() == &clock);
    // Static devices are fine as siblings.
    shot.add_device<Seq::StaticDevice>(shot, {"static", "s"});

    auto err = expect_error<Seq::StructuralError>([&] {
        shot.add_device<Seq::PseudoclockDevice>(shot, {"pb2", "m", 0});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Structural::DuplicateMaster));
    REQUIRE(err.node1 == pb.ref());
    REQUIRE(err.what() == "Cannot add second master pseudoclock device 'pb2'. "
            "Already have master pseudoclock device 'pb'"s);
    REQUIRE(shot.child_ids().size() == 2);

    // A pseudoclock device that is triggered by another one is not a master.
    auto &line = shot.add_device<Seq::ClockLine>(clock, {"line", "l"});
    auto &clocked = shot.add_device<Seq::ClockableDevice>(line, {"clocked", "c", 0, 0});
    auto &trig = shot.add_device<Seq::Trigger>(clocked, {"trig", "t"});
    auto &secondary = shot.add_device<Seq::PseudoclockDevice>(trig, {"pb2", "in", 1e-7});
    REQUIRE(shot.master_pseudoclock() == &pb);
    // It is triggered in the clock domain of the master.
    REQUIRE(secondary.pseudoclock() == &clock);
    REQUIRE(clocked.pseudoclock() == &clock);
}

TEST_CASE("foreign_node") {
    Seq::Shot shot1("shot1");
    Seq::Shot shot2("shot2");
    auto &sd = shot1.add_device<Seq::StaticDevice>(shot1, {"static", "s"});
    auto err = expect_error<Seq::StructuralError>([&] {
        shot2.add_device<Seq::StaticOutput>(sd, {"out", "o"});
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Structural::ForeignNode));
    REQUIRE(shot2.num_devices() == 0);
    REQUIRE(sd.children().empty());
}

TEST_CASE("add_instruction_acceptance") {
    SimpleShot s;
    auto &trig = s.shot.add_device<Seq::Trigger>(*s.dev, {"trig", "port0"});
    auto &sd = s.shot.add_device<Seq::StaticDevice>(s.shot, {"static", "s"});
    auto &so = s.shot.add_device<Seq::StaticOutput>(sd, {"so", "s0"});
    s.shot.start();

    s.ao->constant(0, 1);
    s.ao->function(1, 2, [] (double t) { return t; }, 10);
    trig.trigger(1, 1e-3);
    so.constant(3.3);
    REQUIRE(s.ao->instructions().size() == 2);
    REQUIRE(trig.instructions().size() == 2);
    REQUIRE(so.instructions().size() == 1);
    REQUIRE(s.shot.num_instructions() == 5);
    REQUIRE(s.ao->instructions()[0]->instruction_number() == 0);
    REQUIRE(s.ao->instructions()[1]->instruction_number() == 1);

    // Ramps are not accepted by triggers.
    auto err = expect_error<Seq::StructuralError>([&] {
        trig.function(2, 1, [] (double t) { return t; }, 10);
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Structural::InstructionNotAccepted));
    REQUIRE(std::string(err.what()).find("accepts Constant") != std::string::npos);
    REQUIRE(trig.instructions().size() == 2);

    // Only static values on a static output.
    err = expect_error<Seq::StructuralError>([&] {
        static_cast<Seq::Output&>(so).constant(0, 1);
    });
    REQUIRE(err.code == uint16_t(Seq::Error::Structural::InstructionNotAccepted));

    REQUIRE(s.shot.num_instructions() == 5);

    // Waits belong to the shot.
    auto &wait = s.shot.wait(5, "w");
    REQUIRE(wait.owner() == s.shot.ref());
    REQUIRE(wait.name() == "w");
    REQUIRE(s.shot.own_instructions().size() == 1);
    REQUIRE(s.shot.num_instructions() == 6);
}

TEST_CASE("descendant_devices") {
    SimpleShot s;
    // A secondary pseudoclock triggered from the clocked device.
    auto &trig = s.shot.add_device<Seq::Trigger>(*s.dev, {"trig", "port0"});
    auto &pb2 = s.shot.add_device<Seq::PseudoclockDevice>(trig, {"pb2", "in", 1e-7});
    auto &clock2 = s.shot.add_device<Seq::Pseudoclock>(pb2, {"pb2_clock", "c", 1e-8, 0.1});
    auto &line2 = s.shot.add_device<Seq::ClockLine>(clock2, {"line2", "l"});
    auto &dev2 = s.shot.add_device<Seq::ClockableDevice>(line2, {"dev2", "c", 0, 1e-6});
    auto &ao2 = s.shot.add_device<Seq::Output>(dev2, {"ao2", "a"});
    auto &sd = s.shot.add_device<Seq::StaticDevice>(s.shot, {"static", "s"});
    s.shot.add_device<Seq::StaticOutput>(sd, {"so", "s0"});

    REQUIRE(names(s.shot.descendant_devices()) ==
            std::vector<std::string>{"pb", "static", "so"});
    REQUIRE(names(s.shot.descendant_devices(true)) ==
            std::vector<std::string>{"pb", "pb_clock", "line", "daq", "ao", "trig",
                                     "pb2", "pb2_clock", "line2", "dev2", "ao2",
                                     "static", "so"});
    REQUIRE(names(s.clock->descendant_devices()) ==
            std::vector<std::string>{"line", "daq", "ao", "trig", "pb2"});
    REQUIRE(names(s.clock->descendant_devices(true)) ==
            std::vector<std::string>{"line", "daq", "ao", "trig", "pb2", "pb2_clock",
                                     "line2", "dev2", "ao2"});
    REQUIRE(ao2.descendant_devices(true).empty());

    for (bool recurse: {false, true}) {
        auto devs = s.shot.descendant_devices(recurse);
        std::set<Seq::Device*> uniq(devs.begin(), devs.end());
        REQUIRE(uniq.size() == devs.size());
        if (recurse) {
            REQUIRE(devs.size() == s.shot.num_devices());
        }
        else {
            for (auto dev: devs) {
                REQUIRE(dev->kind() != Seq::DeviceKind::Pseudoclock);
            }
        }
    }

    s.shot.start();
    s.ao->constant(0, 1);
    ao2.constant(0, 2);
    trig.trigger(0, 1e-6);
    auto &wait = s.shot.wait(1, "w");

    auto insts = s.shot.descendant_instructions();
    REQUIRE(insts == std::vector<Seq::Instruction*>{&wait});
    insts = s.shot.descendant_instructions(true);
    REQUIRE(insts.size() == 5);
    REQUIRE(insts.front() == &wait);
    insts = s.line->descendant_instructions();
    REQUIRE(insts.size() == 3);
    for (auto inst: insts)
        REQUIRE(inst->pseudoclock() == s.clock);
    insts = s.line->descendant_instructions(true);
    REQUIRE(insts.size() == 4);
    REQUIRE(insts.back()->pseudoclock() == &clock2);
}

TEST_CASE("print") {
    SimpleShot s;
    REQUIRE(s.shot.str() == "Shot(name=shot)");
    REQUIRE(s.pb->str() ==
            "PseudoclockDevice(name=pb, parent=shot, connection=master, "
            "minimum_trigger_duration=0)");
    REQUIRE(s.clock->str() ==
            "Pseudoclock(name=pb_clock, parent=pb, connection=clock, timebase=1e-07, "
            "minimum_wait_duration=0.5)");
    REQUIRE(s.line->str() == "ClockLine(name=line, parent=pb_clock, connection=flag0)");
    REQUIRE(s.ao->str() == "Output(name=ao, parent=daq, connection=ao0)");
    auto line = __LINE__ + 1;
    auto &trig = s.shot.add_device<Seq::Trigger>(*s.dev, {"trig", "port0"});
    REQUIRE(trig.loc().line == unsigned(line));
    REQUIRE(std::string(trig.loc().file).find("test_tree.cpp") != std::string::npos);
    REQUIRE(trig.describe().find("test_tree.cpp:" + std::to_string(line)) !=
            std::string::npos);

    s.shot.start();
    s.ao->constant(0.5, 7);
    s.ao->function(1, 2, [] (double t) { return t; }, 20);
    auto &wait = s.shot.wait(7, "first_wait");
    REQUIRE(s.ao->instructions()[0]->str() == "Constant(parent=ao, t=0.5, value=7)");
    REQUIRE(s.ao->instructions()[1]->str() ==
            "Function(parent=ao, t=1, duration=2, samplerate=20)");
    REQUIRE(wait.str() == "Wait(parent=shot, t=7, name=first_wait)");
}
