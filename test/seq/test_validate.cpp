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
#include "../../lib/pulsec-utils/log.h"

#include <sstream>

using Code = Seq::Violation::Code;

static double linear(double t)
{
    return t;
}

// Finish the shot and return the violations found.
static Seq::ValidationReport finish(Seq::Shot &shot, double stop)
{
    std::vector<std::string> messages;
    Log::pushLogger([&] (Log::Level level, const char*, const char *msg) {
        if (level == Log::Error) {
            messages.push_back(msg);
        }
    });
    try {
        shot.stop(stop);
    }
    catch (const Seq::ValidationError &err) {
        Log::popLogger();
        REQUIRE(err.type == Seq::Error::Type::Validation);
        REQUIRE(err.code == err.report().size());
        REQUIRE(err.node1 == err.report().violations().front().node);
        REQUIRE(messages.size() == err.report().size());
        return err.report();
    }
    Log::popLogger();
    REQUIRE(messages.empty());
    REQUIRE(shot.validation_report().empty());
    return shot.validation_report();
}

TEST_CASE("valid_shot") {
    SimpleShot s;
    s.shot.start();
    s.ao->constant(0, 1);
    s.ao->constant(1.2e-6, 2);
    s.ao->function(1e-3, 1, linear, 10);
    s.ao->constant(1.001, 0);
    s.shot.wait(2, "w");
    s.ao->constant(3, 3);
    auto report = finish(s.shot, 4);
    REQUIRE(report.empty());
}

TEST_CASE("overlap") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 1, linear, 10);
    s.ao->function(0.5, 1, linear, 10);
    // Starting right at the end of the previous ramp is fine.
    s.ao->function(1.5, 0.5, linear, 10);
    auto report = finish(s.shot, 2);
    REQUIRE(report.size() == 1);
    auto &violation = report.violations()[0];
    REQUIRE(violation.code == Code::Overlap);
    REQUIRE(violation.node == s.ao->instructions()[1]->ref());
    REQUIRE(violation.message.find("before the end of") != std::string::npos);
}

TEST_CASE("same_tick") {
    SimpleShot s;
    s.shot.start();
    s.ao->constant(1, 1);
    s.ao->constant(1, 2);
    auto report = finish(s.shot, 2);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::SameTick) == 1);
    REQUIRE(report.violations()[0].node == s.shot.instruction(1).ref());
}

TEST_CASE("shared_tick_warning") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 1, linear, 10);
    s.ao->constant(0, 1);
    s.ao->constant(1, 2);
    std::vector<std::string> warnings;
    auto old_level = Log::level;
    Log::level = Log::Warn;
    Log::pushLogger([&] (Log::Level level, const char*, const char *msg) {
        if (level == Log::Warn) {
            warnings.push_back(msg);
        }
    });
    s.shot.stop(2);
    Log::popLogger();
    Log::level = old_level;
    REQUIRE(s.shot.validation_report().empty());
    REQUIRE(warnings.size() == 2);
    REQUIRE(warnings[0].find("share tick 0") != std::string::npos);
    REQUIRE(warnings[1].find("share tick 10000000") != std::string::npos);
}

TEST_CASE("negative_time") {
    SimpleShot s;
    s.shot.start();
    s.shot.wait(3, "w");
    s.ao->constant(3.2, 1);
    s.ao->constant(3.5, 2);
    auto report = finish(s.shot, 4);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::NegativeTime) == 1);
    REQUIRE(report.violations()[0].node == s.shot.instruction(1).ref());
}

TEST_CASE("wait_in_dead_time") {
    SimpleShot s;
    s.shot.start();
    s.ao->constant(0, 1);
    auto &w1 = s.shot.wait(1.0, "w1");
    // The clock is not running again until 1.5.
    auto &w2 = s.shot.wait(1.2, "w2");
    auto report = finish(s.shot, 2);
    REQUIRE(w1.quantised_t() == 10000000);
    REQUIRE(w2.segment() == 1);
    REQUIRE(w2.quantised_t() < 0);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::NegativeTime) == 1);
    auto &violation = report.violations()[0];
    REQUIRE(violation.node == w2.ref());
    REQUIRE(violation.message.find(w2.str() + ": issued 0.3 before the clock resumes")
            == 0);
}

TEST_CASE("negative_duration") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(1, -0.5, linear, 10);
    auto report = finish(s.shot, 2);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::NegativeDuration) == 1);
}

TEST_CASE("partial_sample") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 1.05, linear, 10);
    // Unsampled ramps have no sample period to fit.
    s.ao->function(2, 1.05, linear, 0);
    auto report = finish(s.shot, 4);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::PartialSample) == 1);
    REQUIRE(report.violations()[0].node == s.ao->instructions()[0]->ref());
}

TEST_CASE("crosses_wait") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 2, linear, 10);
    auto &wait = s.shot.wait(1, "w");
    // Ending exactly at the wait is fine.
    s.ao->function(2, 1, linear, 10);
    s.shot.wait(3, "w2");
    auto report = finish(s.shot, 4);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::CrossesWait) == 1);
    REQUIRE(report.violations()[0].message.find(wait.str()) != std::string::npos);
}

TEST_CASE("after_stop") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 2, linear, 10);
    s.ao->function(3, 1, linear, 10);
    auto report = finish(s.shot, 3.5);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::AfterStop) == 1);
    REQUIRE(report.violations()[0].node == s.ao->instructions()[1]->ref());
    REQUIRE(s.shot.stop_time() == 3.5);
}

TEST_CASE("tick_too_short") {
    SimpleShot s;
    s.shot.start();
    s.ao->constant(0, 1);
    // Exactly the minimum period.
    s.ao->constant(1.2e-6, 2);
    s.ao->constant(2.2e-6, 3);
    auto report = finish(s.shot, 1);
    REQUIRE(report.size() == 1);
    auto &violation = report.violations()[0];
    REQUIRE(violation.code == Code::TickTooShort);
    REQUIRE(violation.node == s.shot.instruction(2).ref());
    REQUIRE(violation.message.find("limited by daq") != std::string::npos);
}

TEST_CASE("tick_too_short_across_outputs") {
    SimpleShot s;
    auto &ao2 = s.shot.add_device<Seq::Output>(*s.dev, {"ao2", "ao1"});
    s.shot.start();
    s.ao->constant(0, 1);
    ao2.constant(5e-7, 2);
    // The end of a ramp is a tick too.
    s.ao->function(1, 1e-3, linear, 1e3);
    ao2.constant(1 + 1.5e-3, 3);
    ao2.constant(1 + 1e-3 + 1e-7, 4);
    auto report = finish(s.shot, 2);
    REQUIRE(report.size() == 2);
    REQUIRE(report.count(Code::TickTooShort) == 2);
    REQUIRE(report.violations()[0].node == ao2.instructions()[0]->ref());
    REQUIRE(report.violations()[1].node == ao2.instructions()[1]->ref());
}

TEST_CASE("sample_too_fast") {
    SimpleShot s;
    s.shot.start();
    s.ao->function(0, 1e-5, linear, 1e6);
    auto report = finish(s.shot, 1);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::SampleTooFast) == 1);
}

TEST_CASE("clock_trigger_too_short") {
    SimpleShot s;
    auto &cam = s.shot.add_device<Seq::ClockableDevice>(*s.line, {"cam", "c2", 7e-7, 1e-6});
    s.shot.start();
    REQUIRE(s.line->trigger_limiting_device() == cam.ref());
    auto report = finish(s.shot, 0);
    REQUIRE(report.size() == 1);
    REQUIRE(report.violations()[0].code == Code::ClockTriggerTooShort);
    REQUIRE(report.violations()[0].node == s.line->ref());
}

TEST_CASE("trigger_too_short") {
    SimpleShot s(Seq::ShotConfig(), 1e-7, 2e-7);
    auto &trig = s.shot.add_device<Seq::Trigger>(*s.dev, {"trig", "t"});
    s.shot.add_device<Seq::TriggerableDevice>(trig, {"camera", "c", 2e-6});
    s.shot.start();
    REQUIRE(trig.trigger(1, 1e-6) == 1e-6);
    trig.trigger(2, 2e-6);
    trig.trigger(3, 5e-6);
    auto report = finish(s.shot, 4);
    REQUIRE(report.size() == 1);
    auto &violation = report.violations()[0];
    REQUIRE(violation.code == Code::TriggerTooShort);
    REQUIRE(violation.node == trig.instructions()[0]->ref());
    REQUIRE(violation.message.find("required by camera") != std::string::npos);
}

TEST_CASE("multiple_static") {
    Seq::Shot shot("shot");
    auto &sd = shot.add_device<Seq::StaticDevice>(shot, {"static", "s"});
    auto &so = shot.add_device<Seq::StaticOutput>(sd, {"so", "s0"});
    auto &so2 = shot.add_device<Seq::StaticOutput>(sd, {"so2", "s1"});
    shot.start();
    so.constant(1);
    so2.constant(2);
    so.constant(3);
    auto report = finish(shot, 0);
    REQUIRE(report.size() == 1);
    REQUIRE(report.count(Code::MultipleStatic) == 1);
    REQUIRE(report.violations()[0].node == shot.instruction(2).ref());
}

TEST_CASE("report") {
    SimpleShot s;
    s.shot.start();
    s.ao->constant(1, 1);
    auto line = __LINE__ + 1;
    s.ao->constant(1, 2);
    s.ao->function(2, 3, linear, 10);
    auto err = expect_error<Seq::ValidationError>([&] {
        s.shot.stop(4);
    });
    auto &report = err.report();
    REQUIRE(report.size() == 2);
    REQUIRE(report.violations()[0].code == Code::SameTick);
    REQUIRE(report.violations()[0].loc.line == line);
    REQUIRE(report.violations()[1].code == Code::AfterStop);
    REQUIRE(s.shot.validation_report().size() == 2);
    REQUIRE(err.node1 == s.shot.instruction(1).ref());

    std::string what = err.what();
    REQUIRE(what.find("2 violation(s) found\n  SameTick: ") == 0);
    REQUIRE(what.find("\n  AfterStop: ") != std::string::npos);
    REQUIRE(what.find("test_validate.cpp:" + std::to_string(line)) != std::string::npos);

    std::ostringstream stm;
    stm << report;
    REQUIRE(stm.str() == what);
    REQUIRE(Seq::code_name(Code::ClockTriggerTooShort) == std::string("ClockTriggerTooShort"));
}
