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

#include "config.h"

#include <pulsec-utils/log.h>

#include <cmath>
#include <stdexcept>

namespace PulseC::Seq {

static double check_time(double value, const char *key, double max)
{
    if (!std::isfinite(value) || value < 0 || value > max)
        throw std::runtime_error(std::string("Invalid ") + key + " value: " +
                                 std::to_string(value) + ".");
    return value;
}

static double load_time(const YAML::Node &node, const char *key, double max)
{
    double value;
    try {
        value = node.as<double>();
    }
    catch (const YAML::Exception&) {
        throw std::runtime_error(std::string("Invalid ") + key + " value.");
    }
    return check_time(value, key, max);
}

static constexpr double max_tolerance = 0.5;

PULSEC_EXPORT() void ShotConfig::check() const
{
    check_time(epsilon, "epsilon", INFINITY);
    check_time(quantisation_tolerance, "quantisation_tolerance", max_tolerance);
    if (rounding != Rounding::Nearest && rounding != Rounding::Up) {
        throw std::runtime_error("Unknown rounding " + std::to_string(int(rounding)) + ".");
    }
}

PULSEC_EXPORT() void ShotConfig::load(const YAML::Node &config)
{
    if (config.IsNull())
        return;
    if (!config.IsMap())
        throw std::runtime_error("Shot config must be a map.");
    if (auto epsilon_node = config["epsilon"])
        epsilon = load_time(epsilon_node, "epsilon", INFINITY);
    if (auto tolerance_node = config["quantisation_tolerance"])
        quantisation_tolerance = load_time(tolerance_node, "quantisation_tolerance",
                                           max_tolerance);
    if (auto rounding_node = config["rounding"]) {
        auto name = rounding_node.as<std::string>();
        if (!parse_rounding(name, &rounding)) {
            throw std::runtime_error("Unknown rounding `" + name +
                                     "` (expect `nearest` or `up`).");
        }
    }
    if (auto batch_node = config["batch_quantisation_errors"])
        batch_quantisation_errors = batch_node.as<bool>();
    if (auto log_level_node = config["log_level"]) {
        auto name = log_level_node.as<std::string>();
        if (!Log::parseLevel(name.c_str(), &Log::level)) {
            throw std::runtime_error("Unknown log_level `" + name + "`.");
        }
    }
}

PULSEC_EXPORT() void ShotConfig::load_file(const char *fname)
{
    Log::debug("Loading config file %s\n", fname);
    load(YAML::LoadFile(fname));
}

PULSEC_EXPORT() void ShotConfig::load_string(const char *str)
{
    Log::debug("Loading config string\n");
    load(YAML::Load(str));
}

PULSEC_EXPORT() std::string ShotConfig::dump() const
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "epsilon" << YAML::Value << epsilon;
    out << YAML::Key << "quantisation_tolerance" << YAML::Value << quantisation_tolerance;
    out << YAML::Key << "rounding" << YAML::Value << rounding_name(rounding);
    out << YAML::Key << "batch_quantisation_errors"
        << YAML::Value << batch_quantisation_errors;
    out << YAML::EndMap;
    return out.c_str();
}

}
