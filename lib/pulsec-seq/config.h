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

#ifndef __PULSEC_SEQ_CONFIG_H__
#define __PULSEC_SEQ_CONFIG_H__

#include "timing.h"

#include <yaml-cpp/yaml.h>

#include <string>

namespace PulseC::Seq {

// Settings of the compilation of one shot.
struct ShotConfig {
    // Safety margin added after the dead time of every wait.
    double epsilon = 0;
    // Largest accepted distance from a tick, as a fraction of the timebase.
    double quantisation_tolerance = 0.01;
    Rounding rounding = Rounding::Nearest;
    // Report every quantisation failure at the end of the timing conversion
    // instead of stopping at the first one.
    bool batch_quantisation_errors = false;

    // Throws `std::runtime_error` if a value is out of range.
    void check() const;
    // Keys not present in `config` keep their current value.
    // Throws `std::runtime_error` for invalid values.
    void load(const YAML::Node &config);
    void load_file(const char *fname);
    void load_string(const char *str);
    std::string dump() const;

    static ShotConfig from_file(const char *fname)
    {
        ShotConfig config;
        config.load_file(fname);
        return config;
    }
    static ShotConfig from_string(const char *str)
    {
        ShotConfig config;
        config.load_string(str);
        return config;
    }
};

}

#endif
