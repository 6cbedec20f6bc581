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

#include "../../lib/pulsec-utils/number.h"

#include <catch2/catch.hpp>

using namespace PulseC;

TEST_CASE("ceil_div") {
    REQUIRE(ceil_div(1.2e-6, 1e-7) == 12);
    REQUIRE(ceil_div(1.25e-6, 1e-7) == 13);
    REQUIRE(ceil_div(3.01e-6, 2.5e-8) == 121);
    REQUIRE(ceil_div(3e-6, 2.5e-8) == 120);
    REQUIRE(ceil_div(0.3, 0.1) == 3);
    REQUIRE(ceil_div(0, 1e-7) == 0);
    REQUIRE(ceil_div(1e-7 * (1 + 1e-6), 1e-7) == 2);
    REQUIRE(ceil_div(1.5, 1, 0.6) == 2);
    REQUIRE(ceil_div(-1.5, 1) == -1);
}

TEST_CASE("max") {
    REQUIRE(max(1, 3, 2) == 3);
    REQUIRE(max(1.5, 0.5) == 1.5);
}

TEST_CASE("fits_int64") {
    REQUIRE(fits_int64(0));
    REQUIRE(fits_int64(-1e18));
    REQUIRE(fits_int64(9.2e18));
    REQUIRE(!fits_int64(9223372036854775808.0));
    REQUIRE(!fits_int64(-9223372036854775808.0));
    REQUIRE(!fits_int64(1e20));
    REQUIRE(!fits_int64(INFINITY));
    REQUIRE(!fits_int64(NAN));
}
