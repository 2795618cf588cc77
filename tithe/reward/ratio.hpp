// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

TITHE_NAMESPACE_BEGIN

struct ParsedRatio
{
    std::vector<uint64_t> weights;
    // sum of weights, zero is not rejected here
    uint256_t total;
};

// Parses "w0/w1/.../wn" into its base-10 weights. Fails with
// RewardError::MalformedRatio on the wrong number of parts and with
// RewardError::InvalidRatioValue on a part that is not an unsigned integer.
// Negative weights are rejected, a leading '+' is accepted.
Result<ParsedRatio> parse_ratio(std::string_view s, size_t expected_parts);

TITHE_NAMESPACE_END
