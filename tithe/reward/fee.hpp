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

#include <tithe/chain/revision.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>

#include <cstdint>

TITHE_NAMESPACE_BEGIN

struct BlockHeader;
struct ChainConfig;

struct DeferredFee
{
    uint256_t total{0};
    uint256_t reward{0};
    uint256_t burnt{0};
};

// gas_used * base_fee from MAGMA on, gas_used * unit_price before
Result<uint256_t>
total_fee(reward_revision, BlockHeader const &, uint64_t unit_price);

template <reward_revision rev>
Result<DeferredFee> calc_deferred_fee(BlockHeader const &, ChainConfig const &);

Result<DeferredFee>
calc_deferred_fee(reward_revision, BlockHeader const &, ChainConfig const &);

TITHE_NAMESPACE_END
