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

TITHE_NAMESPACE_BEGIN

struct RewardConfig;

struct PoolSplit
{
    uint256_t cn;
    uint256_t treasury_a;
    uint256_t treasury_b;
};

struct StakingSplit
{
    uint256_t proposer;
    uint256_t stakers;
};

// Output of the split stage. proposer + stakers + treasury_a + treasury_b +
// remainder == minted + fee.
struct RewardSplit
{
    uint256_t proposer;
    uint256_t stakers;
    uint256_t treasury_a;
    uint256_t treasury_b;
    // truncation loss of the ratio divisions
    uint256_t remainder;
};

// Splits source by RewardConfig::ratio. Each part is truncated on its own;
// whatever is lost is left to the caller.
Result<PoolSplit> split_by_ratio(RewardConfig const &, uint256_t const &source);

// Splits source by RewardConfig::staking_ratio, truncating each part.
Result<StakingSplit>
split_by_staking_ratio(RewardConfig const &, uint256_t const &source);

// The proposer's part of the minting amount alone, i.e. the kore burn cap.
Result<uint256_t> proposer_minted_reward(RewardConfig const &);

template <reward_revision rev>
Result<RewardSplit> calc_split(
    RewardConfig const &, uint256_t const &minted, uint256_t const &reward_fee);

Result<RewardSplit> calc_split(
    reward_revision, RewardConfig const &, uint256_t const &minted,
    uint256_t const &reward_fee);

TITHE_NAMESPACE_END
