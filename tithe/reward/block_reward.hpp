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

#include <tithe/core/address.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/reward_spec.hpp>

#include <optional>

TITHE_NAMESPACE_BEGIN

struct BlockHeader;
struct ChainConfig;
class RewardMetrics;
struct StakingInfo;
struct StakingInfoProvider;

// Write access to account balances. Declared here so the reward library does
// not depend on the state module.
struct BalanceAdder
{
    virtual ~BalanceAdder() = default;

    virtual void add_balance(Address const &, uint256_t const &) = 0;
};

// Reward of the round robin and sticky proposer policies: the minted amount
// and the fee go to the proposer. From MAGMA on half of the fee is burnt.
// Fee deferral is ignored.
Result<RewardSpec>
calc_deferred_reward_simple(BlockHeader const &, ChainConfig const &);

// Reward distributed at the end of block processing, split between the
// proposer, the stakers and the two treasuries.
Result<RewardSpec> calc_deferred_reward(
    BlockHeader const &, ChainConfig const &,
    std::optional<StakingInfo> const &, RewardMetrics &);

// The reward actually paid in the block, including a fee paid to the
// proposer during execution when fees are not deferred.
Result<RewardSpec> get_block_reward(
    BlockHeader const &, ChainConfig const &, StakingInfoProvider const &,
    RewardMetrics &);

void distribute_block_reward(BalanceAdder &, RewardMap const &);

TITHE_NAMESPACE_END
