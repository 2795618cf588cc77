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
#include <tithe/core/result.hpp>
#include <tithe/reward/reward_spec.hpp>

#include <cstdint>

TITHE_NAMESPACE_BEGIN

struct BlockHeader;
struct ChainConfig;
class RewardMetrics;
struct RewardConfig;
struct StakingInfoProvider;

// Governance parameter lookup. Declared here to keep the governance module
// out of this library's dependencies.
struct GovernanceHelper
{
    virtual ~GovernanceHelper() = default;

    virtual Result<RewardConfig> params_at(uint64_t block_number) const = 0;
};

// Computes rewards with the governance parameters in effect at each block
class RewardDistributor
{
    GovernanceHelper const &governance_;
    StakingInfoProvider const &staking_;

    Result<ChainConfig>
    config_at(BlockHeader const &, ChainConfig const &) const;

public:
    RewardDistributor(GovernanceHelper const &, StakingInfoProvider const &);

    Result<RewardSpec> calc_deferred_reward(
        BlockHeader const &, ChainConfig const &, RewardMetrics &) const;

    Result<RewardSpec> get_block_reward(
        BlockHeader const &, ChainConfig const &, RewardMetrics &) const;
};

TITHE_NAMESPACE_END
