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

#include <tithe/chain/block_header.hpp>
#include <tithe/chain/chain_config.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/block_reward.hpp>
#include <tithe/reward/reward_distributor.hpp>
#include <tithe/reward/reward_metrics.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/staking_info.hpp>

#include <quill/Quill.h>

#include <utility>

TITHE_NAMESPACE_BEGIN

RewardDistributor::RewardDistributor(
    GovernanceHelper const &governance, StakingInfoProvider const &staking)
    : governance_{governance}
    , staking_{staking}
{
}

Result<ChainConfig> RewardDistributor::config_at(
    BlockHeader const &header, ChainConfig const &chain_config) const
{
    BOOST_OUTCOME_TRY(auto params, governance_.params_at(header.number));
    ChainConfig config = chain_config;
    config.governance.reward = std::move(params);
    return config;
}

Result<RewardSpec> RewardDistributor::calc_deferred_reward(
    BlockHeader const &header, ChainConfig const &chain_config,
    RewardMetrics &metrics) const
{
    BOOST_OUTCOME_TRY(auto const config, config_at(header, chain_config));
    BOOST_OUTCOME_TRY(
        auto const staking_info, staking_.staking_info_at(header.number));
    return tithe::calc_deferred_reward(header, config, staking_info, metrics);
}

Result<RewardSpec> RewardDistributor::get_block_reward(
    BlockHeader const &header, ChainConfig const &chain_config,
    RewardMetrics &metrics) const
{
    BOOST_OUTCOME_TRY(auto const config, config_at(header, chain_config));
    LOG_DEBUG(
        "get_block_reward block={} ratio={} staking_ratio={}",
        header.number,
        config.governance.reward.ratio,
        config.governance.reward.staking_ratio);
    return tithe::get_block_reward(header, config, staking_, metrics);
}

TITHE_NAMESPACE_END
