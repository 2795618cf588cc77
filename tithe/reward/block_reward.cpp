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
#include <tithe/chain/revision.hpp>
#include <tithe/core/checked_math.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/result.hpp>
#include <tithe/reward/aggregate.hpp>
#include <tithe/reward/block_reward.hpp>
#include <tithe/reward/fee.hpp>
#include <tithe/reward/fmt/reward_spec_fmt.hpp>
#include <tithe/reward/reward_error.hpp>
#include <tithe/reward/reward_metrics.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/shares.hpp>
#include <tithe/reward/split.hpp>
#include <tithe/reward/staking_info.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <optional>

TITHE_NAMESPACE_BEGIN

Result<RewardSpec> calc_deferred_reward_simple(
    BlockHeader const &header, ChainConfig const &config)
{
    auto const rev = config.get_reward_revision(header.number);
    auto const &minted = config.governance.reward.minting_amount;

    BOOST_OUTCOME_TRY(
        auto const total, total_fee(rev, header, config.unit_price));

    RewardSpec spec{};
    spec.minted = minted;
    spec.fee = total;
    if (is_magma(rev)) {
        // an odd fee leaves one unit neither rewarded nor burnt
        spec.burnt = total / 2;
        BOOST_OUTCOME_TRY(auto const proposer, checked_add(minted, total / 2));
        spec.proposer = proposer;
    }
    else {
        BOOST_OUTCOME_TRY(auto const proposer, checked_add(minted, total));
        spec.proposer = proposer;
    }
    spec.rewards.emplace(header.rewardbase, spec.proposer);
    return spec;
}

Result<RewardSpec> calc_deferred_reward(
    BlockHeader const &header, ChainConfig const &config,
    std::optional<StakingInfo> const &staking_info, RewardMetrics &metrics)
{
    auto const begin = std::chrono::steady_clock::now();

    auto const rev = config.get_reward_revision(header.number);
    auto const &reward_config = config.governance.reward;
    auto const &minted = reward_config.minting_amount;

    BOOST_OUTCOME_TRY(
        auto const fee, calc_deferred_fee(rev, header, config));
    BOOST_OUTCOME_TRY(
        auto const split, calc_split(rev, reward_config, minted, fee.reward));
    BOOST_OUTCOME_TRY(
        auto const shares,
        calc_shares(reward_config, staking_info, split.stakers));

    Address treasury_a{};
    Address treasury_b{};
    if (staking_info.has_value()) {
        treasury_a = staking_info->treasury_a;
        treasury_b = staking_info->treasury_b;
    }

    BOOST_OUTCOME_TRY(
        auto spec,
        aggregate_reward(
            header.rewardbase, split, shares, treasury_a, treasury_b));
    spec.minted = minted;
    spec.fee = fee.total;
    spec.burnt = fee.burnt;
    LOG_DEBUG("calc_deferred_reward block={} {}", header.number, spec);

    metrics.set_deferred_time(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - begin));
    return spec;
}

Result<RewardSpec> get_block_reward(
    BlockHeader const &header, ChainConfig const &config,
    StakingInfoProvider const &staking, RewardMetrics &metrics)
{
    if (TITHE_UNLIKELY(!config.istanbul.has_value())) {
        return RewardError::MissingConsensusConfig;
    }
    BOOST_OUTCOME_TRY(validate_chain_config(config));

    auto const policy = config.istanbul->proposer_policy;
    if (policy == ProposerPolicy::RoundRobin ||
        policy == ProposerPolicy::Sticky) {
        return calc_deferred_reward_simple(header, config);
    }

    BOOST_OUTCOME_TRY(
        auto const staking_info, staking.staking_info_at(header.number));
    BOOST_OUTCOME_TRY(
        auto spec, calc_deferred_reward(header, config, staking_info, metrics));

    // the deferred computation saw no fee, but execution already paid it
    if (!config.governance.reward.deferred_tx_fee) {
        auto const rev = config.get_reward_revision(header.number);
        BOOST_OUTCOME_TRY(
            auto const block_fee, total_fee(rev, header, config.unit_price));
        BOOST_OUTCOME_TRY(
            auto const proposer, checked_add(spec.proposer, block_fee));
        spec.proposer = proposer;
        BOOST_OUTCOME_TRY(increment(spec.rewards, header.rewardbase, block_fee));
        LOG_DEBUG(
            "get_block_reward block={} compensated fee={}",
            header.number,
            block_fee);
    }

    return spec;
}

void distribute_block_reward(BalanceAdder &balances, RewardMap const &rewards)
{
    for (auto const &[address, amount] : rewards) {
        balances.add_balance(address, amount);
    }
}

TITHE_NAMESPACE_END
