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

#include <tithe/chain/chain_config.hpp>
#include <tithe/chain/explicit_reward_revision.hpp>
#include <tithe/chain/revision.hpp>
#include <tithe/chain/switch_reward_revision.hpp>
#include <tithe/core/assert.h>
#include <tithe/core/checked_math.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/ratio.hpp>
#include <tithe/reward/split.hpp>

#include <quill/Quill.h>

TITHE_NAMESPACE_BEGIN

Result<PoolSplit>
split_by_ratio(RewardConfig const &config, uint256_t const &source)
{
    BOOST_OUTCOME_TRY(
        auto const ratio, parse_ratio(config.ratio, REWARD_RATIO_PARTS));
    auto const &w = ratio.weights;

    BOOST_OUTCOME_TRY(
        auto const cn, checked_mul_div(source, w[0], ratio.total));
    BOOST_OUTCOME_TRY(
        auto const treasury_a, checked_mul_div(source, w[1], ratio.total));
    BOOST_OUTCOME_TRY(
        auto const treasury_b, checked_mul_div(source, w[2], ratio.total));

    return PoolSplit{.cn = cn, .treasury_a = treasury_a, .treasury_b = treasury_b};
}

Result<StakingSplit>
split_by_staking_ratio(RewardConfig const &config, uint256_t const &source)
{
    BOOST_OUTCOME_TRY(
        auto const ratio,
        parse_ratio(config.staking_ratio, STAKING_RATIO_PARTS));
    auto const &w = ratio.weights;

    BOOST_OUTCOME_TRY(
        auto const proposer, checked_mul_div(source, w[0], ratio.total));
    BOOST_OUTCOME_TRY(
        auto const stakers, checked_mul_div(source, w[1], ratio.total));

    return StakingSplit{.proposer = proposer, .stakers = stakers};
}

Result<uint256_t> proposer_minted_reward(RewardConfig const &config)
{
    BOOST_OUTCOME_TRY(
        auto const pool, split_by_ratio(config, config.minting_amount));
    BOOST_OUTCOME_TRY(
        auto const staking, split_by_staking_ratio(config, pool.cn));
    return staking.proposer;
}

template <reward_revision rev>
Result<RewardSplit> calc_split(
    RewardConfig const &config, uint256_t const &minted,
    uint256_t const &reward_fee)
{
    BOOST_OUTCOME_TRY(auto const total, checked_add(minted, reward_fee));

    RewardSplit split{};
    if constexpr (is_kore(rev)) {
        // the fee goes to the proposer alone
        BOOST_OUTCOME_TRY(auto const pool, split_by_ratio(config, minted));
        BOOST_OUTCOME_TRY(
            auto const staking, split_by_staking_ratio(config, pool.cn));
        BOOST_OUTCOME_TRY(
            auto const proposer, checked_add(staking.proposer, reward_fee));
        split.proposer = proposer;
        split.stakers = staking.stakers;
        split.treasury_a = pool.treasury_a;
        split.treasury_b = pool.treasury_b;
    }
    else {
        BOOST_OUTCOME_TRY(auto const pool, split_by_ratio(config, total));
        split.proposer = pool.cn;
        split.stakers = 0;
        split.treasury_a = pool.treasury_a;
        split.treasury_b = pool.treasury_b;
    }

    // each part is floor(total * w / sum(w)), so the parts never exceed total
    uint256_t const paid =
        split.proposer + split.stakers + split.treasury_a + split.treasury_b;
    TITHE_ASSERT(paid <= total);
    split.remainder = total - paid;

    LOG_DEBUG(
        "calc_split {} proposer={} stakers={} treasury_a={} treasury_b={} "
        "remainder={}",
        reward_revision_to_string(rev),
        split.proposer,
        split.stakers,
        split.treasury_a,
        split.treasury_b,
        split.remainder);

    return split;
}

EXPLICIT_REWARD_REVISION(calc_split);

Result<RewardSplit> calc_split(
    reward_revision const rev, RewardConfig const &config,
    uint256_t const &minted, uint256_t const &reward_fee)
{
    SWITCH_REWARD_REVISION(calc_split, config, minted, reward_fee);
    TITHE_ABORT("invalid reward revision");
}

TITHE_NAMESPACE_END
