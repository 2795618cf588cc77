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

#include <tithe/core/address.hpp>
#include <tithe/core/assert.h>
#include <tithe/core/checked_math.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/address_fmt.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/aggregate.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/shares.hpp>
#include <tithe/reward/split.hpp>

#include <quill/Quill.h>

TITHE_NAMESPACE_BEGIN

namespace
{
    Result<void> fold_unset_treasury(
        uint256_t &proposer, uint256_t &pool, Address const &address)
    {
        if (!is_empty_address(address)) {
            return outcome::success();
        }
        BOOST_OUTCOME_TRY(auto const sum, checked_add(proposer, pool));
        proposer = sum;
        pool = 0;
        return outcome::success();
    }
}

Result<RewardSpec> aggregate_reward(
    Address const &rewardbase, RewardSplit const &split,
    StakingShares const &shares, Address const &treasury_a,
    Address const &treasury_b)
{
    TITHE_ASSERT(shares.remainder <= split.stakers);

    BOOST_OUTCOME_TRY(
        auto const treasury_a_pool,
        checked_add(split.treasury_a, split.remainder));
    BOOST_OUTCOME_TRY(
        auto const proposer, checked_add(split.proposer, shares.remainder));

    RewardSpec spec{};
    spec.proposer = proposer;
    spec.stakers = split.stakers - shares.remainder;
    spec.treasury_a = treasury_a_pool;
    spec.treasury_b = split.treasury_b;

    BOOST_OUTCOME_TRY(
        fold_unset_treasury(spec.proposer, spec.treasury_a, treasury_a));
    BOOST_OUTCOME_TRY(
        fold_unset_treasury(spec.proposer, spec.treasury_b, treasury_b));

    BOOST_OUTCOME_TRY(increment(spec.rewards, rewardbase, spec.proposer));
    if (!is_empty_address(treasury_a)) {
        BOOST_OUTCOME_TRY(increment(spec.rewards, treasury_a, spec.treasury_a));
    }
    if (!is_empty_address(treasury_b)) {
        BOOST_OUTCOME_TRY(increment(spec.rewards, treasury_b, spec.treasury_b));
    }
    for (auto const &[address, share] : shares.shares) {
        BOOST_OUTCOME_TRY(increment(spec.rewards, address, share));
    }

    LOG_DEBUG(
        "aggregate_reward rewardbase={} proposer={} stakers={} treasury_a={} "
        "treasury_b={}",
        rewardbase,
        spec.proposer,
        spec.stakers,
        spec.treasury_a,
        spec.treasury_b);

    return spec;
}

TITHE_NAMESPACE_END
