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
#include <tithe/core/assert.h>
#include <tithe/core/checked_math.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/address_fmt.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/shares.hpp>
#include <tithe/reward/staking_info.hpp>

#include <quill/Quill.h>

#include <optional>

TITHE_NAMESPACE_BEGIN

Result<StakingShares> calc_shares(
    RewardConfig const &config, std::optional<StakingInfo> const &staking_info,
    uint256_t const &stakers)
{
    StakingShares result{.shares = {}, .remainder = stakers};
    if (!staking_info.has_value()) {
        return result;
    }

    auto const nodes = staking_info->consolidated_nodes();
    auto const min_stake = config.minimum_stake;

    uint256_t total_excess = 0;
    for (auto const &node : nodes) {
        if (node.staking_amount > min_stake) {
            total_excess += node.staking_amount - min_stake;
        }
    }
    if (total_excess == 0) {
        return result;
    }

    uint256_t paid = 0;
    for (auto const &node : nodes) {
        if (node.staking_amount <= min_stake) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const share,
            checked_mul_div(
                stakers, node.staking_amount - min_stake, total_excess));
        if (share == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(increment(result.shares, node.reward_address, share));
        paid += share;
        LOG_DEBUG("calc_shares {} share={}", node.reward_address, share);
    }

    // each share is floor(stakers * excess / total_excess)
    TITHE_ASSERT(paid <= stakers);
    result.remainder = stakers - paid;
    return result;
}

TITHE_NAMESPACE_END
