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
#include <tithe/chain/explicit_reward_revision.hpp>
#include <tithe/chain/revision.hpp>
#include <tithe/chain/switch_reward_revision.hpp>
#include <tithe/core/assert.h>
#include <tithe/core/checked_math.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/result.hpp>
#include <tithe/reward/fee.hpp>
#include <tithe/reward/reward_error.hpp>
#include <tithe/reward/split.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>

TITHE_NAMESPACE_BEGIN

Result<uint256_t> total_fee(
    reward_revision const rev, BlockHeader const &header,
    uint64_t const unit_price)
{
    if (!is_magma(rev)) {
        return checked_mul(header.gas_used, unit_price);
    }
    if (TITHE_UNLIKELY(!header.base_fee_per_gas.has_value())) {
        return RewardError::MissingBaseFee;
    }
    return checked_mul(header.gas_used, header.base_fee_per_gas.value());
}

template <reward_revision rev>
Result<DeferredFee>
calc_deferred_fee(BlockHeader const &header, ChainConfig const &config)
{
    auto const &reward_config = config.governance.reward;

    // already paid to the proposer during execution
    if (!reward_config.deferred_tx_fee) {
        return DeferredFee{};
    }

    BOOST_OUTCOME_TRY(
        auto const total, total_fee(rev, header, config.unit_price));
    DeferredFee fee{.total = total, .reward = total, .burnt = 0};

    if constexpr (is_magma(rev)) {
        uint256_t const half = fee.reward / 2;
        fee.reward -= half;
        fee.burnt += half;
    }

    // applied after the half burn, against what is left of the fee
    if constexpr (is_kore(rev)) {
        BOOST_OUTCOME_TRY(
            auto const cap, proposer_minted_reward(reward_config));
        uint256_t const burn = std::min(fee.reward, cap);
        fee.reward -= burn;
        fee.burnt += burn;
    }

    LOG_DEBUG(
        "calc_deferred_fee {} block={} total={} reward={} burnt={}",
        reward_revision_to_string(rev),
        header.number,
        fee.total,
        fee.reward,
        fee.burnt);

    return fee;
}

EXPLICIT_REWARD_REVISION(calc_deferred_fee);

Result<DeferredFee> calc_deferred_fee(
    reward_revision const rev, BlockHeader const &header,
    ChainConfig const &config)
{
    SWITCH_REWARD_REVISION(calc_deferred_fee, header, config);
    TITHE_ABORT("invalid reward revision");
}

TITHE_NAMESPACE_END
