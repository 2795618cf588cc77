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
#include <tithe/reward/fee.hpp>
#include <tithe/reward/reward_error.hpp>
#include <tithe/reward/split.hpp>

#include <gtest/gtest.h>

using namespace tithe;

namespace
{
    ChainConfig make_config(bool const deferred_tx_fee)
    {
        return ChainConfig{
            .chain_id = 1,
            .unit_price = 25,
            .magma_block = 10,
            .kore_block = 20,
            .istanbul = IstanbulConfig{
                .proposer_policy = ProposerPolicy::WeightedRandom},
            .governance = {
                .reward = {
                    .minting_amount = 1'000,
                    .ratio = "50/25/25",
                    .staking_ratio = "80/20",
                    .minimum_stake = 0,
                    .deferred_tx_fee = deferred_tx_fee}}};
    }
}

TEST(Fee, total_fee)
{
    BlockHeader const header{
        .number = 5, .gas_used = 10, .base_fee_per_gas = 7};

    // legacy pricing ignores the base fee
    EXPECT_EQ(total_fee(REWARD_LEGACY, header, 25).value(), 250);
    EXPECT_EQ(total_fee(REWARD_MAGMA, header, 25).value(), 70);
    EXPECT_EQ(total_fee(REWARD_KORE, header, 25).value(), 70);

    auto const res =
        total_fee(REWARD_MAGMA, BlockHeader{.number = 15, .gas_used = 10}, 25);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), RewardError::MissingBaseFee);
}

TEST(Fee, legacy)
{
    auto const config = make_config(true);
    BlockHeader const header{.number = 5, .gas_used = 10};

    auto const fee = calc_deferred_fee<REWARD_LEGACY>(header, config);
    ASSERT_FALSE(fee.has_error());
    EXPECT_EQ(fee.value().total, 250);
    EXPECT_EQ(fee.value().reward, 250);
    EXPECT_EQ(fee.value().burnt, 0);
}

TEST(Fee, magma_burns_half)
{
    auto const config = make_config(true);

    BlockHeader const even{
        .number = 15, .gas_used = 10, .base_fee_per_gas = 7};
    auto const fee = calc_deferred_fee<REWARD_MAGMA>(even, config);
    ASSERT_FALSE(fee.has_error());
    EXPECT_EQ(fee.value().total, 70);
    EXPECT_EQ(fee.value().reward, 35);
    EXPECT_EQ(fee.value().burnt, 35);

    // the odd unit stays with the reward
    BlockHeader const odd{
        .number = 15, .gas_used = 11, .base_fee_per_gas = 5};
    auto const odd_fee = calc_deferred_fee<REWARD_MAGMA>(odd, config);
    ASSERT_FALSE(odd_fee.has_error());
    EXPECT_EQ(odd_fee.value().total, 55);
    EXPECT_EQ(odd_fee.value().reward, 28);
    EXPECT_EQ(odd_fee.value().burnt, 27);
}

TEST(Fee, kore_burns_up_to_proposer_minted_reward)
{
    auto const config = make_config(true);

    // 1000 minted, cn 500, proposer 400
    EXPECT_EQ(proposer_minted_reward(config.governance.reward).value(), 400);

    // half burn leaves 500, the cap burns 400 more
    BlockHeader const large{
        .number = 25, .gas_used = 10, .base_fee_per_gas = 100};
    auto const fee = calc_deferred_fee<REWARD_KORE>(large, config);
    ASSERT_FALSE(fee.has_error());
    EXPECT_EQ(fee.value().total, 1'000);
    EXPECT_EQ(fee.value().reward, 100);
    EXPECT_EQ(fee.value().burnt, 900);

    // below the cap, everything is burnt
    BlockHeader const small{
        .number = 25, .gas_used = 10, .base_fee_per_gas = 7};
    auto const small_fee = calc_deferred_fee<REWARD_KORE>(small, config);
    ASSERT_FALSE(small_fee.has_error());
    EXPECT_EQ(small_fee.value().total, 70);
    EXPECT_EQ(small_fee.value().reward, 0);
    EXPECT_EQ(small_fee.value().burnt, 70);
}

TEST(Fee, not_deferred)
{
    auto const config = make_config(false);
    BlockHeader const header{
        .number = 25, .gas_used = 10, .base_fee_per_gas = 100};

    for (auto const rev : {REWARD_LEGACY, REWARD_MAGMA, REWARD_KORE}) {
        auto const fee = calc_deferred_fee(rev, header, config);
        ASSERT_FALSE(fee.has_error());
        EXPECT_EQ(fee.value().total, 0);
        EXPECT_EQ(fee.value().reward, 0);
        EXPECT_EQ(fee.value().burnt, 0);
    }
}

TEST(Fee, missing_base_fee)
{
    auto const config = make_config(true);
    BlockHeader const header{.number = 25, .gas_used = 10};

    auto const fee = calc_deferred_fee(REWARD_KORE, header, config);
    ASSERT_TRUE(fee.has_error());
    EXPECT_EQ(fee.error(), RewardError::MissingBaseFee);
}

TEST(Fee, kore_cap_with_malformed_ratio)
{
    auto config = make_config(true);
    config.governance.reward.staking_ratio = "80/20/0";
    BlockHeader const header{
        .number = 25, .gas_used = 10, .base_fee_per_gas = 100};

    auto const fee = calc_deferred_fee<REWARD_KORE>(header, config);
    ASSERT_TRUE(fee.has_error());
    EXPECT_EQ(fee.error(), RewardError::MalformedRatio);

    // the staking ratio is only read from kore on
    EXPECT_FALSE(calc_deferred_fee<REWARD_MAGMA>(header, config).has_error());
}
