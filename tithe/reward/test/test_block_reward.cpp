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
#include <tithe/chain/config_error.hpp>
#include <tithe/core/address.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/aggregate.hpp>
#include <tithe/reward/block_reward.hpp>
#include <tithe/reward/reward_error.hpp>
#include <tithe/reward/reward_metrics.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/shares.hpp>
#include <tithe/reward/split.hpp>
#include <tithe/reward/staking_info.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <utility>

using namespace tithe;
using namespace evmc::literals;

namespace
{
    constexpr auto rewardbase{0x5353535353535353535353535353535353535353_address};
    constexpr auto treasury_a{0x0000000000000000000000000000000000000aaa_address};
    constexpr auto treasury_b{0x0000000000000000000000000000000000000bbb_address};
    constexpr auto n1{0x0000000000000000000000000000000000000101_address};
    constexpr auto n2{0x0000000000000000000000000000000000000102_address};
    constexpr auto r1{0x0000000000000000000000000000000000000201_address};
    constexpr auto r2{0x0000000000000000000000000000000000000202_address};

    ChainConfig make_config(
        ProposerPolicy const policy, bool const deferred_tx_fee,
        char const *ratio = "50/25/25")
    {
        return ChainConfig{
            .chain_id = 1,
            .unit_price = 1,
            .magma_block = 10,
            .kore_block = 20,
            .istanbul = IstanbulConfig{.proposer_policy = policy},
            .governance = {
                .reward = {
                    .minting_amount = 1'000,
                    .ratio = ratio,
                    .staking_ratio = "80/20",
                    .minimum_stake = 100,
                    .deferred_tx_fee = deferred_tx_fee}}};
    }

    StakingInfo make_staking_info(Address const &a, Address const &b)
    {
        return StakingInfo{
            .block_number = 0,
            .entries =
                {StakingEntry{
                     .node = n1,
                     .staking_contract = {},
                     .reward_address = r1,
                     .staking_amount = 200},
                 StakingEntry{
                     .node = n2,
                     .staking_contract = {},
                     .reward_address = r2,
                     .staking_amount = 400}},
            .treasury_a = a,
            .treasury_b = b};
    }

    uint256_t sum_rewards(RewardSpec const &spec)
    {
        uint256_t sum = 0;
        for (auto const &[_, amount] : spec.rewards) {
            sum += amount;
        }
        return sum;
    }

    void expect_conserved(RewardSpec const &spec)
    {
        uint256_t const pools =
            spec.proposer + spec.stakers + spec.treasury_a + spec.treasury_b;
        EXPECT_EQ(pools, spec.minted + spec.fee - spec.burnt);
        EXPECT_EQ(sum_rewards(spec), pools);
    }

    class StaticStakingInfoProvider final : public StakingInfoProvider
    {
        std::optional<StakingInfo> info_;

    public:
        explicit StaticStakingInfoProvider(std::optional<StakingInfo> info)
            : info_{std::move(info)}
        {
        }

        Result<std::optional<StakingInfo>>
        staking_info_at(uint64_t) const override
        {
            return info_;
        }
    };

    class FailingStakingInfoProvider final : public StakingInfoProvider
    {
    public:
        Result<std::optional<StakingInfo>>
        staking_info_at(uint64_t) const override
        {
            return RewardError::CollaboratorFailure;
        }
    };

    class RecordingBalanceAdder final : public BalanceAdder
    {
    public:
        RewardMap balances;

        void add_balance(Address const &address, uint256_t const &amount) override
        {
            balances[address] += amount;
        }
    };

    // 1000 minted, gas 10 at base fee 100: fee 1000, 100 of it rewarded
    BlockHeader const kore_header{
        .number = 25,
        .gas_used = 10,
        .base_fee_per_gas = 100,
        .rewardbase = rewardbase};
}

TEST(Aggregate, fold_order)
{
    RewardSplit const split{
        .proposer = 10,
        .stakers = 5,
        .treasury_a = 3,
        .treasury_b = 2,
        .remainder = 1};
    StakingShares shares{};
    shares.shares[r1] = 4;
    shares.remainder = 1;

    auto const both =
        aggregate_reward(rewardbase, split, shares, treasury_a, treasury_b);
    ASSERT_FALSE(both.has_error());
    EXPECT_EQ(both.value().proposer, 11);
    EXPECT_EQ(both.value().stakers, 4);
    EXPECT_EQ(both.value().treasury_a, 4);
    EXPECT_EQ(both.value().treasury_b, 2);
    EXPECT_EQ(both.value().rewards.size(), 4);
    EXPECT_EQ(both.value().rewards.at(treasury_a), 4);

    // the split remainder reaches the proposer through treasury_a
    auto const no_a =
        aggregate_reward(rewardbase, split, shares, Address{}, treasury_b);
    ASSERT_FALSE(no_a.has_error());
    EXPECT_EQ(no_a.value().proposer, 15);
    EXPECT_EQ(no_a.value().treasury_a, 0);
    EXPECT_EQ(no_a.value().treasury_b, 2);
    EXPECT_FALSE(no_a.value().rewards.contains(Address{}));
    EXPECT_EQ(no_a.value().rewards.at(rewardbase), 15);

    auto const none =
        aggregate_reward(rewardbase, split, shares, Address{}, Address{});
    ASSERT_FALSE(none.has_error());
    EXPECT_EQ(none.value().proposer, 17);
    EXPECT_EQ(none.value().treasury_a, 0);
    EXPECT_EQ(none.value().treasury_b, 0);
    EXPECT_EQ(none.value().rewards.size(), 2);
    EXPECT_EQ(sum_rewards(none.value()), 21);
}

TEST(Aggregate, credits_accumulate)
{
    RewardSplit const split{
        .proposer = 10,
        .stakers = 0,
        .treasury_a = 3,
        .treasury_b = 2,
        .remainder = 0};

    auto const res =
        aggregate_reward(rewardbase, split, StakingShares{}, rewardbase, treasury_b);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().proposer, 10);
    EXPECT_EQ(res.value().treasury_a, 3);
    EXPECT_EQ(res.value().rewards.size(), 2);
    EXPECT_EQ(res.value().rewards.at(rewardbase), 13);
}

TEST(BlockReward, deferred_kore)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    RewardMetrics metrics;

    auto const res = calc_deferred_reward(
        kore_header,
        config,
        make_staking_info(treasury_a, treasury_b),
        metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    EXPECT_EQ(spec.minted, 1'000);
    EXPECT_EQ(spec.fee, 1'000);
    EXPECT_EQ(spec.burnt, 900);
    EXPECT_EQ(spec.proposer, 500);
    EXPECT_EQ(spec.stakers, 100);
    EXPECT_EQ(spec.treasury_a, 250);
    EXPECT_EQ(spec.treasury_b, 250);

    EXPECT_EQ(spec.rewards.size(), 5);
    EXPECT_EQ(spec.rewards.at(rewardbase), 500);
    EXPECT_EQ(spec.rewards.at(treasury_a), 250);
    EXPECT_EQ(spec.rewards.at(treasury_b), 250);
    EXPECT_EQ(spec.rewards.at(r1), 25);
    EXPECT_EQ(spec.rewards.at(r2), 75);
    expect_conserved(spec);

    EXPECT_EQ(metrics.num_deferred(), 1);
}

TEST(BlockReward, deferred_without_staking_info)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    RewardMetrics metrics;

    auto const res =
        calc_deferred_reward(kore_header, config, std::nullopt, metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    // stakers and both treasuries fold into the proposer
    EXPECT_EQ(spec.proposer, 1'100);
    EXPECT_EQ(spec.stakers, 0);
    EXPECT_EQ(spec.treasury_a, 0);
    EXPECT_EQ(spec.treasury_b, 0);
    ASSERT_EQ(spec.rewards.size(), 1);
    EXPECT_EQ(spec.rewards.at(rewardbase), 1'100);
    expect_conserved(spec);
}

TEST(BlockReward, deferred_without_treasury_a)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    RewardMetrics metrics;

    auto const res = calc_deferred_reward(
        kore_header,
        config,
        make_staking_info(Address{}, treasury_b),
        metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    EXPECT_EQ(spec.proposer, 750);
    EXPECT_EQ(spec.treasury_a, 0);
    EXPECT_EQ(spec.treasury_b, 250);
    EXPECT_FALSE(spec.rewards.contains(Address{}));
    EXPECT_FALSE(spec.rewards.contains(treasury_a));
    EXPECT_EQ(spec.rewards.at(rewardbase), 750);
    EXPECT_EQ(spec.rewards.at(treasury_b), 250);
    expect_conserved(spec);
}

TEST(BlockReward, deferred_legacy_remainder_to_treasury_a)
{
    auto const config =
        make_config(ProposerPolicy::WeightedRandom, true, "34/33/33");
    BlockHeader const header{
        .number = 5, .gas_used = 1, .rewardbase = rewardbase};
    RewardMetrics metrics;

    // 1001 split: 340 / 330 / 330, one unit lost
    auto const res = calc_deferred_reward(
        header, config, make_staking_info(treasury_a, treasury_b), metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    EXPECT_EQ(spec.fee, 1);
    EXPECT_EQ(spec.burnt, 0);
    EXPECT_EQ(spec.proposer, 340);
    EXPECT_EQ(spec.stakers, 0);
    EXPECT_EQ(spec.treasury_a, 331);
    EXPECT_EQ(spec.treasury_b, 330);
    EXPECT_EQ(spec.rewards.size(), 3);
    expect_conserved(spec);
}

TEST(BlockReward, deferred_share_remainder_to_proposer)
{
    auto config = make_config(ProposerPolicy::WeightedRandom, true);
    config.governance.reward.minting_amount = 1'012;
    BlockHeader const header{
        .number = 25,
        .gas_used = 0,
        .base_fee_per_gas = 1,
        .rewardbase = rewardbase};
    RewardMetrics metrics;

    // cn 506, stakers 101: shares 25 and 75, one unit back to the proposer
    auto const res = calc_deferred_reward(
        header, config, make_staking_info(treasury_a, treasury_b), metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    EXPECT_EQ(spec.proposer, 405);
    EXPECT_EQ(spec.stakers, 100);
    EXPECT_EQ(spec.rewards.at(r1), 25);
    EXPECT_EQ(spec.rewards.at(r2), 75);
    expect_conserved(spec);
}

TEST(BlockReward, simple)
{
    auto const config = make_config(ProposerPolicy::RoundRobin, true);
    FailingStakingInfoProvider const staking;
    RewardMetrics metrics;

    BlockHeader const legacy{
        .number = 5, .gas_used = 0, .rewardbase = rewardbase};
    auto const res = get_block_reward(legacy, config, staking, metrics);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().proposer, 1'000);
    EXPECT_EQ(res.value().stakers, 0);
    EXPECT_EQ(res.value().treasury_a, 0);
    EXPECT_EQ(res.value().treasury_b, 0);
    ASSERT_EQ(res.value().rewards.size(), 1);
    EXPECT_EQ(res.value().rewards.at(rewardbase), 1'000);

    // the deferred computation never ran
    EXPECT_EQ(metrics.num_deferred(), 0);
}

TEST(BlockReward, simple_magma)
{
    auto const config = make_config(ProposerPolicy::Sticky, false);
    FailingStakingInfoProvider const staking;
    RewardMetrics metrics;

    BlockHeader const header{
        .number = 15,
        .gas_used = 11,
        .base_fee_per_gas = 5,
        .rewardbase = rewardbase};
    auto const res = get_block_reward(header, config, staking, metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    // half of 55 burnt and half rewarded, regardless of fee deferral
    EXPECT_EQ(spec.minted, 1'000);
    EXPECT_EQ(spec.fee, 55);
    EXPECT_EQ(spec.burnt, 27);
    EXPECT_EQ(spec.proposer, 1'027);
    EXPECT_EQ(spec.rewards.at(rewardbase), 1'027);
}

TEST(BlockReward, simple_kore_has_no_cap)
{
    auto const config = make_config(ProposerPolicy::RoundRobin, true);
    FailingStakingInfoProvider const staking;
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().burnt, 500);
    EXPECT_EQ(res.value().proposer, 1'500);
}

TEST(BlockReward, deferred_policy)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    StaticStakingInfoProvider const staking{
        make_staking_info(treasury_a, treasury_b)};
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().proposer, 500);
    EXPECT_EQ(res.value().rewards.size(), 5);
    expect_conserved(res.value());
    EXPECT_EQ(metrics.num_deferred(), 1);
}

TEST(BlockReward, fee_not_deferred)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, false);
    StaticStakingInfoProvider const staking{
        make_staking_info(treasury_a, treasury_b)};
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_FALSE(res.has_error());
    auto const &spec = res.value();

    // the deferred part sees no fee, the block fee paid during execution is
    // added back to the proposer
    EXPECT_EQ(spec.fee, 0);
    EXPECT_EQ(spec.burnt, 0);
    EXPECT_EQ(spec.proposer, 1'400);
    EXPECT_EQ(spec.stakers, 100);
    EXPECT_EQ(spec.rewards.at(rewardbase), 1'400);
    EXPECT_EQ(spec.rewards.at(r1), 25);
    EXPECT_EQ(spec.rewards.at(r2), 75);
}

TEST(BlockReward, missing_consensus_config)
{
    auto config = make_config(ProposerPolicy::WeightedRandom, true);
    config.istanbul.reset();
    StaticStakingInfoProvider const staking{std::nullopt};
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), RewardError::MissingConsensusConfig);
}

TEST(BlockReward, invalid_fork_order)
{
    auto config = make_config(ProposerPolicy::WeightedRandom, true);
    config.magma_block.reset();
    StaticStakingInfoProvider const staking{std::nullopt};
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ConfigError::InvalidForkOrder);
}

TEST(BlockReward, staking_failure)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    FailingStakingInfoProvider const staking;
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), RewardError::CollaboratorFailure);
}

TEST(BlockReward, malformed_ratio)
{
    auto const config =
        make_config(ProposerPolicy::WeightedRandom, true, "50/50");
    StaticStakingInfoProvider const staking{std::nullopt};
    RewardMetrics metrics;

    auto const res = get_block_reward(kore_header, config, staking, metrics);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), RewardError::MalformedRatio);
}

TEST(BlockReward, distribute_block_reward)
{
    auto const config = make_config(ProposerPolicy::WeightedRandom, true);
    RewardMetrics metrics;
    auto const res = calc_deferred_reward(
        kore_header,
        config,
        make_staking_info(treasury_a, treasury_b),
        metrics);
    ASSERT_FALSE(res.has_error());

    RecordingBalanceAdder balances;
    distribute_block_reward(balances, res.value().rewards);
    auto const &rewards = res.value().rewards;
    ASSERT_EQ(balances.balances.size(), rewards.size());
    for (auto const &[address, amount] : rewards) {
        EXPECT_EQ(balances.balances.at(address), amount);
    }
}
