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

#include <tithe/chain/revision.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>

TITHE_NAMESPACE_BEGIN

inline constexpr size_t REWARD_RATIO_PARTS = 3;
inline constexpr size_t STAKING_RATIO_PARTS = 2;

enum class ProposerPolicy : uint64_t
{
    RoundRobin = 0,
    Sticky = 1,
    WeightedRandom = 2,
};

struct IstanbulConfig
{
    uint64_t epoch{604800};
    ProposerPolicy proposer_policy{ProposerPolicy::RoundRobin};
    uint64_t sub_group_size{21};

    friend bool
    operator==(IstanbulConfig const &, IstanbulConfig const &) = default;
};

// Governance parameters of the block reward. Snapshotted per block by the
// governance module and read-only here.
struct RewardConfig
{
    uint256_t minting_amount{0};
    // "cn/treasury_a/treasury_b" weights of the pool split
    std::string ratio{"100/0/0"};
    // "proposer/stakers" weights of the sub-split of the cn pool
    std::string staking_ratio{"100/0"};
    // in whole coins, compared against StakingNode::staking_amount
    uint64_t minimum_stake{0};
    // fees are distributed at the end of the block instead of being paid to
    // the proposer during transaction execution
    bool deferred_tx_fee{false};

    friend bool operator==(RewardConfig const &, RewardConfig const &) = default;
};

struct GovernanceConfig
{
    RewardConfig reward{};

    friend bool
    operator==(GovernanceConfig const &, GovernanceConfig const &) = default;
};

struct ChainConfig
{
    uint64_t chain_id{0};
    // gas price before the magma revision
    uint64_t unit_price{0};
    std::optional<uint64_t> magma_block{std::nullopt};
    std::optional<uint64_t> kore_block{std::nullopt};
    std::optional<IstanbulConfig> istanbul{std::nullopt};
    GovernanceConfig governance{};

    bool is_magma_fork_enabled(uint64_t block_number) const noexcept;
    bool is_kore_fork_enabled(uint64_t block_number) const noexcept;

    reward_revision get_reward_revision(uint64_t block_number) const noexcept;

    friend bool operator==(ChainConfig const &, ChainConfig const &) = default;
};

Result<void> validate_chain_config(ChainConfig const &);

TITHE_NAMESPACE_END
