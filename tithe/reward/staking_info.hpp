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

#include <tithe/core/address.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/result.hpp>

#include <cstdint>
#include <optional>
#include <vector>

TITHE_NAMESPACE_BEGIN

// One registered council node as recorded by the staking snapshot.
struct StakingEntry
{
    Address node{};
    Address staking_contract{};
    Address reward_address{};
    // in whole coins
    uint64_t staking_amount{0};

    friend bool operator==(StakingEntry const &, StakingEntry const &) = default;
};

// Nodes paying out to the same reward address, merged.
struct StakingNode
{
    std::vector<Address> nodes{};
    std::vector<Address> staking_contracts{};
    Address reward_address{};
    uint64_t staking_amount{0};

    friend bool operator==(StakingNode const &, StakingNode const &) = default;
};

struct StakingInfo
{
    uint64_t block_number{0};
    std::vector<StakingEntry> entries{};
    // a zero address means the treasury is not configured
    Address treasury_a{};
    Address treasury_b{};

    // Merges entries by reward address, in order of first appearance.
    std::vector<StakingNode> consolidated_nodes() const;

    friend bool operator==(StakingInfo const &, StakingInfo const &) = default;
};

// Per-block staking snapshot lookup. Declared here as a narrow interface so
// this library does not depend on the module that owns the snapshots.
struct StakingInfoProvider
{
    virtual ~StakingInfoProvider() = default;

    // std::nullopt before staking is activated
    virtual Result<std::optional<StakingInfo>>
    staking_info_at(uint64_t block_number) const = 0;
};

TITHE_NAMESPACE_END
