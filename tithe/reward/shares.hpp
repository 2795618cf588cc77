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

#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/reward_spec.hpp>

#include <optional>

TITHE_NAMESPACE_BEGIN

struct RewardConfig;
struct StakingInfo;

struct StakingShares
{
    // reward address => share, zero shares omitted
    RewardMap shares{};
    // the part of the pool not paid out as a share
    uint256_t remainder{0};
};

// Divides the stakers pool among the consolidated nodes staking more than
// RewardConfig::minimum_stake, in proportion to the amount above it. Without
// a staking snapshot the whole pool is the remainder.
Result<StakingShares> calc_shares(
    RewardConfig const &, std::optional<StakingInfo> const &,
    uint256_t const &stakers);

TITHE_NAMESPACE_END
