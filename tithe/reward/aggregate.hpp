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
#include <tithe/reward/reward_spec.hpp>

TITHE_NAMESPACE_BEGIN

struct RewardSplit;
struct StakingShares;

// Folds the remainders and builds the reward map, in this order:
//   1. split remainder into treasury_a
//   2. share remainder into the proposer
//   3. the pool of a treasury with a zero address into the proposer
//   4. credit the proposer, the set treasuries and every share
// Only the pools and the reward map of the returned spec are set.
Result<RewardSpec> aggregate_reward(
    Address const &rewardbase, RewardSplit const &, StakingShares const &,
    Address const &treasury_a, Address const &treasury_b);

TITHE_NAMESPACE_END
