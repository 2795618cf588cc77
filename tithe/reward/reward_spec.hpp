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
#include <tithe/core/int.hpp>
#include <tithe/core/result.hpp>

#include <ankerl/unordered_dense.h>

TITHE_NAMESPACE_BEGIN

using RewardMap = ankerl::unordered_dense::map<Address, uint256_t>;

// The reward paid in one block
struct RewardSpec
{
    uint256_t minted{0}; // newly minted
    uint256_t fee{0}; // total tx fee, before burning
    uint256_t burnt{0};
    uint256_t proposer{0};
    uint256_t stakers{0}; // paid out as staking shares
    uint256_t treasury_a{0};
    uint256_t treasury_b{0};
    RewardMap rewards{}; // recipient => amount
};

// rewards[address] += amount
Result<void>
increment(RewardMap &rewards, Address const &address, uint256_t const &amount);

TITHE_NAMESPACE_END
