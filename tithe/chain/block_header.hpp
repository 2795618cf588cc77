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

#include <cstdint>
#include <optional>

TITHE_NAMESPACE_BEGIN

// The header fields a block reward is computed from.
struct BlockHeader
{
    uint64_t number{0};
    uint64_t gas_used{0};

    // present from the magma revision on
    std::optional<uint256_t> base_fee_per_gas{std::nullopt};

    // payout address of the block proposer
    Address rewardbase{};

    friend bool operator==(BlockHeader const &, BlockHeader const &) = default;
};

TITHE_NAMESPACE_END
