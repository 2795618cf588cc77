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

#include <cstdint>

TITHE_NAMESPACE_BEGIN

// Protocol upgrades that change how a block reward is computed, in
// activation order. A later revision implies every earlier one.
enum reward_revision : uint8_t
{
    // fee priced at the fixed unit price, one pool split of minted + fee
    REWARD_LEGACY = 0,
    // fee priced at the base fee, half of it burnt
    REWARD_MAGMA = 1,
    // pool split of minted only, proposer/staker sub-split, proposer burn cap
    REWARD_KORE = 2,
    REWARD_LATEST_REVISION = REWARD_KORE,
};

constexpr bool is_magma(reward_revision const rev) noexcept
{
    return rev >= REWARD_MAGMA;
}

constexpr bool is_kore(reward_revision const rev) noexcept
{
    return rev >= REWARD_KORE;
}

constexpr char const *reward_revision_to_string(reward_revision const rev)
{
    switch (rev) {
    case REWARD_LEGACY:
        return "LEGACY";
    case REWARD_MAGMA:
        return "MAGMA";
    case REWARD_KORE:
        return "KORE";
    }
    return "UNKNOWN";
}

TITHE_NAMESPACE_END
