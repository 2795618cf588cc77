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

#include <tithe/chain/chain_config.hpp>
#include <tithe/chain/config_error.hpp>
#include <tithe/chain/revision.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/result.hpp>

#include <cstdint>
#include <optional>

TITHE_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

namespace
{
    bool is_forked(
        std::optional<uint64_t> const &fork_block, uint64_t const block_number)
    {
        return fork_block.has_value() && fork_block.value() <= block_number;
    }
}

bool ChainConfig::is_magma_fork_enabled(
    uint64_t const block_number) const noexcept
{
    return is_forked(magma_block, block_number);
}

bool ChainConfig::is_kore_fork_enabled(
    uint64_t const block_number) const noexcept
{
    return is_forked(kore_block, block_number);
}

reward_revision
ChainConfig::get_reward_revision(uint64_t const block_number) const noexcept
{
    if (is_kore_fork_enabled(block_number)) {
        return REWARD_KORE;
    }
    if (is_magma_fork_enabled(block_number)) {
        return REWARD_MAGMA;
    }
    return REWARD_LEGACY;
}

Result<void> validate_chain_config(ChainConfig const &config)
{
    if (!config.kore_block.has_value()) {
        return success();
    }
    if (TITHE_UNLIKELY(
            !config.magma_block.has_value() ||
            config.magma_block.value() > config.kore_block.value())) {
        return ConfigError::InvalidForkOrder;
    }
    return success();
}

TITHE_NAMESPACE_END
