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
#include <tithe/core/result.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

TITHE_NAMESPACE_BEGIN

struct BlockHeader;
struct ChainConfig;
struct RewardConfig;
struct StakingInfo;

// Amounts are decimal strings, 0x-prefixed hex strings or JSON integers.
// Addresses are 0x-prefixed hex strings. Anything else is
// ConfigError::InvalidConfig.

Result<nlohmann::json> read_json_file(std::filesystem::path const &);

Result<ChainConfig> chain_config_from_json(nlohmann::json const &);

Result<RewardConfig> reward_config_from_json(nlohmann::json const &);

Result<BlockHeader> block_header_from_json(nlohmann::json const &);

// null is a block before staking was activated
Result<std::optional<StakingInfo>>
staking_info_from_json(nlohmann::json const &);

TITHE_NAMESPACE_END
