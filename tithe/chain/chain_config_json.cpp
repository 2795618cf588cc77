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
#include <tithe/chain/chain_config_json.hpp>
#include <tithe/chain/config_error.hpp>
#include <tithe/core/address.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/result.hpp>
#include <tithe/reward/staking_info.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

TITHE_NAMESPACE_BEGIN

namespace
{
    // throws nlohmann::json::exception or std::invalid_argument
    uint256_t read_amount(nlohmann::json const &j)
    {
        if (j.is_number_unsigned()) {
            return j.get<uint64_t>();
        }
        return intx::from_string<uint256_t>(j.get<std::string>());
    }

    Address read_address(nlohmann::json const &j)
    {
        auto const address = evmc::from_hex<Address>(j.get<std::string>());
        if (TITHE_UNLIKELY(!address.has_value())) {
            throw std::invalid_argument{"invalid address " + j.dump()};
        }
        return address.value();
    }

    Address read_address_or_zero(nlohmann::json const &j, char const *key)
    {
        if (!j.contains(key) || j.at(key).is_null()) {
            return Address{};
        }
        return read_address(j.at(key));
    }

    std::optional<uint64_t>
    read_optional_block(nlohmann::json const &j, char const *key)
    {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::nullopt;
        }
        return j.at(key).get<uint64_t>();
    }

    RewardConfig read_reward_config(nlohmann::json const &j)
    {
        RewardConfig config{};
        config.minting_amount = read_amount(j.at("mintingAmount"));
        config.ratio = j.at("ratio").get<std::string>();
        config.staking_ratio = j.value("stakingRatio", config.staking_ratio);
        config.minimum_stake = j.value("minimumStake", uint64_t{0});
        config.deferred_tx_fee = j.value("deferredTxFee", false);
        return config;
    }

    template <typename F>
    auto read_or_invalid(char const *const what, F &&read)
        -> Result<decltype(read())>
    {
        try {
            return read();
        }
        catch (nlohmann::json::exception const &e) {
            LOG_ERROR("invalid {}: {}", what, e.what());
        }
        catch (std::invalid_argument const &e) {
            LOG_ERROR("invalid {}: {}", what, e.what());
        }
        catch (std::out_of_range const &e) {
            LOG_ERROR("invalid {}: {}", what, e.what());
        }
        return ConfigError::InvalidConfig;
    }
}

Result<nlohmann::json> read_json_file(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (TITHE_UNLIKELY(!in)) {
        LOG_ERROR("could not open {}", path.string());
        return ConfigError::InvalidConfig;
    }
    return read_or_invalid(path.c_str(), [&in] {
        return nlohmann::json::parse(in);
    });
}

Result<ChainConfig> chain_config_from_json(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(
        auto const config, read_or_invalid("chain config", [&j] {
            ChainConfig config{};
            config.chain_id = j.at("chainId").get<uint64_t>();
            config.unit_price = j.value("unitPrice", uint64_t{0});
            config.magma_block = read_optional_block(j, "magmaBlock");
            config.kore_block = read_optional_block(j, "koreBlock");
            if (j.contains("istanbul") && !j.at("istanbul").is_null()) {
                auto const &istanbul = j.at("istanbul");
                IstanbulConfig ist{};
                ist.epoch = istanbul.value("epoch", ist.epoch);
                ist.proposer_policy = static_cast<ProposerPolicy>(
                    istanbul.value("policy", uint64_t{0}));
                ist.sub_group_size = istanbul.value("sub", ist.sub_group_size);
                config.istanbul = ist;
            }
            config.governance.reward =
                read_reward_config(j.at("governance").at("reward"));
            return config;
        }));
    BOOST_OUTCOME_TRY(validate_chain_config(config));
    return config;
}

Result<RewardConfig> reward_config_from_json(nlohmann::json const &j)
{
    return read_or_invalid(
        "reward config", [&j] { return read_reward_config(j); });
}

Result<BlockHeader> block_header_from_json(nlohmann::json const &j)
{
    return read_or_invalid("block header", [&j] {
        BlockHeader header{};
        header.number = j.at("number").get<uint64_t>();
        header.gas_used = j.at("gasUsed").get<uint64_t>();
        if (j.contains("baseFeePerGas") && !j.at("baseFeePerGas").is_null()) {
            header.base_fee_per_gas = read_amount(j.at("baseFeePerGas"));
        }
        header.rewardbase = read_address(j.at("rewardbase"));
        return header;
    });
}

Result<std::optional<StakingInfo>>
staking_info_from_json(nlohmann::json const &j)
{
    return read_or_invalid("staking info", [&j] {
        if (j.is_null()) {
            return std::optional<StakingInfo>{};
        }
        StakingInfo info{};
        info.block_number = j.at("blockNumber").get<uint64_t>();
        for (auto const &node : j.at("nodes")) {
            info.entries.push_back(StakingEntry{
                .node = read_address(node.at("node")),
                .staking_contract = read_address_or_zero(node, "stakingContract"),
                .reward_address = read_address(node.at("rewardAddress")),
                .staking_amount = node.at("stakingAmount").get<uint64_t>()});
        }
        info.treasury_a = read_address_or_zero(j, "treasuryA");
        info.treasury_b = read_address_or_zero(j, "treasuryB");
        return std::optional<StakingInfo>{std::move(info)};
    });
}

TITHE_NAMESPACE_END
