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
#include <tithe/core/address.hpp>
#include <tithe/core/config.hpp>
#include <tithe/core/fmt/address_fmt.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/log_level_map.hpp>
#include <tithe/core/result.hpp>
#include <tithe/reward/block_reward.hpp>
#include <tithe/reward/fmt/reward_spec_fmt.hpp>
#include <tithe/reward/reward_distributor.hpp>
#include <tithe/reward/reward_error.hpp>
#include <tithe/reward/reward_metrics.hpp>
#include <tithe/reward/reward_spec_json.hpp>
#include <tithe/reward/staking_info.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

using namespace tithe;

namespace
{
    // a single snapshot, valid for the blocks from its own number on
    class FileStakingInfoProvider final : public StakingInfoProvider
    {
        std::optional<StakingInfo> info_;

    public:
        explicit FileStakingInfoProvider(std::optional<StakingInfo> info)
            : info_{std::move(info)}
        {
        }

        Result<std::optional<StakingInfo>>
        staking_info_at(uint64_t const block_number) const override
        {
            if (TITHE_UNLIKELY(
                    info_.has_value() && info_->block_number > block_number)) {
                LOG_ERROR(
                    "staking snapshot of block {} requested for block {}",
                    info_->block_number,
                    block_number);
                return RewardError::CollaboratorFailure;
            }
            return info_;
        }
    };

    class FileGovernanceHelper final : public GovernanceHelper
    {
        RewardConfig params_;

    public:
        explicit FileGovernanceHelper(RewardConfig params)
            : params_{std::move(params)}
        {
        }

        Result<RewardConfig> params_at(uint64_t) const override
        {
            return params_;
        }
    };

    class LoggingBalanceAdder final : public BalanceAdder
    {
    public:
        void add_balance(Address const &address, uint256_t const &amount) override
        {
            LOG_INFO("credit {} {}", address, amount);
        }
    };

    struct Inputs
    {
        ChainConfig config;
        BlockHeader header;
        std::optional<StakingInfo> staking_info;
        RewardConfig params;
    };

    Result<Inputs> load_inputs(
        fs::path const &config_path, fs::path const &header_path,
        fs::path const &staking_path, fs::path const &params_path)
    {
        BOOST_OUTCOME_TRY(auto const config_json, read_json_file(config_path));
        BOOST_OUTCOME_TRY(auto config, chain_config_from_json(config_json));

        BOOST_OUTCOME_TRY(auto const header_json, read_json_file(header_path));
        BOOST_OUTCOME_TRY(auto const header, block_header_from_json(header_json));

        std::optional<StakingInfo> staking_info;
        if (!staking_path.empty()) {
            BOOST_OUTCOME_TRY(
                auto const staking_json, read_json_file(staking_path));
            BOOST_OUTCOME_TRY(
                auto info, staking_info_from_json(staking_json));
            staking_info = std::move(info);
        }

        RewardConfig params = config.governance.reward;
        if (!params_path.empty()) {
            BOOST_OUTCOME_TRY(
                auto const params_json, read_json_file(params_path));
            BOOST_OUTCOME_TRY(auto p, reward_config_from_json(params_json));
            params = std::move(p);
        }

        return Inputs{
            .config = std::move(config),
            .header = header,
            .staking_info = std::move(staking_info),
            .params = std::move(params)};
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"tithe"};
    cli.option_defaults()->always_capture_default();

    fs::path config_path;
    fs::path header_path;
    fs::path staking_path;
    fs::path params_path;
    bool distribute = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--config", config_path, "chain config json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--header", header_path, "block header json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option(
           "--staking",
           staking_path,
           "staking snapshot json file, none before staking is activated")
        ->check(CLI::ExistingFile);
    cli.add_option(
           "--params",
           params_path,
           "governance reward parameters in effect at the block, defaults to "
           "the ones of the chain config")
        ->check(CLI::ExistingFile);
    cli.add_flag(
        "--distribute", distribute, "log every balance credit of the block");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) %(filename):%(lineno) LOG_%(level_name)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const inputs =
        load_inputs(config_path, header_path, staking_path, params_path);
    if (TITHE_UNLIKELY(inputs.has_error())) {
        LOG_ERROR(
            "could not load inputs: {}",
            inputs.assume_error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    auto const &[config, header, staking_info, params] = inputs.assume_value();

    FileStakingInfoProvider const staking{staking_info};
    FileGovernanceHelper const governance{params};
    RewardDistributor const distributor{governance, staking};
    RewardMetrics metrics;

    auto const result = distributor.get_block_reward(header, config, metrics);
    if (TITHE_UNLIKELY(result.has_error())) {
        LOG_ERROR(
            "block {} failed with: {}",
            header.number,
            result.assume_error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    auto const &spec = result.assume_value();
    LOG_INFO(
        "block {} {} {} deferred_time={}us",
        header.number,
        reward_revision_to_string(config.get_reward_revision(header.number)),
        spec,
        metrics.deferred_time().count());

    if (distribute) {
        LoggingBalanceAdder balances;
        distribute_block_reward(balances, spec.rewards);
    }
    quill::flush();

    std::cout << to_json(spec).dump(2) << std::endl;
    return EXIT_SUCCESS;
}
