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

#include <tithe/core/config.hpp>
#include <tithe/core/fmt/address_fmt.hpp>
#include <tithe/core/int.hpp>
#include <tithe/reward/reward_spec.hpp>
#include <tithe/reward/reward_spec_json.hpp>

#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

TITHE_NAMESPACE_BEGIN

nlohmann::json to_json(RewardSpec const &spec)
{
    nlohmann::json res{};
    res["minted"] = intx::to_string(spec.minted);
    res["fee"] = intx::to_string(spec.fee);
    res["burnt"] = intx::to_string(spec.burnt);
    res["proposer"] = intx::to_string(spec.proposer);
    res["stakers"] = intx::to_string(spec.stakers);
    res["treasuryA"] = intx::to_string(spec.treasury_a);
    res["treasuryB"] = intx::to_string(spec.treasury_b);
    res["rewards"] = nlohmann::json::object();
    for (auto const &[address, amount] : spec.rewards) {
        res["rewards"][fmt::format("{}", address)] = intx::to_string(amount);
    }
    return res;
}

TITHE_NAMESPACE_END
