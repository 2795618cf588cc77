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

#include <tithe/core/address.hpp>
#include <tithe/core/config.hpp>
#include <tithe/reward/staking_info.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <vector>

TITHE_NAMESPACE_BEGIN

std::vector<StakingNode> StakingInfo::consolidated_nodes() const
{
    std::vector<StakingNode> nodes;
    ankerl::unordered_dense::map<Address, size_t> index;
    for (auto const &entry : entries) {
        auto const [it, inserted] =
            index.try_emplace(entry.reward_address, nodes.size());
        if (inserted) {
            nodes.push_back(StakingNode{
                .nodes = {entry.node},
                .staking_contracts = {entry.staking_contract},
                .reward_address = entry.reward_address,
                .staking_amount = entry.staking_amount});
            continue;
        }
        auto &node = nodes[it->second];
        node.nodes.push_back(entry.node);
        node.staking_contracts.push_back(entry.staking_contract);
        node.staking_amount += entry.staking_amount;
    }
    return nodes;
}

TITHE_NAMESPACE_END
