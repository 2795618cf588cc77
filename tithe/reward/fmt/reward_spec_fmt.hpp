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

#include <tithe/core/basic_formatter.hpp>
#include <tithe/core/fmt/int_fmt.hpp>
#include <tithe/reward/reward_spec.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<tithe::RewardSpec> : std::true_type
{
};

template <>
struct fmt::formatter<tithe::RewardSpec> : public tithe::BasicFormatter
{
    template <typename FormatContext>
    auto format(tithe::RewardSpec const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "RewardSpec{{minted={} fee={} burnt={} proposer={} stakers={} "
            "treasury_a={} treasury_b={} recipients={}}}",
            value.minted,
            value.fee,
            value.burnt,
            value.proposer,
            value.stakers,
            value.treasury_a,
            value.treasury_b,
            value.rewards.size());
        return ctx.out();
    }
};
