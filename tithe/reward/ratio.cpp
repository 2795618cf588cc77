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
#include <tithe/core/int.hpp>
#include <tithe/core/likely.h>
#include <tithe/core/result.hpp>
#include <tithe/reward/ratio.hpp>
#include <tithe/reward/reward_error.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <system_error>

TITHE_NAMESPACE_BEGIN

namespace
{
    std::optional<uint64_t> parse_weight(std::string_view part)
    {
        if (part.starts_with('+')) {
            part.remove_prefix(1);
        }
        if (part.empty()) {
            return std::nullopt;
        }
        uint64_t value = 0;
        auto const *const end = part.data() + part.size();
        auto const [ptr, ec] = std::from_chars(part.data(), end, value, 10);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return value;
    }
}

Result<ParsedRatio>
parse_ratio(std::string_view const s, size_t const expected_parts)
{
    if (TITHE_UNLIKELY(
            static_cast<size_t>(std::ranges::count(s, '/')) + 1 !=
            expected_parts)) {
        return RewardError::MalformedRatio;
    }

    ParsedRatio ratio{.weights = {}, .total = 0};
    ratio.weights.reserve(expected_parts);
    for (auto const part : std::views::split(s, '/')) {
        auto const weight =
            parse_weight(std::string_view{part.begin(), part.end()});
        if (TITHE_UNLIKELY(!weight.has_value())) {
            return RewardError::InvalidRatioValue;
        }
        ratio.weights.push_back(weight.value());
        ratio.total += weight.value();
    }
    return ratio;
}

TITHE_NAMESPACE_END
