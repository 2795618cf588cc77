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
#include <tithe/core/int.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <type_traits>

// Amounts are logged as base-10 strings.
template <>
struct quill::copy_loggable<tithe::uint256_t> : std::true_type
{
};

template <>
struct fmt::formatter<tithe::uint256_t> : public tithe::BasicFormatter
{
    template <typename FormatContext>
    auto format(tithe::uint256_t const &value, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", intx::to_string(value));
    }
};
