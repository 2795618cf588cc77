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

#include <chrono>
#include <cstdint>

TITHE_NAMESPACE_BEGIN

class RewardMetrics
{
    uint32_t n_deferred_{0};
    std::chrono::microseconds deferred_time_{0};

public:
    void set_deferred_time(std::chrono::microseconds const elapsed)
    {
        ++n_deferred_;
        deferred_time_ = elapsed;
    }

    // elapsed time of the last deferred reward computation
    std::chrono::microseconds deferred_time() const
    {
        return deferred_time_;
    }

    uint32_t num_deferred() const
    {
        return n_deferred_;
    }
};

TITHE_NAMESPACE_END
