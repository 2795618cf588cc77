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

#include <tithe/chain/revision.hpp>

#define EXPLICIT_REWARD_REVISION(f)                                            \
    template decltype(f<REWARD_LEGACY>) f<REWARD_LEGACY>;                      \
    template decltype(f<REWARD_MAGMA>) f<REWARD_MAGMA>;                        \
    template decltype(f<REWARD_KORE>) f<REWARD_KORE>;
