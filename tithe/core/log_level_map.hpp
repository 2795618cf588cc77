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

#include <quill/LogLevel.h>

#include <string>
#include <unordered_map>

TITHE_NAMESPACE_BEGIN

// accepted spellings for the --log_level option of the tithe tool; reward
// computation logs its intermediate values at debug
inline std::unordered_map<std::string, quill::LogLevel> const log_level_map = {
    {"trace", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warn", quill::LogLevel::Warning},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"critical", quill::LogLevel::Critical},
    {"off", quill::LogLevel::None},
    {"none", quill::LogLevel::None}};

TITHE_NAMESPACE_END
