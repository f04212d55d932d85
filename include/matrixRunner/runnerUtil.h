/*

Copyright (c) 2025 James Urquhart

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.

SPDX-License-Identifier: GPL-3.0-or-later

*/

#pragma once

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

namespace MatrixRunner
{

typedef std::map<std::string, std::string> EnvMap;

std::string Trim(const std::string &str);

// Splits "KEY=VALUE". Returns false if there is no '=' or the key is empty.
bool ParseKeyValue(const std::string& kv, std::string& outKey, std::string& outValue);

// Reads KEY=VALUE lines, with KEY=<<DELIM heredoc values.
EnvMap ParseEnvFile(const std::string &filename);

// Decimal digits only, no sign, must fit in 32 bits
bool ParseUInt32(const std::string& value, uint32_t& outValue);

// Snapshot of the process environment
EnvMap GetProcessEnv();

// Replaces anything outside [A-Za-z0-9._-] with '_'
std::string SanitizeKey(const std::string& value);

// "rust" -> "RUST", "os-name" -> "OS_NAME"
std::string ToEnvName(const std::string& value);

std::string MakeTempPrefix(const std::string& jobKey);

const char* GetArchName();
const char* GetOSName();

}
