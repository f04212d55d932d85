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

#include <fstream>
#include <stdio.h>
#include <string.h>

#include "matrixRunner/runnerUtil.h"

#ifdef _WIN32
    #include <windows.h>
    #define GET_PID() GetCurrentProcessId()
#else
    #include <unistd.h>
    #define GET_PID() getpid()
    extern char **environ;
#endif

namespace MatrixRunner
{

std::string Trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

bool ParseKeyValue(const std::string& kv, std::string& outKey, std::string& outValue)
{
   size_t pos = kv.find('=');
   if (pos == std::string::npos)
   {
      return false;
   }

   outKey = Trim(kv.substr(0, pos));
   outValue = kv.substr(pos + 1);
   return !outKey.empty();
}

EnvMap ParseEnvFile(const std::string &filename)
{
    std::ifstream file(filename);
    EnvMap outputVars;
    std::string line, key, value;
    bool inMultiline = false;
    std::string delimiter = "";

    if (!file)
    {
       printf("Error: Could not open file %s\n", filename.c_str());
       return {};
    }

    while (getline(file, line))
    {
        line = Trim(line);

        if (line.empty() || (!inMultiline && line[0] == '#'))
        {
           continue;
        }

        if (inMultiline)
        {
            if (line == delimiter)
            {
                outputVars[key] = value;
                inMultiline = false;
                key = "";
                value = "";
                delimiter = "";
            }
            else
            {
                value += (value.empty() ? "" : "\n") + line;
            }
        }
        else
        {
            std::string val;
            if (ParseKeyValue(line, key, val))
            {
                val = Trim(val);
                if (val.size() > 2 && val.substr(0, 2) == "<<")
                {
                    delimiter = val.substr(2);
                    inMultiline = true;
                    value = "";
                }
                else
                {
                    outputVars[key] = val;
                }
            }
        }
    }

    file.close();
    return outputVars;
}

bool ParseUInt32(const std::string& value, uint32_t& outValue)
{
   if (value.empty() || value.size() > 10)
   {
      return false;
   }

   uint64_t ret = 0;
   for (char c : value)
   {
      if (c < '0' || c > '9')
      {
         return false;
      }
      ret = (ret * 10) + (c - '0');
   }

   if (ret > UINT32_MAX)
   {
      return false;
   }

   outValue = (uint32_t)ret;
   return true;
}

EnvMap GetProcessEnv()
{
   EnvMap env;
#ifndef _WIN32
   for (char** itr = environ; itr && *itr; itr++)
   {
      std::string key, value;
      if (ParseKeyValue(*itr, key, value))
      {
         env[key] = value;
      }
   }
#endif
   return env;
}

std::string SanitizeKey(const std::string& value)
{
   std::string out = value;
   for (char& c : out)
   {
      bool ok = (c >= 'a' && c <= 'z') ||
                (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') ||
                c == '.' || c == '_' || c == '-';
      if (!ok)
      {
         c = '_';
      }
   }
   return out;
}

std::string ToEnvName(const std::string& value)
{
   std::string out = value;
   for (char& c : out)
   {
      if (c >= 'a' && c <= 'z')
      {
         c = c - 'a' + 'A';
      }
      else if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')))
      {
         c = '_';
      }
   }
   return out;
}

std::string MakeTempPrefix(const std::string& jobKey)
{
   return (std::to_string(GET_PID()) + "-run-" + SanitizeKey(jobKey));
}

const char* GetArchName()
{
#if defined(__x86_64__) || defined(_M_X64)
    return "X64";
#elif defined(__i386__) || defined(_M_IX86)
    return "X86";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "ARM64";
#elif defined(__arm__) || defined(_M_ARM)
    return "ARM";
#elif defined(__riscv) && (__riscv_xlen == 64)
    return "RV64";
#else
    return "UNKNOWN";
#endif
}

const char* GetOSName()
{
#if defined(_WIN32) || defined(_WIN64)
    return "Windows";
#elif defined(__linux__)
    return "Linux";
#elif defined(__APPLE__) && defined(__MACH__)
   return "macOS";
#elif defined(__FreeBSD__)
    return "FreeBSD";
#elif defined(__unix__) || defined(__unix)
    return "Unix";
#else
    return "Unknown";
#endif
}

}
