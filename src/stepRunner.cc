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

#include <stdio.h>

#include "matrixRunner/jobTracker.h"
#include "matrixRunner/stepRunner.h"

namespace MatrixRunner
{

void StepContext::log(const char* content, size_t length) const
{
   if (mTracker)
   {
      mTracker->log(content, length);
   }
   else
   {
      printf("STEP: ");
      fwrite(content, length, 1, stdout);
      printf("\n");
   }
}

void StepContext::log(const std::string& content) const
{
   log(content.c_str(), content.size());
}

}
