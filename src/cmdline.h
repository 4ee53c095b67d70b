/*
 Copyright (C) 2017-2022 Fredrik Öhrström (gpl-3.0-or-later)

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
*/

#ifndef CMDLINE_H
#define CMDLINE_H

#include"config.h"

#include<memory>
#include<string.h>
#include<vector>

using namespace std;

// Only the options are parsed here, the configuration files
// are loaded later using the root found in --useconfig=<root>
shared_ptr<Configuration> parseCommandLine(int argc, char **argv);
void enableEarlyLoggingFromCommandLine(int argc, char **argv);

#endif
