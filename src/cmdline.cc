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

#include"cmdline.h"
#include"util.h"

#include<string>

using namespace std;

void enableEarlyLoggingFromCommandLine(int argc, char **argv)
{
    int i = 1;
    // First find all logging flags, --silent --verbose --normal --debug
    while (argv[i] && argv[i][0] == '-')
    {
        if (!strcmp(argv[i], "--silent")) {
            i++;
            silentLogging(true);
            continue;
        }
        if (!strcmp(argv[i], "--verbose")) {
            verboseEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--normal")) {
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--debug")) {
            verboseEnabled(true);
            debugEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--trace")) {
            verboseEnabled(true);
            debugEnabled(true);
            traceEnabled(true);
            i++;
            continue;
        }
        i++;
    }
}

shared_ptr<Configuration> parseCommandLine(int argc, char **argv)
{
    Configuration *c = new Configuration;

    if (argc < 2)
    {
        c->need_help = true;
        return shared_ptr<Configuration>(c);
    }

    int i = 1;

    while (argv[i] && argv[i][0] == '-')
    {
        if (!strcmp(argv[i], "-h") || !strcmp(argv[i], "-help") || !strcmp(argv[i], "--help")) {
            c->need_help = true;
            return shared_ptr<Configuration>(c);
        }
        if (!strcmp(argv[i], "--version")) {
            c->version = true;
            return shared_ptr<Configuration>(c);
        }
        if (!strncmp(argv[i], "--useconfig", 11))
        {
            if (strlen(argv[i]) == 11)
            {
                c->useconfig = true;
                c->config_root = "";
            }
            else if (strlen(argv[i]) > 12 && argv[i][11] == '=')
            {
                size_t len = strlen(argv[i]) - 12;
                c->useconfig = true;
                c->config_root = string(argv[i]+12, len);
                if (c->config_root == "/") {
                    c->config_root = "";
                }
            }
            else
            {
                error("You must supply a directory to --useconfig=dir\n");
            }
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--verbose") ||
            !strcmp(argv[i], "--normal") ||
            !strcmp(argv[i], "--silent") ||
            !strcmp(argv[i], "--debug") ||
            !strcmp(argv[i], "--trace"))
        {
            c->overrides.loglevel_override = argv[i]+2;
            debug("(cmdline) loglevel override \"%s\"\n", c->overrides.loglevel_override.c_str());
            i++;
            continue;
        }
        if (!strncmp(argv[i], "--format=", 9))
        {
            string f = argv[i]+9;
            if (f != "hr" && f != "fields" && f != "json")
            {
                error("Unknown output format: \"%s\"\n", f.c_str());
            }
            c->overrides.format_override = f;
            i++;
            continue;
        }
        if (!strncmp(argv[i], "--separator=", 12))
        {
            if (strlen(argv[i]) != 13)
            {
                error("You must supply a single character as the field separator.\n");
            }
            c->overrides.separator_override = argv[i]+12;
            i++;
            continue;
        }
        if (!strncmp(argv[i], "--interval=", 11))
        {
            string s = argv[i]+11;
            if (toBillingInterval(s) == BillingInterval::Unknown)
            {
                error("Unknown billing interval \"%s\" expected one of: %s\n", s.c_str(), availableBillingIntervals());
            }
            c->overrides.interval_override = s;
            i++;
            continue;
        }
        if (!strncmp(argv[i], "--billfiles", 11))
        {
            if (strlen(argv[i]) > 12 && argv[i][11] == '=')
            {
                c->overrides.billfiles_override = argv[i]+12;
            }
            else
            {
                c->overrides.billfiles_override = "/tmp";
            }
            if (!checkIfDirExists(c->overrides.billfiles_override.c_str()))
            {
                error("Cannot write bill files into dir \"%s\"\n", c->overrides.billfiles_override.c_str());
            }
            i++;
            continue;
        }
        if (!strncmp(argv[i], "--logfile=", 10)) {
            size_t len = strlen(argv[i])-10;
            if (len > 0) {
                c->overrides.logfile_override = string(argv[i]+10, len);
            } else {
                error("Not a valid log file name.\n");
            }
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--dailydetail")) {
            c->overrides.dailydetail_override = true;
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--checkonly")) {
            c->checkonly = true;
            i++;
            continue;
        }
        error("Unknown option \"%s\"\n", argv[i]);
    }

    if (i < argc)
    {
        error("Usage error: too many arguments \"%s\"\n", argv[i]);
    }

    if (!c->useconfig)
    {
        error("Usage error: you must supply the configuration root using --useconfig=<dir>\n");
    }

    return shared_ptr<Configuration>(c);
}
