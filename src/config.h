/*
 Copyright (C) 2019-2021 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef CONFIG_H
#define CONFIG_H

#include"billing.h"
#include"calendar.h"
#include"collective.h"
#include"units.h"
#include"util.h"

#include<memory>
#include<vector>

using namespace std;

enum class OutputFormat
{
    HR, Fields, Json
};

// These values can be overridden from the command line.
struct ConfigOverrides
{
    std::string loglevel_override;
    std::string logfile_override;
    std::string format_override;
    std::string separator_override;
    std::string interval_override;
    std::string billfiles_override;
    bool dailydetail_override {};
};

struct Configuration
{
    ConfigOverrides overrides;
    bool useconfig {};
    std::string config_root;
    bool need_help {};
    bool version {};
    bool silent {};
    bool verbose {};
    bool debug {};
    bool trace {};
    bool checkonly {}; // Only check the quality of the readings, do not print any bills.
    AddLogTimestamps addtimestamps {};
    bool use_logfile {};
    std::string logfile;

    std::string name;
    std::string timezone = "Europe/Zurich";
    Date period_start; // Inclusive, first day of a month.
    Date period_end;   // Exclusive, first day of a month.
    BillingInterval interval = BillingInterval::Monthly;
    Rates rates;
    std::string readings_dir = "readings";

    OutputFormat format = OutputFormat::HR;
    char separator { ';' };
    bool billfiles {};
    std::string billfiles_dir;
    bool daily_detail {};

    Collective collective;

    // Problems found while parsing, reported together by checkConfiguration.
    std::vector<std::string> problems;

    ~Configuration() = default;
};

// Load <root>/etc/vzevcalc.conf and the member files in <root>/etc/vzevcalc.d
// or, if not found, <root>/vzevcalc.conf and <root>/vzevcalc.d
// Exits with an error if the configuration cannot be used.
shared_ptr<Configuration> loadConfiguration(string root, ConfigOverrides overrides);

void parseMainConfig(Configuration *c, vector<char> &buf, string file);
// The member id is the name of the file.
void parseMemberConfig(Configuration *c, vector<char> &buf, string file);
void applyOverrides(Configuration *c, const ConfigOverrides &overrides);

// Returns false and appends the problems if the configuration cannot be used for billing.
bool checkConfiguration(Configuration *c, vector<string> *problems);

void handleLoglevel(Configuration *c, string loglevel);
void handleFormat(Configuration *c, string format);
void handleSeparator(Configuration *c, string s);
void handleInterval(Configuration *c, string s);

#endif
