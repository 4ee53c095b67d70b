/*
 Copyright (C) 2025 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef QUALITY_H
#define QUALITY_H

#include"calendar.h"
#include"collective.h"
#include"readings.h"

#include<map>
#include<string>
#include<vector>

// Readings of one month, per meter external id.
typedef std::map<std::string,std::vector<IntervalReading>> MeterReadings;

struct MonthStatus
{
    Month month;
    bool billable {};
    // Complete but the energy balance of the allocation did not hold.
    bool allocation_failed {};
    size_t expected_slots {};
    // Only physical meters appear in missing and gaps.
    std::map<std::string,int> missing;
    std::map<std::string,std::vector<Slot>> gaps;
    std::map<std::string,int> unexpected;
    std::vector<std::string> warnings;

    // Why the month is not billable, e.g. "meter CH101 missing 1 slot(s)".
    std::string reason() const;
};

// Check that every physical meter has a valid reading for every slot of the month.
// Gaps of virtual meters and readings outside the expected slots only produce warnings.
MonthStatus checkMonth(const Month &month, const std::vector<const Meter*> &meters,
                       const MeterReadings &readings);

// Fetch the readings of every meter of the collective for the month.
bool fetchMonthReadings(const Month &month, const Collective &collective,
                        IntervalStore *store, MeterReadings *readings);

// Check every month from start up to end. Meters without any reading at
// all are reported once as warnings in the first month status.
bool checkCollective(const Date &start, const Date &end, const Collective &collective,
                     IntervalStore *store, std::vector<MonthStatus> *statuses);

// Summarize the gap runs: "2025-03-12 10:00 -> 2025-03-12 10:45 (4 slots)".
// At most five runs are listed, followed by "(and N more)".
std::vector<std::string> summarizeGaps(const std::vector<Slot> &gaps);

void logMonthStatus(const MonthStatus &status);

#endif
