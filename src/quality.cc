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

#include"quality.h"
#include"util.h"

#include<set>

using namespace std;

#define MAX_LISTED_GAPS 5

string MonthStatus::reason() const
{
    if (billable) return "";
    if (allocation_failed) return "energy balance of the allocation failed";
    if (missing.size() == 0) return "no physical meters";

    string r;
    for (auto &p : missing)
    {
        if (r != "") r += ", ";
        r += tostrprintf("meter %s missing %d slot(s)", p.first.c_str(), p.second);
    }
    return r;
}

vector<string> summarizeGaps(const vector<Slot> &gaps)
{
    vector<string> runs;
    size_t i = 0;
    int total_runs = 0;
    while (i < gaps.size())
    {
        size_t j = i;
        while (j+1 < gaps.size() && gaps[j+1].start == gaps[j].start+SLOT_SECONDS) j++;

        if (total_runs < MAX_LISTED_GAPS)
        {
            runs.push_back(tostrprintf("%s -> %s (%zu slots)",
                                       gaps[i].str().c_str(), gaps[j].str().c_str(), j-i+1));
        }
        total_runs++;
        i = j+1;
    }
    if (total_runs > MAX_LISTED_GAPS)
    {
        runs.push_back(tostrprintf("(and %d more)", total_runs-MAX_LISTED_GAPS));
    }
    return runs;
}

MonthStatus checkMonth(const Month &month, const vector<const Meter*> &meters,
                       const MeterReadings &readings)
{
    MonthStatus ms;
    ms.month = month;

    vector<Slot> expected;
    expectedSlots(month, &expected);
    ms.expected_slots = expected.size();

    bool has_physical = false;

    for (const Meter *m : meters)
    {
        if (m->isPhysical()) has_physical = true;

        set<time_t> present;
        int unexpected = 0;
        auto r = readings.find(m->external_id);
        if (r != readings.end())
        {
            for (auto &ir : r->second)
            {
                if (!ir.valid) continue;
                if (ir.start < expected.front().start ||
                    ir.start > expected.back().start ||
                    (ir.start - expected.front().start) % SLOT_SECONDS != 0)
                {
                    unexpected++;
                    continue;
                }
                present.insert(ir.start);
            }
        }

        if (unexpected > 0)
        {
            ms.unexpected[m->external_id] = unexpected;
            ms.warnings.push_back(tostrprintf("meter %s has %d reading(s) outside the slots of %s",
                                              m->external_id.c_str(), unexpected, month.str().c_str()));
        }

        if (present.size() == expected.size()) continue;

        vector<Slot> gaps;
        for (auto &s : expected)
        {
            if (present.count(s.start) == 0) gaps.push_back(s);
        }

        if (m->isPhysical())
        {
            ms.missing[m->external_id] = (int)gaps.size();
            ms.gaps[m->external_id] = gaps;
        }
        else
        {
            string w = tostrprintf("virtual meter %s missing %zu slot(s) in %s",
                                   m->external_id.c_str(), gaps.size(), month.str().c_str());
            for (auto &run : summarizeGaps(gaps)) w += "\n    "+run;
            ms.warnings.push_back(w);
        }
    }

    ms.billable = has_physical && ms.missing.size() == 0;
    trace("(quality) %s %zu expected slots billable=%s\n", month.str().c_str(), ms.expected_slots,
          ms.billable ? "true" : "false");
    return ms;
}

bool fetchMonthReadings(const Month &month, const Collective &collective,
                        IntervalStore *store, MeterReadings *readings)
{
    time_t from = localMidnight(month.first());
    time_t to = localMidnight(month.end());

    for (const Meter *m : collective.allMeters())
    {
        vector<IntervalReading> &v = (*readings)[m->external_id];
        if (!store->readings(m->external_id, from, to, &v))
        {
            return false;
        }
    }
    return true;
}

bool checkCollective(const Date &start, const Date &end, const Collective &collective,
                     IntervalStore *store, vector<MonthStatus> *statuses)
{
    set<string> seen;
    size_t first = statuses->size();

    for (auto &month : monthsBetween(start, end))
    {
        MeterReadings readings;
        if (!fetchMonthReadings(month, collective, store, &readings))
        {
            return false;
        }
        for (auto &p : readings)
        {
            if (p.second.size() > 0) seen.insert(p.first);
        }
        statuses->push_back(checkMonth(month, collective.allMeters(), readings));
    }

    if (statuses->size() > first)
    {
        for (const Meter *m : collective.allMeters())
        {
            if (seen.count(m->external_id) == 0)
            {
                (*statuses)[first].warnings.push_back(tostrprintf("meter %s has no data between %s and %s",
                                                                  m->external_id.c_str(),
                                                                  start.str().c_str(), end.str().c_str()));
            }
        }
    }
    return true;
}

void logMonthStatus(const MonthStatus &ms)
{
    for (auto &w : ms.warnings)
    {
        warning("(quality) %s\n", w.c_str());
    }

    if (ms.billable)
    {
        verbose("(quality) %s billable\n", ms.month.str().c_str());
        return;
    }

    notice("(quality) %s NOT billable: %s\n", ms.month.str().c_str(), ms.reason().c_str());
    for (auto &p : ms.gaps)
    {
        for (auto &run : summarizeGaps(p.second))
        {
            verbose("(quality)     %s %s\n", p.first.c_str(), run.c_str());
        }
    }
}
