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

#include"pipeline.h"
#include"util.h"

#include<map>
#include<set>

using namespace std;

int RunReport::numBillableMonths() const
{
    int n = 0;
    for (auto &ms : months)
    {
        if (ms.billable) n++;
    }
    return n;
}

static string excludedReason(const vector<Month> &non_billable, const map<Month,const MonthStatus*> &statuses)
{
    string r;
    for (auto &m : non_billable)
    {
        if (r != "") r += "; ";
        auto i = statuses.find(m);
        string why = i == statuses.end() ? string("not checked") : i->second->reason();
        r += "month "+m.str()+" incomplete: "+why;
    }
    return r;
}

bool runBilling(const Configuration &config, IntervalStore *store, RunReport *report)
{
    const Collective &collective = config.collective;
    map<Month,MonthAllocation> allocations;
    map<Month,bool> billable;
    set<string> seen;

    for (auto &month : monthsBetween(config.period_start, config.period_end))
    {
        MeterReadings readings;
        if (!fetchMonthReadings(month, collective, store, &readings))
        {
            report->error = "could not fetch the readings of "+month.str();
            return false;
        }
        for (auto &p : readings)
        {
            if (p.second.size() > 0) seen.insert(p.first);
        }

        MonthStatus ms = checkMonth(month, collective.allMeters(), readings);
        billable[month] = ms.billable;

        if (ms.billable)
        {
            MonthAllocation &ma = allocations[month];
            if (!allocateMonth(month, collective, readings, &ma))
            {
                // The energy balance did not hold, do not bill the month.
                ms.billable = false;
                ms.allocation_failed = true;
                billable[month] = false;
                allocations.erase(month);
                ms.warnings.push_back("allocation of "+month.str()+" failed");
            }
            else
            {
                crossCheckVirtual(ma, collective, readings, &ms.warnings);
            }
        }
        report->months.push_back(ms);
    }

    for (const Meter *m : collective.allMeters())
    {
        if (seen.count(m->external_id) == 0)
        {
            report->warnings.push_back(tostrprintf("meter %s has no data between %s and %s",
                                                   m->external_id.c_str(),
                                                   config.period_start.str().c_str(),
                                                   config.period_end.str().c_str()));
        }
    }

    map<Month,const MonthStatus*> statuses;
    for (auto &ms : report->months) statuses[ms.month] = &ms;

    CalendarResult cr = partition(config.period_start, config.period_end, config.interval, &report->periods);
    if (cr.type != CalendarResultType::Success)
    {
        report->error = cr.msg;
        return false;
    }

    vector<const Member*> members = collective.billedMembers();
    for (auto &period : report->periods)
    {
        vector<Bill> bills;
        bool excluded = false;
        for (const Member *member : members)
        {
            Bill bill;
            AggregationResult ar = aggregate(*member, period, allocations, config.rates, billable,
                                             config.daily_detail, &bill);
            if (ar.type == AggregationResultType::Success)
            {
                bills.push_back(bill);
                continue;
            }

            ExcludedPeriod ep;
            ep.period = period;
            ep.months = ar.non_billable;
            ep.reason = ar.type == AggregationResultType::NonBillablePeriod ?
                excludedReason(ar.non_billable, statuses) : ar.msg;
            report->excluded.push_back(ep);
            excluded = true;
            verbose("(pipeline) excluded period %s: %s\n", period.label.c_str(), ep.reason.c_str());
            break;
        }
        if (!excluded)
        {
            report->bills.insert(report->bills.end(), bills.begin(), bills.end());
        }
    }

    verbose("(pipeline) %d of %zu months billable, %zu bills, %zu periods excluded\n",
            report->numBillableMonths(), report->months.size(), report->bills.size(), report->excluded.size());
    return true;
}
