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

#ifndef PIPELINE_H
#define PIPELINE_H

#include"allocation.h"
#include"billing.h"
#include"config.h"
#include"quality.h"
#include"readings.h"

#include<string>
#include<vector>

struct ExcludedPeriod
{
    BillingPeriod period;
    std::vector<Month> months; // The months that were not billable.
    std::string reason;        // month 2025-03 incomplete: meter CH101 missing 1 slot(s)
};

struct RunReport
{
    std::vector<MonthStatus> months;
    std::vector<BillingPeriod> periods;
    std::vector<Bill> bills;
    std::vector<ExcludedPeriod> excluded;
    std::vector<std::string> warnings;
    std::string error;

    int numBillableMonths() const;
};

// Check every month of the configured range, allocate the billable months and
// produce the bills of every billable period. Periods with incomplete months are
// recorded as excluded. Returns false (with report->error set) only if the readings
// could not be fetched or the range could not be partitioned.
bool runBilling(const Configuration &config, IntervalStore *store, RunReport *report);

#endif
