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

#ifndef BILLING_H
#define BILLING_H

#include"allocation.h"
#include"calendar.h"
#include"collective.h"
#include"units.h"

#include<map>
#include<string>
#include<utility>
#include<vector>

struct Rates
{
    Rate local {}; // Price of solar power from inside the collective.
    Rate buy {};   // Price of power from the utility.
    Rate sell {};  // Price the utility pays for exported power.
    std::string currency = "CHF";
};

struct DailyDetail
{
    Date date;
    SlotAllocation flows;
    Money cost {};
    Money revenue {};
};

struct FeeLine
{
    Fee fee;
    Money amount {};
};

struct Bill
{
    std::string member_id;
    std::string first_name;
    std::string last_name;
    std::string street;
    std::string zip;
    std::string city;
    std::string canton;
    bool is_host {};
    bool is_producer {};

    BillingPeriod period;
    Rates rates;
    Rate applied_local_rate {}; // Zero for the host.

    SlotAllocation totals;

    Money local_cost {};
    Money grid_cost {};
    Money total_cost {};
    Money local_revenue {};
    Money export_revenue {};
    Money total_revenue {};
    std::vector<FeeLine> fees;
    Money total_fees {};
    // net = total_cost + total_fees - total_revenue
    // Positive when the member owes the collective, negative when the collective owes the member.
    Money net {};

    std::vector<DailyDetail> days;

    std::string fullName() const;
};

enum class AggregationResultType
{
    Success,
    NonBillablePeriod,
    MissingAllocation
};

struct AggregationResult
{
    AggregationResultType type;
    std::string msg;
    std::vector<Month> non_billable;
};

// Sum up the allocations of the member over the period and price them.
// No bill is produced if any month of the period is not billable.
AggregationResult aggregate(const Member &member,
                            const BillingPeriod &period,
                            const std::map<Month,MonthAllocation> &allocations,
                            const Rates &rates,
                            const std::map<Month,bool> &month_billable,
                            bool daily_detail,
                            Bill *bill);

typedef std::vector<std::pair<std::string,std::string>> ExportRow;

// The bill as a flat list of named values, always in the same order.
ExportRow toExportRow(const Bill &bill);

#endif
