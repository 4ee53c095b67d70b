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

#include"billing.h"
#include"util.h"

using namespace std;

string Bill::fullName() const
{
    if (first_name == "" && last_name == "") return member_id;
    if (first_name == "") return last_name;
    if (last_name == "") return first_name;
    return first_name+" "+last_name;
}

static void price(const SlotAllocation &flows, Rate local_rate, const Rates &rates, bool is_producer,
                  Money *local_cost, Money *grid_cost, Money *local_revenue, Money *export_revenue)
{
    *local_cost = amountOf(flows.local, local_rate);
    *grid_cost = amountOf(flows.grid, rates.buy);
    *local_revenue = 0;
    *export_revenue = 0;
    if (is_producer)
    {
        // The own production consumed by the producer itself is not sold.
        *local_revenue = amountOf(flows.local_sold, rates.local);
        *export_revenue = amountOf(flows.exported, rates.sell);
    }
}

static void chargeFees(const vector<Fee> &fees, Bill *b)
{
    Money running_total = b->total_cost;
    int months = (int)b->period.months.size();

    for (auto &f : fees)
    {
        FeeLine fl;
        fl.fee = f;
        switch (f.type)
        {
        case FeeType::Yearly:
            fl.amount = divRound((__int128)f.value*months, 12);
            break;
        case FeeType::PerKwh:
            fl.amount = amountOf(f.on_grid ? b->totals.grid : b->totals.local, f.value);
            break;
        case FeeType::Percent:
            // The value counts hundredths of a percent.
            fl.amount = divRound((__int128)running_total*f.value, 10000);
            break;
        case FeeType::Unknown:
            break;
        }
        running_total += fl.amount;
        b->total_fees += fl.amount;
        b->fees.push_back(fl);
    }
}

AggregationResult aggregate(const Member &member,
                            const BillingPeriod &period,
                            const map<Month,MonthAllocation> &allocations,
                            const Rates &rates,
                            const map<Month,bool> &month_billable,
                            bool daily_detail,
                            Bill *bill)
{
    AggregationResult result { AggregationResultType::Success, "", {} };

    for (auto &m : period.months)
    {
        auto i = month_billable.find(m);
        if (i == month_billable.end() || !i->second) result.non_billable.push_back(m);
    }
    if (result.non_billable.size() > 0)
    {
        result.type = AggregationResultType::NonBillablePeriod;
        result.msg = "period "+period.label+" is not billable, incomplete month(s):";
        for (auto &m : result.non_billable) result.msg += " "+m.str();
        return result;
    }

    Bill b;
    b.member_id = member.id;
    b.first_name = member.first_name;
    b.last_name = member.last_name;
    b.street = member.street;
    b.zip = member.zip;
    b.city = member.city;
    b.canton = member.canton;
    b.is_host = member.is_host;
    b.is_producer = member.isProducer();
    b.period = period;
    b.rates = rates;
    // The host pays nothing for local solar power.
    b.applied_local_rate = member.is_host ? 0 : rates.local;

    time_t from = localMidnight(period.start);
    time_t to = localMidnight(period.end);

    for (auto &m : period.months)
    {
        auto a = allocations.find(m);
        if (a == allocations.end())
        {
            return { AggregationResultType::MissingAllocation,
                     "no allocation found for month "+m.str(), {} };
        }
        const MonthAllocation &ma = a->second;
        auto flows = ma.members.find(member.id);
        if (flows == ma.members.end()) continue;

        for (size_t i = 0; i < ma.slots.size() && i < flows->second.size(); ++i)
        {
            time_t t = ma.slots[i].start;
            if (t < from || t >= to) continue;
            const SlotAllocation &sa = flows->second[i];
            b.totals.add(sa);

            if (!daily_detail) continue;
            Date d = localDateOf(t);
            if (b.days.size() == 0 || b.days.back().date != d)
            {
                DailyDetail dd;
                dd.date = d;
                b.days.push_back(dd);
            }
            b.days.back().flows.add(sa);
        }
    }

    price(b.totals, b.applied_local_rate, rates, b.is_producer,
          &b.local_cost, &b.grid_cost, &b.local_revenue, &b.export_revenue);
    b.total_cost = b.local_cost+b.grid_cost;
    b.total_revenue = b.local_revenue+b.export_revenue;
    chargeFees(member.fees, &b);
    b.net = b.total_cost+b.total_fees-b.total_revenue;

    for (auto &dd : b.days)
    {
        Money lc, gc, lr, er;
        price(dd.flows, b.applied_local_rate, rates, b.is_producer, &lc, &gc, &lr, &er);
        dd.cost = lc+gc;
        dd.revenue = lr+er;
    }

    debug("(billing) %s %s net %s %s\n", member.id.c_str(), period.label.c_str(),
          strMoney(b.net).c_str(), rates.currency.c_str());

    *bill = b;
    return result;
}

ExportRow toExportRow(const Bill &b)
{
    ExportRow row;

    row.push_back({ "year", tostrprintf("%04d", b.period.start.year) });
    row.push_back({ "month", tostrprintf("%02d", b.period.start.month) });
    row.push_back({ "period", b.period.label });
    row.push_back({ "period_start", b.period.start.str() });
    row.push_back({ "period_end", b.period.end.str() });
    row.push_back({ "member", b.member_id });
    row.push_back({ "first_name", b.first_name });
    row.push_back({ "last_name", b.last_name });
    row.push_back({ "street", b.street });
    row.push_back({ "city", b.zip == "" ? b.city : b.zip+" "+b.city });
    row.push_back({ "canton", b.canton });
    row.push_back({ "host", b.is_host ? "true" : "false" });
    row.push_back({ "total_consumption_kwh", strEnergy(b.totals.consumption) });
    row.push_back({ "local_consumption_kwh", strEnergy(b.totals.local) });
    row.push_back({ "grid_consumption_kwh", strEnergy(b.totals.grid) });
    row.push_back({ "local_rate", strRate(b.applied_local_rate) });
    row.push_back({ "buy_rate", strRate(b.rates.buy) });
    row.push_back({ "local_cost", strMoney(b.local_cost) });
    row.push_back({ "grid_cost", strMoney(b.grid_cost) });
    row.push_back({ "total_cost", strMoney(b.total_cost) });
    row.push_back({ "total_production_kwh", strEnergy(b.totals.production) });
    row.push_back({ "local_sell_kwh", strEnergy(b.totals.local_sold) });
    row.push_back({ "grid_export_kwh", strEnergy(b.totals.exported) });
    row.push_back({ "sell_rate", strRate(b.rates.sell) });
    row.push_back({ "local_sell_revenue", strMoney(b.local_revenue) });
    row.push_back({ "grid_export_revenue", strMoney(b.export_revenue) });
    row.push_back({ "total_revenue", strMoney(b.total_revenue) });
    row.push_back({ "total_fees", strMoney(b.total_fees) });
    row.push_back({ "net", strMoney(b.net) });
    row.push_back({ "currency", b.rates.currency });

    return row;
}
