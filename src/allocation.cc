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

#include"allocation.h"
#include"util.h"

#include<algorithm>

using namespace std;

// 0.1 kWh
#define CROSS_CHECK_MIN_DEVIATION 100000

void SlotAllocation::add(const SlotAllocation &sa)
{
    consumption += sa.consumption;
    local += sa.local;
    grid += sa.grid;
    production += sa.production;
    local_supply += sa.local_supply;
    self_supply += sa.self_supply;
    local_sold += sa.local_sold;
    exported += sa.exported;
}

bool SlotAllocation::operator==(const SlotAllocation &sa) const
{
    return consumption == sa.consumption &&
        local == sa.local &&
        grid == sa.grid &&
        production == sa.production &&
        local_supply == sa.local_supply &&
        self_supply == sa.self_supply &&
        local_sold == sa.local_sold &&
        exported == sa.exported;
}

void apportion(Energy total, const vector<Energy> &weights, vector<Energy> *shares)
{
    shares->assign(weights.size(), 0);

    Energy sum = 0;
    size_t largest = 0;
    for (size_t i = 0; i < weights.size(); ++i)
    {
        sum += weights[i];
        if (weights[i] > weights[largest]) largest = i;
    }
    if (sum <= 0 || total == 0) return;

    Energy given = 0;
    for (size_t i = 0; i < weights.size(); ++i)
    {
        (*shares)[i] = mulDivFloor(total, weights[i], sum);
        given += (*shares)[i];
    }

    Energy remainder = total-given;
    if (total > sum)
    {
        (*shares)[largest] += remainder;
        return;
    }

    // No share may exceed its weight. What the largest weight cannot take
    // goes to the next largest, the first one if tied.
    vector<size_t> order;
    for (size_t i = 0; i < weights.size(); ++i) order.push_back(i);
    stable_sort(order.begin(), order.end(),
                [&weights](size_t a, size_t b) { return weights[a] > weights[b]; });

    for (size_t i : order)
    {
        if (remainder == 0) break;
        Energy take = min(weights[i]-(*shares)[i], remainder);
        (*shares)[i] += take;
        remainder -= take;
    }
}

bool allocateSlot(const vector<MeterEnergy> &consumption,
                  const vector<MeterEnergy> &production,
                  map<string,SlotAllocation> *members,
                  SlotBalance *balance)
{
    SlotBalance b;
    vector<Energy> cw, pw;
    for (auto &me : consumption) { cw.push_back(me.energy); b.total_consumption += me.energy; }
    for (auto &me : production) { pw.push_back(me.energy); b.total_production += me.energy; }

    b.locally_consumed = b.total_consumption == 0 ? 0 : min(b.total_production, b.total_consumption);
    b.surplus_export = b.total_production-b.locally_consumed;

    // The export is split once and each producer supplies the rest of its
    // production locally, so production == local_supply + exported always holds.
    vector<Energy> local_shares, export_shares;
    apportion(b.locally_consumed, cw, &local_shares);
    apportion(b.surplus_export, pw, &export_shares);

    // The flows of this slot only, rolled up per member.
    map<string,SlotAllocation> slot;
    for (size_t i = 0; i < consumption.size(); ++i)
    {
        SlotAllocation &sa = slot[consumption[i].member_id];
        sa.consumption += consumption[i].energy;
        sa.local += local_shares[i];
        sa.grid += consumption[i].energy-local_shares[i];
    }
    for (size_t i = 0; i < production.size(); ++i)
    {
        SlotAllocation &sa = slot[production[i].member_id];
        sa.production += production[i].energy;
        sa.local_supply += production[i].energy-export_shares[i];
        sa.exported += export_shares[i];
    }

    bool ok = true;
    Energy sum_local = 0, sum_supply = 0, sum_export = 0;
    for (auto &p : slot)
    {
        SlotAllocation &sa = p.second;
        if (b.locally_consumed > 0)
        {
            sa.self_supply = mulDivFloor(sa.local, sa.local_supply, b.locally_consumed);
        }
        sa.local_sold = sa.local_supply-sa.self_supply;

        sum_local += sa.local;
        sum_supply += sa.local_supply;
        sum_export += sa.exported;

        if (sa.local+sa.grid != sa.consumption || sa.local_supply+sa.exported != sa.production ||
            sa.grid < 0 || sa.local_supply < 0)
        {
            warning("(allocation) energy balance of member %s broken\n", p.first.c_str());
            ok = false;
        }
        (*members)[p.first].add(sa);
    }

    if (sum_local != b.locally_consumed || sum_supply != b.locally_consumed || sum_export != b.surplus_export)
    {
        warning("(allocation) energy balance broken: local %s supply %s locally consumed %s export %s surplus %s\n",
                strEnergy(sum_local).c_str(), strEnergy(sum_supply).c_str(), strEnergy(b.locally_consumed).c_str(),
                strEnergy(sum_export).c_str(), strEnergy(b.surplus_export).c_str());
        ok = false;
    }

    if (balance) *balance = b;
    return ok;
}

static bool lookupSlot(const map<time_t,Energy> &values, time_t t, Energy *e)
{
    auto i = values.find(t);
    if (i == values.end()) return false;
    *e = i->second;
    return true;
}

bool allocateMonth(const Month &month, const Collective &collective,
                   const MeterReadings &readings, MonthAllocation *ma)
{
    ma->month = month;
    ma->slots.clear();
    ma->members.clear();
    ma->totals = SlotAllocation();
    expectedSlots(month, &ma->slots);

    vector<const Meter*> consumers, producers;
    map<string,map<time_t,Energy>> values;
    for (const Meter *m : collective.physicalMeters())
    {
        if (m->is_production) producers.push_back(m);
        else consumers.push_back(m);

        auto r = readings.find(m->external_id);
        if (r == readings.end()) continue;
        map<time_t,Energy> &v = values[m->external_id];
        for (auto &ir : r->second)
        {
            if (ir.valid) v[ir.start] = ir.energy;
        }
    }

    for (const Member *mb : collective.billedMembers())
    {
        ma->members[mb->id].resize(ma->slots.size());
    }

    bool ok = true;
    for (size_t i = 0; i < ma->slots.size(); ++i)
    {
        time_t t = ma->slots[i].start;
        vector<MeterEnergy> consumption, production;
        for (const Meter *m : consumers)
        {
            MeterEnergy me { m->external_id, m->member_id, 0 };
            if (!lookupSlot(values[m->external_id], t, &me.energy))
            {
                warning("(allocation) meter %s has no reading at %s\n", m->external_id.c_str(), ma->slots[i].str().c_str());
                ok = false;
            }
            consumption.push_back(me);
        }
        for (const Meter *m : producers)
        {
            MeterEnergy me { m->external_id, m->member_id, 0 };
            if (!lookupSlot(values[m->external_id], t, &me.energy))
            {
                warning("(allocation) meter %s has no reading at %s\n", m->external_id.c_str(), ma->slots[i].str().c_str());
                ok = false;
            }
            production.push_back(me);
        }

        map<string,SlotAllocation> slot;
        if (!allocateSlot(consumption, production, &slot, NULL))
        {
            ok = false;
        }
        for (auto &p : slot)
        {
            ma->members[p.first][i] = p.second;
            ma->totals.add(p.second);
        }
    }

    debug("(allocation) %s consumption %s kWh local %s kWh grid %s kWh production %s kWh export %s kWh\n",
          month.str().c_str(),
          strEnergy(ma->totals.consumption).c_str(),
          strEnergy(ma->totals.local).c_str(),
          strEnergy(ma->totals.grid).c_str(),
          strEnergy(ma->totals.production).c_str(),
          strEnergy(ma->totals.exported).c_str());
    return ok;
}

static Energy sumVirtual(const Collective &collective, const MeterReadings &readings, MeterKind kind, bool *found)
{
    Energy sum = 0;
    for (const Meter *m : collective.virtualMeters())
    {
        if (m->kind() != kind) continue;
        auto r = readings.find(m->external_id);
        if (r == readings.end() || r->second.size() == 0) continue;
        *found = true;
        for (auto &ir : r->second)
        {
            if (ir.valid) sum += ir.energy;
        }
    }
    return sum;
}

static bool compareVirtual(const string &what, Energy virt, Energy allocated, const Month &month,
                           vector<string> *warnings)
{
    Energy deviation = virt > allocated ? virt-allocated : allocated-virt;
    Energy limit = max((Energy)CROSS_CHECK_MIN_DEVIATION, virt/100);
    if (deviation <= limit) return true;

    warnings->push_back(tostrprintf("%s virtual %s %s kWh differs from the allocated %s kWh by %s kWh",
                                    month.str().c_str(), what.c_str(), strEnergy(virt).c_str(),
                                    strEnergy(allocated).c_str(), strEnergy(deviation).c_str()));
    return false;
}

bool crossCheckVirtual(const MonthAllocation &ma, const Collective &collective,
                       const MeterReadings &readings, vector<string> *warnings)
{
    bool ok = true;
    bool found = false;

    Energy vc = sumVirtual(collective, readings, MeterKind::VirtualConsumption, &found);
    if (found && !compareVirtual("consumption", vc, ma.totals.grid, ma.month, warnings)) ok = false;

    found = false;
    Energy vp = sumVirtual(collective, readings, MeterKind::VirtualProduction, &found);
    if (found && !compareVirtual("production", vp, ma.totals.exported, ma.month, warnings)) ok = false;

    return ok;
}
