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

#ifndef ALLOCATION_H
#define ALLOCATION_H

#include"calendar.h"
#include"collective.h"
#include"quality.h"
#include"units.h"

#include<map>
#include<string>
#include<vector>

// The energy flows of one member during one slot.
struct SlotAllocation
{
    Energy consumption {};
    Energy local {};        // Part of the consumption covered by solar power from inside the collective.
    Energy grid {};         // Part of the consumption bought from the utility.
    Energy production {};
    Energy local_supply {}; // Part of the production consumed inside the collective.
    Energy self_supply {};  // Part of local that came from the member's own production.
    Energy local_sold {};   // local_supply - self_supply
    Energy exported {};     // Part of the production sold to the utility.

    void add(const SlotAllocation &sa);
    bool operator==(const SlotAllocation &sa) const;
};

struct MeterEnergy
{
    std::string meter_id;
    std::string member_id;
    Energy energy;
};

struct SlotBalance
{
    Energy total_production {};
    Energy total_consumption {};
    Energy locally_consumed {};
    Energy surplus_export {};
};

// Split total into shares proportional to the weights. The shares are floored
// and the remainder is given to the largest weight, the first one if tied.
// When total does not exceed the sum of the weights no share exceeds its weight,
// a remainder the largest cannot take continues to the next largest.
// The shares always sum up to total. All shares are zero when the weights sum to zero.
void apportion(Energy total, const std::vector<Energy> &weights, std::vector<Energy> *shares);

// Allocate the local solar power of one slot. The meters must be sorted on external id.
// The flows are added to the members. Returns false if the energy balance does not hold.
bool allocateSlot(const std::vector<MeterEnergy> &consumption,
                  const std::vector<MeterEnergy> &production,
                  std::map<std::string,SlotAllocation> *members,
                  SlotBalance *balance);

struct MonthAllocation
{
    Month month;
    std::vector<Slot> slots;
    // Per member, one entry per slot in slots.
    std::map<std::string,std::vector<SlotAllocation>> members;
    SlotAllocation totals;
};

// Allocate every slot of a billable month. Returns false if a physical meter lacks a reading.
bool allocateMonth(const Month &month, const Collective &collective,
                   const MeterReadings &readings, MonthAllocation *ma);

// Compare the virtual meters of the host with the allocated grid draw and export.
// A deviation above max(0.1 kWh, 1%) gives a warning. Returns true if no deviation was found.
bool crossCheckVirtual(const MonthAllocation &ma, const Collective &collective,
                       const MeterReadings &readings, std::vector<std::string> *warnings);

#endif
