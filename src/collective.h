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

#ifndef COLLECTIVE_H
#define COLLECTIVE_H

#include"units.h"

#include<string>
#include<vector>

// A virtual meter is the utility's aggregate over the grid connection point.
// It is never part of the physical allocation, only used for cross checking.
#define LIST_OF_METER_KINDS                                      \
    X(Consumption,consumption,false,false)                       \
    X(Production,production,true,false)                          \
    X(VirtualConsumption,virtualconsumption,false,true)          \
    X(VirtualProduction,virtualproduction,true,true)             \

enum class MeterKind
{
#define X(name,lcname,is_production,is_virtual) name,
LIST_OF_METER_KINDS
#undef X
    Unknown
};

MeterKind toMeterKind(const std::string &s);
const char *toString(MeterKind k);
const char *availableMeterKinds();

struct Meter
{
    std::string external_id; // As printed in the utility exports, e.g. CH1012301234500000000000000123456
    std::string name;
    std::string member_id;
    bool is_production {};
    bool is_virtual {};

    MeterKind kind() const;
    bool isPhysical() const { return !is_virtual; }
    std::string str() const;
};

// Parse consumption:CH10123:Flat 2 into a meter. The name may contain colons.
bool parseMeterLine(const std::string &s, Meter *m);

// Extra charges on the bill of a member, applied in configuration order.
// A yearly fee is charged per month of the period. A per kWh fee is charged
// on the local or on the grid consumption. A percent fee is charged on the
// running total of the cost and the fees before it.
#define LIST_OF_FEE_TYPES        \
    X(Yearly,yearly,Money)       \
    X(PerKwh,per_kwh,Rate)       \
    X(Percent,percent,Ratio)     \

enum class FeeType
{
#define X(name,lcname,quantity) name,
LIST_OF_FEE_TYPES
#undef X
    Unknown
};

FeeType toFeeType(const std::string &s);
const char *toString(FeeType t);
const char *availableFeeTypes();

struct Fee
{
    FeeType type {};
    int64_t value {}; // Money per year, Rate or Ratio depending on the type.
    bool on_grid {};  // Per kWh fee on the grid instead of the local consumption.
    std::string name;

    std::string str() const;
};

// Parse per_kwh:0.05:grid:Grid usage into a fee. The basis is only used by
// per_kwh fees and defaults to grid. The name may contain colons.
bool parseFeeLine(const std::string &s, Fee *f);

struct Member
{
    std::string id; // Name of the member configuration file.
    std::string first_name;
    std::string last_name;
    std::string street;
    std::string zip;
    std::string city;
    std::string canton;
    bool is_host {};
    std::vector<Meter> meters;
    std::vector<Fee> fees;

    std::string fullName() const;
    // Any member, host or not, owning a physical production meter is a producer.
    bool isProducer() const;
    bool hasPhysicalMeters() const;
    bool hasMeterOfKind(MeterKind k) const;
};

struct Collective
{
    std::string name;

    // Members are kept sorted on id.
    void addMember(const Member &m);
    const std::vector<Member> &members() const { return members_; }

    const Member *findMember(const std::string &id) const;
    const Meter *findMeter(const std::string &external_id) const;
    const Member *ownerOf(const std::string &external_id) const;

    // All meters sorted on external id.
    std::vector<const Meter*> allMeters() const;
    std::vector<const Meter*> physicalMeters() const;
    std::vector<const Meter*> virtualMeters() const;
    // The members that receive a bill, ie the ones owning a physical meter.
    std::vector<const Member*> billedMembers() const;

    // Check the member/meter graph. Every problem found is appended.
    // Returns true if the collective can be billed.
    bool validate(std::vector<std::string> *problems) const;

private:

    std::vector<Member> members_;
};

#endif
