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

#include"collective.h"
#include"util.h"

#include<algorithm>
#include<map>

using namespace std;

MeterKind toMeterKind(const string &s)
{
#define X(name,lcname,is_production,is_virtual) if (s == #lcname) return MeterKind::name;
LIST_OF_METER_KINDS
#undef X

    return MeterKind::Unknown;
}

const char *toString(MeterKind k)
{
#define X(name,lcname,is_production,is_virtual) if (k == MeterKind::name) return #lcname;
LIST_OF_METER_KINDS
#undef X

    return "unknown";
}

const char *availableMeterKinds()
{
    return
#define X(name,lcname,is_production,is_virtual) #lcname " "
LIST_OF_METER_KINDS
#undef X
        ;
}

MeterKind Meter::kind() const
{
#define X(name,lcname,isp,isv) if (is_production == isp && is_virtual == isv) return MeterKind::name;
LIST_OF_METER_KINDS
#undef X

    return MeterKind::Unknown;
}

string Meter::str() const
{
    return external_id+" ("+name+" "+toString(kind())+")";
}

bool parseMeterLine(const string &s, Meter *m)
{
    size_t a = s.find(':');
    if (a == string::npos) return false;
    size_t b = s.find(':', a+1);

    string kind = s.substr(0, a);
    string id, name;
    if (b == string::npos)
    {
        id = s.substr(a+1);
    }
    else
    {
        id = s.substr(a+1, b-a-1);
        name = s.substr(b+1);
    }
    trimWhitespace(&kind);
    trimWhitespace(&id);
    trimWhitespace(&name);

    MeterKind k = toMeterKind(kind);
    if (k == MeterKind::Unknown) return false;
    if (id == "" || id.find(' ') != string::npos || id.find(';') != string::npos) return false;

#define X(kname,lcname,isp,isv) if (k == MeterKind::kname) { m->is_production = isp; m->is_virtual = isv; }
LIST_OF_METER_KINDS
#undef X

    m->external_id = id;
    m->name = name == "" ? id : name;
    return true;
}

FeeType toFeeType(const string &s)
{
#define X(name,lcname,quantity) if (s == #lcname) return FeeType::name;
LIST_OF_FEE_TYPES
#undef X

    return FeeType::Unknown;
}

const char *toString(FeeType t)
{
#define X(name,lcname,quantity) if (t == FeeType::name) return #lcname;
LIST_OF_FEE_TYPES
#undef X

    return "unknown";
}

const char *availableFeeTypes()
{
    return
#define X(name,lcname,quantity) #lcname " "
LIST_OF_FEE_TYPES
#undef X
        ;
}

static Quantity feeQuantity(FeeType t)
{
#define X(name,lcname,quantity) if (t == FeeType::name) return Quantity::quantity;
LIST_OF_FEE_TYPES
#undef X

    return Quantity::Unknown;
}

string Fee::str() const
{
    switch (type)
    {
    case FeeType::Yearly: return name+" "+strMoney(value)+" per year";
    case FeeType::PerKwh: return name+" "+strRate(value)+" per kWh "+(on_grid ? "grid" : "local");
    case FeeType::Percent: return name+" "+strWithUnitHR(value, Unit::PERCENT);
    case FeeType::Unknown: break;
    }
    return name;
}

bool parseFeeLine(const string &s, Fee *f)
{
    size_t a = s.find(':');
    if (a == string::npos) return false;
    size_t b = s.find(':', a+1);
    if (b == string::npos) return false;
    size_t c = s.find(':', b+1);
    if (c == string::npos) return false;

    string type = s.substr(0, a);
    string value = s.substr(a+1, b-a-1);
    string basis = s.substr(b+1, c-b-1);
    string name = s.substr(c+1);
    trimWhitespace(&type);
    trimWhitespace(&value);
    trimWhitespace(&basis);
    trimWhitespace(&name);

    FeeType t = toFeeType(type);
    if (t == FeeType::Unknown || name == "") return false;
    if (!parseQuantityWithUnit(value, feeQuantity(t), &f->value)) return false;

    f->on_grid = true;
    if (t == FeeType::PerKwh)
    {
        if (basis == "local") f->on_grid = false;
        else if (basis != "" && basis != "grid") return false;
    }
    else if (basis != "")
    {
        return false;
    }
    f->type = t;
    f->name = name;
    return true;
}

string Member::fullName() const
{
    if (first_name == "" && last_name == "") return id;
    if (first_name == "") return last_name;
    if (last_name == "") return first_name;
    return first_name+" "+last_name;
}

bool Member::isProducer() const
{
    return hasMeterOfKind(MeterKind::Production);
}

bool Member::hasPhysicalMeters() const
{
    for (auto &m : meters)
    {
        if (m.isPhysical()) return true;
    }
    return false;
}

bool Member::hasMeterOfKind(MeterKind k) const
{
    for (auto &m : meters)
    {
        if (m.kind() == k) return true;
    }
    return false;
}

void Collective::addMember(const Member &m)
{
    Member mm = m;
    for (auto &meter : mm.meters) meter.member_id = mm.id;
    sort(mm.meters.begin(), mm.meters.end(),
         [](const Meter &a, const Meter &b) { return a.external_id < b.external_id; });

    auto i = lower_bound(members_.begin(), members_.end(), mm,
                         [](const Member &a, const Member &b) { return a.id < b.id; });
    members_.insert(i, mm);
}

const Member *Collective::findMember(const string &id) const
{
    for (auto &m : members_)
    {
        if (m.id == id) return &m;
    }
    return NULL;
}

const Meter *Collective::findMeter(const string &external_id) const
{
    for (auto &mb : members_)
    {
        for (auto &m : mb.meters)
        {
            if (m.external_id == external_id) return &m;
        }
    }
    return NULL;
}

const Member *Collective::ownerOf(const string &external_id) const
{
    const Meter *m = findMeter(external_id);
    if (m == NULL) return NULL;
    return findMember(m->member_id);
}

vector<const Meter*> Collective::allMeters() const
{
    vector<const Meter*> r;
    for (auto &mb : members_)
    {
        for (auto &m : mb.meters) r.push_back(&m);
    }
    stable_sort(r.begin(), r.end(),
                [](const Meter *a, const Meter *b) { return a->external_id < b->external_id; });
    return r;
}

vector<const Meter*> Collective::physicalMeters() const
{
    vector<const Meter*> r;
    for (const Meter *m : allMeters())
    {
        if (m->isPhysical()) r.push_back(m);
    }
    return r;
}

vector<const Meter*> Collective::virtualMeters() const
{
    vector<const Meter*> r;
    for (const Meter *m : allMeters())
    {
        if (!m->isPhysical()) r.push_back(m);
    }
    return r;
}

vector<const Member*> Collective::billedMembers() const
{
    vector<const Member*> r;
    for (auto &m : members_)
    {
        if (m.hasPhysicalMeters()) r.push_back(&m);
    }
    return r;
}

bool Collective::validate(vector<string> *problems) const
{
    size_t before = problems->size();

    if (members_.size() == 0)
    {
        problems->push_back("the collective has no members");
    }

    map<string,string> owner_of;
    for (auto &mb : members_)
    {
        for (auto &m : mb.meters)
        {
            if (owner_of.count(m.external_id) > 0)
            {
                problems->push_back("meter "+m.external_id+" is configured for both "+
                                    owner_of[m.external_id]+" and "+mb.id);
                continue;
            }
            owner_of[m.external_id] = mb.id;
        }
    }

    bool host_found = false;
    for (auto &mb : members_)
    {
        if (!mb.is_host) continue;
        if (mb.hasMeterOfKind(MeterKind::VirtualConsumption) &&
            mb.hasMeterOfKind(MeterKind::VirtualProduction))
        {
            host_found = true;
        }
        else
        {
            problems->push_back("host "+mb.id+" must own both a virtualconsumption and a virtualproduction meter");
        }
    }
    if (!host_found)
    {
        problems->push_back("no host owning both virtual meters found");
    }

    for (auto &mb : members_)
    {
        if (!mb.is_host && (mb.hasMeterOfKind(MeterKind::VirtualConsumption) ||
                            mb.hasMeterOfKind(MeterKind::VirtualProduction)))
        {
            problems->push_back("member "+mb.id+" owns a virtual meter but is not a host");
        }
    }

    return problems->size() == before;
}
