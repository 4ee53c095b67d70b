/*
 Copyright (C) 2019-2022 Fredrik Öhrström (gpl-3.0-or-later)

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

#include"units.h"
#include"util.h"

#include<assert.h>
#include<string.h>

using namespace std;

Unit toUnit(string s)
{
#define X(cname,lcname,hrname,quantity,explanation,scale) if (s == #cname || s == #lcname || s == hrname) return Unit::cname;
LIST_OF_UNITS
#undef X

    return Unit::Unknown;
}

Quantity toQuantity(Unit u)
{
#define X(cname,lcname,hrname,quantity,explanation,scale) if (u == Unit::cname) return Quantity::quantity;
LIST_OF_UNITS
#undef X

    return Quantity::Unknown;
}

Unit defaultUnitForQuantity(Quantity q)
{
#define X(quantity,default_unit) if (q == Quantity::quantity) return Unit::default_unit;
LIST_OF_QUANTITIES
#undef X
    return Unit::Unknown;
}

string unitToStringHR(Unit u)
{
#define X(cname,lcname,hrname,quantity,explanation,scale) if (u == Unit::cname) return hrname;
LIST_OF_UNITS
#undef X

    return "?";
}

bool isQuantity(Unit u, Quantity q)
{
    return toQuantity(u) == q;
}

int64_t unitScale(Unit u)
{
#define X(cname,lcname,hrname,quantity,explanation,scale) if (u == Unit::cname) return scale;
LIST_OF_UNITS
#undef X

    return 0;
}

int64_t divRound(__int128 a, int64_t b)
{
    assert(b > 0);
    __int128 q = a / b;
    __int128 r = a % b;
    if (r < 0) r = -r;
    if (2*r >= b)
    {
        if (a < 0) q--; else q++;
    }
    return (int64_t)q;
}

int64_t mulDivFloor(int64_t a, int64_t b, int64_t c)
{
    assert(a >= 0 && b >= 0 && c > 0);
    __int128 p = (__int128)a * (__int128)b;
    return (int64_t)(p / c);
}

bool parseQuantity(const string &str, Unit u, int64_t *out)
{
    string s = str;
    trimWhitespace(&s);
    int64_t scale = unitScale(u);
    if (scale == 0 || s.length() == 0) return false;

    bool negative = false;
    size_t i = 0;
    if (s[i] == '-' || s[i] == '+')
    {
        negative = s[i] == '-';
        i++;
    }

    __int128 mantissa = 0;
    int64_t divisor = 1;
    int digits = 0;
    bool seen_dot = false;

    for (; i < s.length(); ++i)
    {
        char c = s[i];
        if (c == '.' || c == ',')
        {
            // The utility exports sometimes use a decimal comma.
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        digits++;
        if (digits > 18)
        {
            // The divisor would overflow.
            return false;
        }
        mantissa = mantissa*10 + (c-'0');
        if (seen_dot) divisor *= 10;
    }
    if (digits == 0) return false;

    __int128 n = mantissa * scale;
    if (negative) n = -n;
    if (n / divisor >= INT64_MAX || n / divisor <= -INT64_MAX)
    {
        // Does not fit the base unit.
        return false;
    }
    *out = divRound(n, divisor);
    return true;
}

bool parseQuantityWithUnit(const string &str, Quantity q, int64_t *out)
{
    string s = str;
    trimWhitespace(&s);
    Unit u = defaultUnitForQuantity(q);
    size_t p = s.find(' ');
    if (p != string::npos)
    {
        string us = s.substr(p+1);
        trimWhitespace(&us);
        u = toUnit(us);
        if (u == Unit::Unknown || !isQuantity(u, q)) return false;
        s = s.substr(0, p);
    }
    return parseQuantity(s, u, out);
}

string formatQuantity(int64_t v, Unit u, int decimals)
{
    int64_t scale = unitScale(u);
    assert(scale > 0);
    __int128 n = v;
    int64_t pow10 = 1;
    for (int i = 0; i < decimals; ++i) pow10 *= 10;
    n *= pow10;
    int64_t r = divRound(n, scale);

    bool negative = r < 0;
    uint64_t a = negative ? (uint64_t)(-(r+1))+1 : (uint64_t)r;
    uint64_t whole = a / pow10;
    uint64_t frac = a % pow10;

    string s;
    if (decimals > 0)
    {
        s = tostrprintf("%s%llu.%0*llu", negative?"-":"",
                        (unsigned long long)whole, decimals, (unsigned long long)frac);
    }
    else
    {
        s = tostrprintf("%s%llu", negative?"-":"", (unsigned long long)whole);
    }
    return s;
}

string strEnergy(Energy e)
{
    return formatQuantity(e, Unit::KWH, 3);
}

string strMoney(Money m)
{
    return formatQuantity(m, Unit::CHF, 2);
}

string strRate(Rate r)
{
    return formatQuantity(r, Unit::CHFKWH, 4);
}

string strWithUnitHR(int64_t v, Unit u)
{
    int decimals = 3;
    if (isQuantity(u, Quantity::Money)) decimals = 2;
    if (isQuantity(u, Quantity::Rate)) decimals = 4;
    if (isQuantity(u, Quantity::Ratio)) decimals = 2;
    return formatQuantity(v, u, decimals)+" "+unitToStringHR(u);
}

Money amountOf(Energy e, Rate r)
{
    // µkWh * µCHF/kWh = 1e-12 CHF = 1e-10 cents.
    __int128 p = (__int128)e * (__int128)r;
    return divRound(p, 10000000000ll);
}

char available_units_[2048];

const char *availableUnits()
{
    if (available_units_[0]) return available_units_;

#define X(n,suffix,hr,q,ln,scale) if (Unit::n != Unit::Unknown) {     \
        strcat(available_units_, hr); strcat(available_units_, " ");     \
        assert(strlen(available_units_) < 1024); }
LIST_OF_UNITS
#undef X

    // Remove last space
    available_units_[strlen(available_units_)-1] = 0;
    return available_units_;
}
