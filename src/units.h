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

#ifndef UNITS_H
#define UNITS_H

#include<string>
#include<vector>
#include<cstdint>

// All quantities that end up on a bill are stored as integers counting
// a small base unit. Energy counts µkWh, a rate counts micro currency
// units per kWh and money counts cents. Summing integers is exact and
// independent of the summation order, so recomputing a bill from the same
// readings always gives the same result down to the last digit.

typedef int64_t Energy; // µkWh
typedef int64_t Rate;   // µCHF/kWh
typedef int64_t Money;  // cents
typedef int64_t Ratio;  // hundredths of a percent

#define LIST_OF_QUANTITIES \
    X(Energy,KWH)          \
    X(Money,CHF)           \
    X(Rate,CHFKWH)         \
    X(Ratio,PERCENT)       \

enum class Quantity
{
#define X(quantity,default_unit) quantity,
LIST_OF_QUANTITIES
#undef X
    Unknown
};

// The scale is the number of base units in one of the named unit.
#define LIST_OF_UNITS \
    X(WH,wh,"Wh",Energy,"Watt hour",1000ll)                        \
    X(KWH,kwh,"kWh",Energy,"kilo Watt hour",1000000ll)             \
    X(MWH,mwh,"MWh",Energy,"mega Watt hour",1000000000ll)          \
    X(CENT,cent,"ct",Money,"cent",1ll)                             \
    X(CHF,chf,"CHF",Money,"swiss franc",100ll)                     \
    X(CENTKWH,centkwh,"ct/kWh",Rate,"cents per kWh",10000ll)       \
    X(CHFKWH,chfkwh,"CHF/kWh",Rate,"swiss franc per kWh",1000000ll) \
    X(PERCENT,percent,"%",Ratio,"percent",100ll)                   \

enum class Unit
{
#define X(cname,lcname,hrname,quantity,explanation,scale) cname,
LIST_OF_UNITS
#undef X
    Unknown
};

Unit toUnit(std::string s);
Quantity toQuantity(Unit u);
std::string unitToStringHR(Unit u);
bool isQuantity(Unit u, Quantity q);
int64_t unitScale(Unit u);

// Parse a decimal number like "12.5", "-0.000125" or "3" given in the
// unit u into base units. Digits beyond the resolution of the base unit
// are rounded half away from zero. Returns false if s is not a number
// or if the value does not fit 64 bits of base units.
bool parseQuantity(const std::string &s, Unit u, int64_t *out);
// Same, but the unit can be appended to the number: "0.20 CHF/kWh" "1200 Wh".
// If there is no unit, then the default unit of the quantity is used.
bool parseQuantityWithUnit(const std::string &s, Quantity q, int64_t *out);

// Print base units as a decimal number in the unit u with the given number
// of decimals, rounded half away from zero. E.g. formatQuantity(1234567, KWH, 3) --> "1.235"
std::string formatQuantity(int64_t v, Unit u, int decimals);

std::string strEnergy(Energy e);   // "12.345" (kWh)
std::string strMoney(Money m);     // "12.30"
std::string strRate(Rate r);       // "0.2075" (CHF/kWh)
std::string strWithUnitHR(int64_t v, Unit u);

// Price an amount of energy, ie energy*rate rounded half away from zero to cents.
Money amountOf(Energy e, Rate r);

// Calculate floor(a*b/c) for non-negative a,b and positive c without overflow.
int64_t mulDivFloor(int64_t a, int64_t b, int64_t c);
// Calculate a/b rounded half away from zero, b must be positive.
int64_t divRound(__int128 a, int64_t b);

const char *availableUnits();

#endif
