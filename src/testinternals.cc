/*
 Copyright (C) 2018-2022 Fredrik Öhrström (gpl-3.0-or-later)

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
#include"billing.h"
#include"calendar.h"
#include"collective.h"
#include"config.h"
#include"pipeline.h"
#include"printer.h"
#include"quality.h"
#include"readings.h"
#include"units.h"
#include"util.h"

#include<stdio.h>
#include<stdlib.h>
#include<string.h>
#include<unistd.h>

using namespace std;

void test_dates();
void test_months();
void test_calendar_dst();
void test_calendar_range();
void test_partition();
void test_units();
void test_apportion();
void test_quality();
void test_allocation();
void test_billing();
void test_pipeline();
void test_csv();
void test_config();

int errors_ = 0;

const Energy kwh = 1000000;

bool test(const char *test_name, const char *pattern)
{
    if (pattern == NULL) return true;
    bool ok = strstr(test_name, pattern) != NULL;
    if (ok) printf("Test %s\n", test_name);
    return ok;
}

int main(int argc, char **argv)
{
    const char *pattern = NULL;

    int i = 1;
    while (i < argc) {
        if (!strcmp(argv[i], "--debug"))
        {
            debugEnabled(true);
        }
        else
        if (!strcmp(argv[i], "--trace"))
        {
            debugEnabled(true);
            traceEnabled(true);
        }
        else
        {
            pattern = argv[i];
        }
        i++;
    }

    if (!setCalendarTimezone("Europe/Zurich"))
    {
        printf("ERROR! Time zone Europe/Zurich is not installed.\n");
        return 1;
    }

    if (test("dates", pattern)) test_dates();
    if (test("months", pattern)) test_months();
    if (test("calendar_dst", pattern)) test_calendar_dst();
    if (test("calendar_range", pattern)) test_calendar_range();
    if (test("partition", pattern)) test_partition();
    if (test("units", pattern)) test_units();
    if (test("apportion", pattern)) test_apportion();
    if (test("quality", pattern)) test_quality();
    if (test("allocation", pattern)) test_allocation();
    if (test("billing", pattern)) test_billing();
    if (test("pipeline", pattern)) test_pipeline();
    if (test("csv", pattern)) test_csv();
    if (test("config", pattern)) test_config();

    if (errors_ > 0)
    {
        printf("%d test(s) failed\n", errors_);
        return 1;
    }
    return 0;
}

void expect(bool ok, string what)
{
    if (!ok)
    {
        printf("ERROR! %s\n", what.c_str());
        errors_++;
    }
}

void expect_str(string got, string expected, string what)
{
    if (got != expected)
    {
        printf("ERROR! %s expected \"%s\" but got \"%s\"\n", what.c_str(), expected.c_str(), got.c_str());
        errors_++;
    }
}

void expect_int(int64_t got, int64_t expected, string what)
{
    if (got != expected)
    {
        printf("ERROR! %s expected %lld but got %lld\n", what.c_str(), (long long)expected, (long long)got);
        errors_++;
    }
}

void test_date(string s, bool ok, string expected)
{
    Date d;
    bool r = d.parse(s);
    if (r != ok)
    {
        printf("ERROR! Expected parsing \"%s\" to %s\n", s.c_str(), ok ? "succeed" : "fail");
        errors_++;
        return;
    }
    if (ok) expect_str(d.str(), expected, "parsed date "+s);
}

void test_dates()
{
    test_date("2025-03-21", true, "2025-03-21");
    test_date("2025-03", true, "2025-03-01");
    test_date("2024-02-29", true, "2024-02-29");
    test_date("2025-02-29", false, "");
    test_date("2025-13", false, "");
    test_date("2025-3", false, "");
    test_date("2025-03-21x", false, "");
    test_date("21.03.2025", false, "");

    expect_str(addDays(Date(2024,12,31), 1).str(), "2025-01-01", "addDays over new year");
    expect_str(addDays(Date(2025,3,1), -1).str(), "2025-02-28", "addDays backwards");
    expect_str(addDays(Date(2024,2,28), 2).str(), "2024-03-01", "addDays leap year");

    expect(Date(2025,1,31) < Date(2025,2,1), "date ordering");
    expect(!(Date(2025,2,1) < Date(2025,2,1)), "date ordering equal");
    expect(isLeapYear(2000) && !isLeapYear(2100) && isLeapYear(2024), "leap years");
    expect_int(daysInMonth(2024, 2), 29, "days in february 2024");
    expect_int(daysInMonth(2025, 4), 30, "days in april");

    int y, mo, d, h, mi, s;
    expect(parseUtilityTimestamp("1.3.2025 14:15:00", &y, &mo, &d, &h, &mi, &s), "utility timestamp");
    expect(y == 2025 && mo == 3 && d == 1 && h == 14 && mi == 15 && s == 0, "utility timestamp parts");
    expect(parseUtilityTimestamp("01.03.2025 14:15", &y, &mo, &d, &h, &mi, &s), "utility timestamp without seconds");
    expect(!parseUtilityTimestamp("2025-03-01 14:15:00", &y, &mo, &d, &h, &mi, &s), "iso timestamp is not the utility dialect");
    expect(!parseUtilityTimestamp("31.2.2025 14:15:00", &y, &mo, &d, &h, &mi, &s), "bad date in timestamp");
}

void test_month(int y, int m, int day, int mdiff, string from, string to)
{
    Date date(y, m, day);
    string s = date.str();
    string os = addMonths(date, mdiff).str();

    if (s != from ||
        os != to)
    {
        printf("ERROR! Expected %s + %d months should be %s\n"
               "But got %s + %d = %s\n",
               from.c_str(), mdiff, to.c_str(),
               s.c_str(), mdiff, os.c_str());
        errors_++;
    }
}

void test_months()
{
    test_month(2020,12,31, 2, "2020-12-31", "2021-02-28");
    test_month(2020,12,31,-10, "2020-12-31", "2020-02-29");
    test_month(2021,01,31,-1,  "2021-01-31", "2020-12-31");
    test_month(2021,01,31,-2,  "2021-01-31", "2020-11-30");
    test_month(2021,01,31,-24, "2021-01-31", "2019-01-31");
    test_month(2021,01,31, 24, "2021-01-31", "2023-01-31");
    test_month(2021,01,31, 22, "2021-01-31", "2022-11-30");
    test_month(2025,01,01, 3,  "2025-01-01", "2025-04-01");

    // 2020 was a leap year.
    test_month(2021,02,28, -12, "2021-02-28", "2020-02-29");
    // 2000 was a leap year %100=0 but %400=0 overrides.
    test_month(2001,02,28, -12, "2001-02-28", "2000-02-29");
    // 2100 is not a leap year since %100=0 and not overriden %400 != 0.
    test_month(2000,02,29, 12*100, "2000-02-29", "2100-02-28");

    expect(Month(2025,12).next() == Month(2026,1), "month after december");
    expect_str(Month(2025,3).end().str(), "2025-04-01", "end of march");
    expect_str(Month(2025,3).str(), "2025-03", "month string");

    vector<Month> ms = monthsBetween(Date(2025,1,1), Date(2025,4,1));
    expect_int(ms.size(), 3, "months between january and april");
    expect(ms.size() == 3 && ms[2] == Month(2025,3), "last month before april");
}

void test_slots(Date from, Date to, size_t expected)
{
    vector<Slot> slots;
    CalendarResult r = expectedSlots(from, to, &slots);
    expect(r.type == CalendarResultType::Success, "expected slots of "+from.str());
    expect_int(slots.size(), expected, "number of slots from "+from.str()+" to "+to.str());

    for (size_t i = 1; i < slots.size(); ++i)
    {
        if (slots[i].start != slots[i-1].start+SLOT_SECONDS)
        {
            printf("ERROR! Slots not consecutive at %s\n", slots[i].strz().c_str());
            errors_++;
            break;
        }
    }
}

void test_calendar_dst()
{
    test_slots(Date(2025,6,15), Date(2025,6,16), 96);
    // Spring forward, 02:00-03:00 does not exist.
    test_slots(Date(2025,3,30), Date(2025,3,31), 92);
    // Fall back, 02:00-03:00 happens twice.
    test_slots(Date(2025,10,26), Date(2025,10,27), 100);
    test_slots(Date(2025,3,1), Date(2025,4,1), 31*96-4);
    test_slots(Date(2025,10,1), Date(2025,11,1), 31*96+4);
    test_slots(Date(2025,1,1), Date(2026,1,1), 365*96);

    vector<Slot> spring;
    expectedSlots(Date(2025,3,30), Date(2025,3,31), &spring);
    expect_str(spring[0].str(), "2025-03-30 00:00", "first slot of spring forward day");
    expect_str(spring[7].str(), "2025-03-30 01:45", "last slot before the gap");
    expect_str(spring[8].str(), "2025-03-30 03:00", "first slot after the gap");

    vector<Slot> fall;
    expectedSlots(Date(2025,10,26), Date(2025,10,27), &fall);
    expect_str(fall[8].strz(), "2025-10-26 02:00+0200", "first 02:00 of fall back day");
    expect_str(fall[12].strz(), "2025-10-26 02:00+0100", "second 02:00 of fall back day");
    expect(fall[8] != fall[12], "the repeated hour gives distinct slots");
    expect_str(fall.back().str(), "2025-10-26 23:45", "last slot of fall back day");

    vector<Slot> month;
    expectedSlots(Month(2025,2), &month);
    expect_int(month.size(), 28*96, "slots of february 2025");
    expect(localDateOf(month.back().start) == Date(2025,2,28), "local date of the last slot");

    vector<time_t> instants;
    localTimeToInstants(2025, 10, 26, 2, 30, 0, &instants);
    expect_int(instants.size(), 2, "instants of an ambiguous local time");
    if (instants.size() == 2) expect_int(instants[1]-instants[0], 3600, "distance between the two 02:30");
    instants.clear();
    localTimeToInstants(2025, 3, 30, 2, 30, 0, &instants);
    expect_int(instants.size(), 0, "instants of a skipped local time");
    instants.clear();
    localTimeToInstants(2025, 6, 1, 12, 0, 0, &instants);
    expect_int(instants.size(), 1, "instants of a normal local time");
}

void test_calendar_range()
{
    vector<Slot> slots;
    CalendarResult r = expectedSlots(Date(2025,3,2), Date(2025,3,1), &slots);
    expect(r.type == CalendarResultType::InvalidRange, "expected slots with end before start");
    r = expectedSlots(Date(2025,3,1), Date(2025,3,1), &slots);
    expect(r.type == CalendarResultType::InvalidRange, "expected slots with empty range");
    expect_int(slots.size(), 0, "no slots for a bad range");

    vector<BillingPeriod> periods;
    r = partition(Date(2025,4,1), Date(2025,1,1), BillingInterval::Quarterly, &periods);
    expect(r.type == CalendarResultType::InvalidRange, "partition with end before start");
    r = partition(Date(2025,1,1), Date(2025,4,1), BillingInterval::Unknown, &periods);
    expect(r.type == CalendarResultType::InvalidInterval, "partition with unknown interval");
    expect_int(periods.size(), 0, "no periods for bad input");
}

void test_period(const BillingPeriod &p, string label, string start, string end, size_t months)
{
    expect_str(p.label, label, "period label");
    expect_str(p.start.str(), start, "start of period "+label);
    expect_str(p.end.str(), end, "end of period "+label);
    expect_int(p.months.size(), months, "months of period "+label);
}

void test_partition()
{
    vector<BillingPeriod> p;
    partition(Date(2025,1,1), Date(2025,12,1), BillingInterval::Quarterly, &p);
    expect_int(p.size(), 4, "quarters");
    if (p.size() == 4)
    {
        test_period(p[0], "2025-Q1", "2025-01-01", "2025-04-01", 3);
        test_period(p[2], "2025-Q3", "2025-07-01", "2025-10-01", 3);
        // Truncated, never extended.
        test_period(p[3], "2025-Q4", "2025-10-01", "2025-12-01", 2);
    }

    p.clear();
    partition(Date(2025,2,1), Date(2025,5,1), BillingInterval::Quarterly, &p);
    expect_int(p.size(), 2, "quarters starting inside a quarter");
    if (p.size() == 2)
    {
        test_period(p[0], "2025-Q1", "2025-02-01", "2025-04-01", 2);
        test_period(p[1], "2025-Q2", "2025-04-01", "2025-05-01", 1);
    }

    p.clear();
    partition(Date(2025,1,1), Date(2026,1,1), BillingInterval::SemiAnnual, &p);
    expect_int(p.size(), 2, "half years");
    if (p.size() == 2)
    {
        test_period(p[0], "2025-H1", "2025-01-01", "2025-07-01", 6);
        test_period(p[1], "2025-H2", "2025-07-01", "2026-01-01", 6);
    }

    p.clear();
    partition(Date(2024,3,1), Date(2025,6,1), BillingInterval::Annual, &p);
    expect_int(p.size(), 2, "years");
    if (p.size() == 2)
    {
        test_period(p[0], "2024", "2024-03-01", "2025-01-01", 10);
        test_period(p[1], "2025", "2025-01-01", "2025-06-01", 5);
    }

    p.clear();
    partition(Date(2025,11,1), Date(2026,2,1), BillingInterval::Monthly, &p);
    expect_int(p.size(), 3, "months");
    if (p.size() == 3)
    {
        test_period(p[0], "2025-11", "2025-11-01", "2025-12-01", 1);
        test_period(p[2], "2026-01", "2026-01-01", "2026-02-01", 1);
    }

    expect(toBillingInterval("semi_annual") == BillingInterval::SemiAnnual, "semi_annual is accepted");
    expect(toBillingInterval("weekly") == BillingInterval::Unknown, "weekly is not an interval");
    expect_int(monthsPerPeriod(BillingInterval::Quarterly), 3, "months per quarter");
}

void test_parse_quantity(string s, Unit u, bool ok, int64_t expected)
{
    int64_t v = 0;
    bool r = parseQuantity(s, u, &v);
    if (r != ok)
    {
        printf("ERROR! Expected parsing \"%s\" to %s\n", s.c_str(), ok ? "succeed" : "fail");
        errors_++;
        return;
    }
    if (ok) expect_int(v, expected, "parsed quantity \""+s+"\"");
}

void test_units()
{
    test_parse_quantity("1.5", Unit::KWH, true, 1500000);
    test_parse_quantity("0,25", Unit::KWH, true, 250000);
    test_parse_quantity(" 12 ", Unit::KWH, true, 12000000);
    test_parse_quantity("250", Unit::WH, true, 250000);
    test_parse_quantity("0.0000005", Unit::KWH, true, 1);
    test_parse_quantity("-0.0000005", Unit::KWH, true, -1);
    test_parse_quantity("0.0000004", Unit::KWH, true, 0);
    test_parse_quantity("0.2075", Unit::CHFKWH, true, 207500);
    test_parse_quantity("1.20", Unit::CHF, true, 120);
    test_parse_quantity("abc", Unit::KWH, false, 0);
    test_parse_quantity("", Unit::KWH, false, 0);
    test_parse_quantity("1.2.3", Unit::KWH, false, 0);
    test_parse_quantity(".", Unit::KWH, false, 0);
    // More than 2^63 µkWh.
    test_parse_quantity("9300000000000", Unit::KWH, false, 0);
    test_parse_quantity("-9300000000000", Unit::KWH, false, 0);
    test_parse_quantity("9200000000000", Unit::KWH, true, 9200000000000000000ll);
    test_parse_quantity("12.5", Unit::PERCENT, true, 1250);

    int64_t r = 0;
    expect(parseQuantityWithUnit("0.20 CHF/kWh", Quantity::Rate, &r) && r == 200000, "rate with unit");
    expect(parseQuantityWithUnit("20 ct/kWh", Quantity::Rate, &r) && r == 200000, "rate in cents");
    expect(parseQuantityWithUnit("0.20", Quantity::Rate, &r) && r == 200000, "rate without unit");
    expect(!parseQuantityWithUnit("5 kWh", Quantity::Rate, &r), "energy is not a rate");
    expect(parseQuantityWithUnit("1200 Wh", Quantity::Energy, &r) && r == 1200000, "energy in Wh");
    expect(parseQuantityWithUnit("7.7 %", Quantity::Ratio, &r) && r == 770, "percent with unit");
    expect_str(strWithUnitHR(770, Unit::PERCENT), "7.70 %", "format percent");

    expect_str(formatQuantity(1234567, Unit::KWH, 3), "1.235", "format energy");
    expect_str(formatQuantity(-1234567, Unit::KWH, 3), "-1.235", "format negative energy");
    expect_str(strEnergy(0), "0.000", "format zero energy");
    expect_str(strMoney(120), "1.20", "format money");
    expect_str(strMoney(-5), "-0.05", "format negative money");
    expect_str(strRate(207500), "0.2075", "format rate");
    expect_str(strWithUnitHR(207500, Unit::CHFKWH), "0.2075 CHF/kWh", "format rate with unit");

    // 6 kWh at 0.20 CHF/kWh
    expect_int(amountOf(6*kwh, 200000), 120, "6 kWh at 0.20");
    expect_int(amountOf(5, 1000000000), 1, "half a cent rounds up");
    expect_int(amountOf(-5, 1000000000), -1, "half a cent rounds away from zero");
    expect_int(amountOf(4, 1000000000), 0, "less than half a cent");
    expect_int(mulDivFloor(7, 3, 2), 10, "mulDivFloor");
    expect_int(mulDivFloor(4000000000000ll, 4000000000000ll, 8000000000000ll), 2000000000000ll, "mulDivFloor without overflow");
    expect_int(divRound(5, 2), 3, "divRound up");
    expect_int(divRound(-5, 2), -3, "divRound away from zero");
    expect_int(divRound(4, 3), 1, "divRound down");
}

void test_apportion_case(Energy total, vector<Energy> weights, vector<Energy> expected)
{
    vector<Energy> shares;
    apportion(total, weights, &shares);
    if (shares != expected)
    {
        string got, exp;
        for (auto e : shares) got += to_string(e)+" ";
        for (auto e : expected) exp += to_string(e)+" ";
        printf("ERROR! apportion %lld expected %s but got %s\n", (long long)total, exp.c_str(), got.c_str());
        errors_++;
    }
}

void test_apportion()
{
    test_apportion_case(100, { 1, 3 }, { 25, 75 });
    // The remainder goes to the first of the largest weights.
    test_apportion_case(10, { 1, 1, 1 }, { 4, 3, 3 });
    test_apportion_case(7, { 2, 5, 5 }, { 1, 4, 2 });
    test_apportion_case(0, { 1, 2 }, { 0, 0 });
    test_apportion_case(5, { 0, 0 }, { 0, 0 });
    test_apportion_case(5, { }, { });
    // A share never exceeds its weight, the rest of the remainder moves on.
    test_apportion_case(14, { 5, 5, 5 }, { 5, 5, 4 });
    test_apportion_case(2, { 1, 1, 1 }, { 1, 1, 0 });
    test_apportion_case(3, { 3, 3 }, { 2, 1 });

    uint32_t seed = 4711;
    for (int n = 0; n < 200; ++n)
    {
        vector<Energy> weights;
        Energy sum = 0;
        int count = 1 + n % 7;
        for (int i = 0; i < count; ++i)
        {
            seed = seed*1103515245 + 12345;
            weights.push_back((seed >> 8) % 5000000);
            sum += weights.back();
        }
        seed = seed*1103515245 + 12345;
        Energy total = (seed >> 8) % 3000000;

        vector<Energy> shares;
        apportion(total, weights, &shares);
        Energy given = 0;
        for (auto e : shares) given += e;
        if (sum > 0 && given != total)
        {
            printf("ERROR! apportion lost energy: %lld != %lld\n", (long long)given, (long long)total);
            errors_++;
            break;
        }
        bool over = false;
        for (size_t i = 0; i < shares.size(); ++i) if (total <= sum && shares[i] > weights[i]) over = true;
        if (over)
        {
            printf("ERROR! apportion share above its weight for total %lld\n", (long long)total);
            errors_++;
            break;
        }
    }
}

Meter meter(string kind, string id)
{
    Meter m;
    parseMeterLine(kind+":"+id+":"+id, &m);
    return m;
}

// The host owns the virtual meters, a consumption and a production meter. Anna only consumes.
Collective testCollective(bool anna_produces = false)
{
    Collective c;
    c.name = "Sonnenhof";

    Member host;
    host.id = "host";
    host.first_name = "Hans";
    host.last_name = "Meier";
    host.is_host = true;
    host.meters.push_back(meter("virtualconsumption", "V-C"));
    host.meters.push_back(meter("virtualproduction", "V-P"));
    host.meters.push_back(meter("consumption", "C-HOST"));
    host.meters.push_back(meter("production", "P-HOST"));
    c.addMember(host);

    Member anna;
    anna.id = "anna";
    anna.first_name = "Anna";
    anna.last_name = "Muster";
    anna.street = "Dorfstrasse 1";
    anna.zip = "3000";
    anna.city = "Bern";
    anna.meters.push_back(meter("consumption", "C-ANNA"));
    if (anna_produces) anna.meters.push_back(meter("production", "P-ANNA"));
    c.addMember(anna);

    return c;
}

void fillMonth(MemoryIntervalStore *store, const Month &m, string meter_id, Energy e, int skip = -1)
{
    vector<Slot> slots;
    expectedSlots(m, &slots);
    for (size_t i = 0; i < slots.size(); ++i)
    {
        if ((int)i == skip) continue;
        IntervalReading r;
        r.meter_id = meter_id;
        r.start = slots[i].start;
        r.energy = e;
        r.valid = true;
        store->add(r);
    }
}

void test_quality()
{
    Collective c = testCollective();
    vector<string> problems;
    expect(c.validate(&problems), "test collective is valid");

    Month feb(2025,2);
    MemoryIntervalStore store;
    fillMonth(&store, feb, "C-HOST", 400000);
    fillMonth(&store, feb, "P-HOST", 1000000);
    fillMonth(&store, feb, "C-ANNA", 600000);
    fillMonth(&store, feb, "V-C", 0);
    fillMonth(&store, feb, "V-P", 0);

    MeterReadings readings;
    fetchMonthReadings(feb, c, &store, &readings);
    MonthStatus ms = checkMonth(feb, c.allMeters(), readings);
    expect(ms.billable, "complete month is billable");
    expect_int(ms.expected_slots, 28*96, "expected slots of february");
    expect_int(ms.missing.size(), 0, "nothing missing");
    expect_int(ms.warnings.size(), 0, "no warnings");

    // One missing slot on a physical meter.
    MeterReadings missing = readings;
    missing["C-ANNA"].erase(missing["C-ANNA"].begin()+100);
    ms = checkMonth(feb, c.allMeters(), missing);
    expect(!ms.billable, "one missing slot is not billable");
    expect_int(ms.missing["C-ANNA"], 1, "missing slots of C-ANNA");
    expect_int(ms.gaps["C-ANNA"].size(), 1, "gaps of C-ANNA");
    expect_str(ms.reason(), "meter C-ANNA missing 1 slot(s)", "reason");

    // Gaps in the virtual meters only warn.
    MeterReadings virt = readings;
    virt["V-C"].erase(virt["V-C"].begin()+10, virt["V-C"].begin()+14);
    ms = checkMonth(feb, c.allMeters(), virt);
    expect(ms.billable, "virtual gaps do not gate");
    expect_int(ms.missing.size(), 0, "virtual gaps are not missing");
    expect_int(ms.warnings.size(), 1, "virtual gaps warn");

    // A reading not on a slot boundary.
    MeterReadings odd = readings;
    IntervalReading r = odd["C-ANNA"][0];
    r.start += 60;
    odd["C-ANNA"].push_back(r);
    ms = checkMonth(feb, c.allMeters(), odd);
    expect(ms.billable, "unexpected readings do not gate");
    expect_int(ms.unexpected["C-ANNA"], 1, "unexpected readings of C-ANNA");
    expect_int(ms.warnings.size(), 1, "unexpected readings warn");

    // No physical meters at all.
    ms = checkMonth(feb, c.virtualMeters(), readings);
    expect(!ms.billable, "a month without physical meters is not billable");
    expect_str(ms.reason(), "no physical meters", "reason without physical meters");

    vector<Slot> slots;
    expectedSlots(Date(2025,2,3), Date(2025,2,4), &slots);
    vector<Slot> run(slots.begin()+40, slots.begin()+44);
    vector<string> runs = summarizeGaps(run);
    expect_int(runs.size(), 1, "one gap run");
    if (runs.size() == 1) expect_str(runs[0], "2025-02-03 10:00 -> 2025-02-03 10:45 (4 slots)", "gap run");

    vector<Slot> scattered;
    for (int i = 0; i < 7; ++i) scattered.push_back(slots[i*4]);
    runs = summarizeGaps(scattered);
    expect_int(runs.size(), 6, "five runs listed plus the rest");
    if (runs.size() == 6) expect_str(runs[5], "(and 2 more)", "remaining runs");

    vector<MonthStatus> statuses;
    MemoryIntervalStore partial;
    fillMonth(&partial, feb, "C-HOST", 400000);
    fillMonth(&partial, feb, "P-HOST", 1000000);
    fillMonth(&partial, feb, "C-ANNA", 600000);
    checkCollective(Date(2025,2,1), Date(2025,4,1), c, &partial, &statuses);
    expect_int(statuses.size(), 2, "two months checked");
    if (statuses.size() == 2)
    {
        expect(statuses[0].billable, "february is billable");
        expect(!statuses[1].billable, "march without readings is not billable");
        // The virtual meters have no data at all, they are reported once.
        int nodata = 0;
        for (auto &w : statuses[0].warnings) if (w.find("has no data") != string::npos) nodata++;
        expect_int(nodata, 2, "meters without data");
    }
}

const SlotAllocation &flows(map<string,SlotAllocation> &m, string id)
{
    return m[id];
}

void test_allocation()
{
    // Scenario A: host produces 10 kWh and consumes 4 kWh, the member consumes 6 kWh.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        bool ok = allocateSlot({ { "C-ANNA", "anna", 6*kwh }, { "C-HOST", "host", 4*kwh } },
                               { { "P-HOST", "host", 10*kwh } }, &m, &b);
        expect(ok, "scenario A balance");
        expect_int(b.locally_consumed, 10*kwh, "scenario A locally consumed");
        expect_int(b.surplus_export, 0, "scenario A export");
        expect_int(flows(m,"anna").local, 6*kwh, "scenario A member local");
        expect_int(flows(m,"anna").grid, 0, "scenario A member grid");
        expect_int(flows(m,"host").local, 4*kwh, "scenario A host local");
        expect_int(flows(m,"host").local_supply, 10*kwh, "scenario A host supply");
        expect_int(flows(m,"host").self_supply, 4*kwh, "scenario A host self supply");
        expect_int(flows(m,"host").local_sold, 6*kwh, "scenario A host sold");
        expect_int(flows(m,"host").exported, 0, "scenario A host export");
    }

    // Scenario B: two producers 6 and 4 kWh, consumption 5 kWh.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        bool ok = allocateSlot({ { "C-1", "c", 5*kwh } },
                               { { "P-1", "p1", 6*kwh }, { "P-2", "p2", 4*kwh } }, &m, &b);
        expect(ok, "scenario B balance");
        expect_int(b.locally_consumed, 5*kwh, "scenario B locally consumed");
        expect_int(b.surplus_export, 5*kwh, "scenario B surplus");
        expect_int(flows(m,"p1").exported, 3*kwh, "scenario B producer 1 export");
        expect_int(flows(m,"p2").exported, 2*kwh, "scenario B producer 2 export");
        expect_int(flows(m,"p1").local_sold, 3*kwh, "scenario B producer 1 sold");
        expect_int(flows(m,"p2").local_sold, 2*kwh, "scenario B producer 2 sold");
        expect_int(flows(m,"c").local, 5*kwh, "scenario B consumer local");
    }

    // Uneven split of the export between two producers.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        bool ok = allocateSlot({ { "C-1", "c", 1 } }, { { "P-1", "p1", 3 }, { "P-2", "p2", 3 } }, &m, &b);
        expect(ok, "uneven export balance");
        expect_int(flows(m,"p1").local_supply+flows(m,"p1").exported, 3, "producer 1 supply and export");
        expect_int(flows(m,"p2").local_supply+flows(m,"p2").exported, 3, "producer 2 supply and export");
        expect_int(flows(m,"p1").local_supply+flows(m,"p2").local_supply, 1, "local supply of the producers");
    }

    // The remainder would exceed the production of the largest producer.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        bool ok = allocateSlot({ { "C-1", "c", 1 } },
                               { { "P-1", "p1", 5 }, { "P-2", "p2", 5 }, { "P-3", "p3", 5 } }, &m, &b);
        expect(ok, "capped export balance");
        expect_int(flows(m,"p1").exported, 5, "producer 1 exports everything");
        expect_int(flows(m,"p2").exported, 5, "producer 2 exports everything");
        expect_int(flows(m,"p3").exported, 4, "producer 3 exports the rest");
        expect_int(flows(m,"p3").local_supply, 1, "producer 3 supplies locally");
    }

    // Same for the local consumption of the consumers.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        bool ok = allocateSlot({ { "C-1", "c1", 5 }, { "C-2", "c2", 5 }, { "C-3", "c3", 5 } },
                               { { "P-1", "p", 14 } }, &m, &b);
        expect(ok, "capped local balance");
        expect_int(flows(m,"c1").grid, 0, "consumer 1 grid");
        expect_int(flows(m,"c2").grid, 0, "consumer 2 grid");
        expect_int(flows(m,"c3").grid, 1, "consumer 3 grid");
    }

    // No consumption, everything is exported.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        allocateSlot({ { "C-1", "c", 0 } }, { { "P-1", "p1", 5*kwh } }, &m, &b);
        expect_int(b.locally_consumed, 0, "zero consumption locally consumed");
        expect_int(flows(m,"p1").exported, 5*kwh, "zero consumption export");
        expect_int(flows(m,"c").grid, 0, "zero consumption grid");
    }

    // No production, everything comes from the grid.
    {
        map<string,SlotAllocation> m;
        SlotBalance b;
        allocateSlot({ { "C-1", "c", 2*kwh } }, { { "P-1", "p1", 0 } }, &m, &b);
        expect_int(flows(m,"c").grid, 2*kwh, "zero production grid");
        expect_int(flows(m,"p1").exported, 0, "zero production export");
    }

    // The tied remainder goes to the meter with the smallest id.
    {
        map<string,SlotAllocation> m;
        allocateSlot({ { "CH-A", "a", 1 }, { "CH-B", "b", 1 } }, { { "P", "p", 1 } }, &m, NULL);
        expect_int(flows(m,"a").local, 1, "remainder to the smallest id");
        expect_int(flows(m,"b").grid, 1, "the other one buys from the grid");
    }

    // Conservation for many uneven slots.
    uint32_t seed = 17;
    for (int n = 0; n < 500; ++n)
    {
        vector<MeterEnergy> cons, prod;
        for (int i = 0; i < 3; ++i)
        {
            seed = seed*1103515245 + 12345;
            cons.push_back({ "C-"+to_string(i), "m"+to_string(i), (Energy)((seed >> 8) % 3000000) });
        }
        for (int i = 0; i < 2; ++i)
        {
            seed = seed*1103515245 + 12345;
            prod.push_back({ "P-"+to_string(i), "m"+to_string(i), (Energy)((seed >> 8) % 4000000) });
        }
        map<string,SlotAllocation> m;
        SlotBalance b;
        if (!allocateSlot(cons, prod, &m, &b))
        {
            printf("ERROR! energy balance broken in slot %d\n", n);
            errors_++;
            break;
        }
        SlotAllocation total;
        for (auto &p : m) total.add(p.second);
        if (total.local != b.locally_consumed || total.exported != b.surplus_export ||
            total.local+total.grid != b.total_consumption ||
            total.local_supply+total.exported != b.total_production ||
            total.self_supply+total.local_sold != total.local_supply)
        {
            printf("ERROR! sums do not add up in slot %d\n", n);
            errors_++;
            break;
        }
        bool negative = false;
        for (auto &p : m)
        {
            if (p.second.grid < 0 || p.second.local_supply < 0 || p.second.self_supply < 0 ||
                p.second.local_sold < 0 || p.second.local_supply+p.second.exported != p.second.production)
            {
                negative = true;
            }
        }
        if (negative)
        {
            printf("ERROR! member flows do not add up in slot %d\n", n);
            errors_++;
            break;
        }
    }

    // A whole month.
    Collective c = testCollective();
    Month feb(2025,2);
    MemoryIntervalStore store;
    fillMonth(&store, feb, "C-HOST", 400000);
    fillMonth(&store, feb, "P-HOST", 1000000);
    fillMonth(&store, feb, "C-ANNA", 600000);
    fillMonth(&store, feb, "V-C", 0);
    fillMonth(&store, feb, "V-P", 0);
    MeterReadings readings;
    fetchMonthReadings(feb, c, &store, &readings);

    MonthAllocation ma;
    expect(allocateMonth(feb, c, readings, &ma), "allocate february");
    expect_int(ma.slots.size(), 28*96, "allocated slots");
    expect_int(ma.totals.local, 28*96*kwh, "local consumption of february");
    expect_int(ma.totals.grid, 0, "grid of february");
    expect_int(ma.members["anna"].size(), 28*96, "slots of anna");

    vector<string> warnings;
    expect(crossCheckVirtual(ma, c, readings, &warnings), "virtual meters agree");
    expect_int(warnings.size(), 0, "no cross check warnings");

    MemoryIntervalStore store2;
    fillMonth(&store2, feb, "C-HOST", 400000);
    fillMonth(&store2, feb, "P-HOST", 1000000);
    fillMonth(&store2, feb, "C-ANNA", 600000);
    fillMonth(&store2, feb, "V-C", 100000);
    MeterReadings readings2;
    fetchMonthReadings(feb, c, &store2, &readings2);
    MonthAllocation ma2;
    allocateMonth(feb, c, readings2, &ma2);
    warnings.clear();
    expect(!crossCheckVirtual(ma2, c, readings2, &warnings), "virtual consumption differs");
    expect_int(warnings.size(), 1, "one cross check warning");
}

Bill billFor(const Member &member, const MonthAllocation &ma, const Rates &rates, bool daily)
{
    BillingPeriod period;
    period.start = ma.month.first();
    period.end = ma.month.end();
    period.interval = BillingInterval::Monthly;
    period.label = ma.month.str();
    period.months.push_back(ma.month);

    map<Month,MonthAllocation> allocations;
    allocations[ma.month] = ma;
    map<Month,bool> billable;
    billable[ma.month] = true;

    Bill bill;
    AggregationResult r = aggregate(member, period, allocations, rates, billable, daily, &bill);
    expect(r.type == AggregationResultType::Success, "aggregate "+member.id);
    return bill;
}

// A month where only the first slot has any flows.
MonthAllocation singleSlotMonth(const Collective &c, map<string,SlotAllocation> &slot)
{
    MonthAllocation ma;
    ma.month = Month(2025,2);
    expectedSlots(ma.month, &ma.slots);
    for (const Member *m : c.billedMembers())
    {
        ma.members[m->id].resize(ma.slots.size());
        ma.members[m->id][0] = slot[m->id];
    }
    return ma;
}

void test_billing()
{
    Rates rates;
    parseQuantityWithUnit("0.20", Quantity::Rate, &rates.local);
    parseQuantityWithUnit("0.30", Quantity::Rate, &rates.buy);
    parseQuantityWithUnit("0.10", Quantity::Rate, &rates.sell);

    // Scenario A
    Collective c = testCollective();
    map<string,SlotAllocation> slot;
    allocateSlot({ { "C-ANNA", "anna", 6*kwh }, { "C-HOST", "host", 4*kwh } },
                 { { "P-HOST", "host", 10*kwh } }, &slot, NULL);
    MonthAllocation ma = singleSlotMonth(c, slot);

    Bill anna = billFor(*c.findMember("anna"), ma, rates, false);
    expect_int(anna.totals.local, 6*kwh, "anna local");
    expect_int(anna.local_cost, 120, "anna pays 1.20 for the local power");
    expect_int(anna.grid_cost, 0, "anna grid cost");
    expect_int(anna.total_revenue, 0, "anna is not a producer");
    expect_int(anna.net, 120, "anna owes the collective");

    Bill host = billFor(*c.findMember("host"), ma, rates, false);
    expect_int(host.applied_local_rate, 0, "the host local rate");
    expect_int(host.local_cost, 0, "the host local power is free");
    expect_int(host.local_revenue, 120, "the host sells 6 kWh locally");
    expect_int(host.export_revenue, 0, "the host exports nothing");
    expect_int(host.net, -120, "the collective owes the host");

    // Fees are charged in order, a percent fee on the cost and the fees before it.
    Member dora = *c.findMember("anna");
    Fee f;
    parseFeeLine("yearly:120::Membership", &f); dora.fees.push_back(f);
    parseFeeLine("per_kwh:0.05:local:Network", &f); dora.fees.push_back(f);
    parseFeeLine("per_kwh:0.05:grid:Grid levy", &f); dora.fees.push_back(f);
    parseFeeLine("percent:10::Administration", &f); dora.fees.push_back(f);
    Bill withfees = billFor(dora, ma, rates, false);
    expect_int(withfees.fees.size(), 4, "fee lines");
    if (withfees.fees.size() == 4)
    {
        expect_int(withfees.fees[0].amount, 1000, "a month of the yearly fee");
        expect_int(withfees.fees[1].amount, 30, "fee on 6 kWh local");
        expect_int(withfees.fees[2].amount, 0, "no grid consumption");
        expect_int(withfees.fees[3].amount, 115, "10 percent of cost and fees");
    }
    expect_int(withfees.total_fees, 1145, "total fees");
    expect_int(withfees.net, 1265, "net includes the fees");
    for (auto &p : toExportRow(withfees))
    {
        if (p.first == "total_fees") expect_str(p.second, "11.45", "fees in export row");
    }
    expect(renderBillJson(withfees).find("\"fees\":[{\"name\":\"Membership\",\"type\":\"yearly\",\"amount\":10.00}") != string::npos,
           "fees in json");
    expect(renderBillHR(withfees).find("total fees") != string::npos, "fees in the bill");

    ExportRow row = toExportRow(anna);
    expect_str(row[0].first, "year", "first column");
    bool found = false;
    for (auto &p : row)
    {
        if (p.first == "net") { found = true; expect_str(p.second, "1.20", "net in export row"); }
        if (p.first == "local_consumption_kwh") expect_str(p.second, "6.000", "local kWh in export row");
        if (p.first == "city") expect_str(p.second, "3000 Bern", "city in export row");
    }
    expect(found, "export row has net");

    // Scenario B with a producer that only produces.
    Collective cb;
    Member p1; p1.id = "p1"; p1.meters.push_back(meter("production", "P-1"));
    Member p2; p2.id = "p2"; p2.meters.push_back(meter("production", "P-2"));
    Member cons; cons.id = "c"; cons.meters.push_back(meter("consumption", "C-1"));
    cb.addMember(p1); cb.addMember(p2); cb.addMember(cons);
    map<string,SlotAllocation> slotb;
    allocateSlot({ { "C-1", "c", 5*kwh } }, { { "P-1", "p1", 6*kwh }, { "P-2", "p2", 4*kwh } }, &slotb, NULL);
    MonthAllocation mab = singleSlotMonth(cb, slotb);

    Bill b1 = billFor(*cb.findMember("p1"), mab, rates, true);
    expect_int(b1.local_revenue, 60, "producer 1 sells 3 kWh locally");
    expect_int(b1.export_revenue, 30, "producer 1 exports 3 kWh");
    expect_int(b1.total_cost, 0, "producer 1 consumes nothing");
    expect_int(b1.net, -90, "the collective owes producer 1");
    expect_int(b1.days.size(), 28, "one daily detail per day of the month");
    if (b1.days.size() == 28)
    {
        expect_int(b1.days[0].revenue, 90, "daily revenue of the first day");
        expect_int(b1.days[1].revenue, 0, "daily revenue of the second day");
    }

    Bill bc = billFor(*cb.findMember("c"), mab, rates, false);
    expect_int(bc.local_cost, 100, "consumer pays 5 kWh at 0.20");
    expect_int(bc.days.size(), 0, "no daily detail unless asked for");

    // A month that is not billable gives no bill.
    BillingPeriod period;
    period.start = Date(2025,1,1);
    period.end = Date(2025,4,1);
    period.interval = BillingInterval::Quarterly;
    period.label = "2025-Q1";
    period.months = monthsBetween(period.start, period.end);
    map<Month,MonthAllocation> allocations;
    map<Month,bool> billable;
    billable[Month(2025,1)] = true;
    billable[Month(2025,2)] = false;
    billable[Month(2025,3)] = true;
    Bill none;
    AggregationResult r = aggregate(*c.findMember("anna"), period, allocations, rates, billable, false, &none);
    expect(r.type == AggregationResultType::NonBillablePeriod, "non billable period");
    expect_int(r.non_billable.size(), 1, "one non billable month");
    if (r.non_billable.size() == 1) expect(r.non_billable[0] == Month(2025,2), "february is not billable");
}

Configuration testConfiguration(BillingInterval bi)
{
    Configuration c;
    c.collective = testCollective();
    c.period_start = Date(2025,1,1);
    c.period_end = Date(2025,4,1);
    c.interval = bi;
    parseQuantityWithUnit("0.20", Quantity::Rate, &c.rates.local);
    parseQuantityWithUnit("0.30", Quantity::Rate, &c.rates.buy);
    parseQuantityWithUnit("0.10", Quantity::Rate, &c.rates.sell);
    return c;
}

void fillScenarioC(MemoryIntervalStore *store)
{
    for (int m = 1; m <= 3; ++m)
    {
        Month month(2025, m);
        fillMonth(store, month, "C-HOST", 400000);
        fillMonth(store, month, "P-HOST", 1000000);
        // One slot of february is missing.
        fillMonth(store, month, "C-ANNA", 600000, m == 2 ? 500 : -1);
        fillMonth(store, month, "V-C", 0);
        fillMonth(store, month, "V-P", 0);
    }
}

string renderAll(const RunReport &r)
{
    string s;
    for (auto &b : r.bills)
    {
        s += renderBillHR(b);
        s += renderBillFields(b, ';')+"\n";
        s += renderBillJson(b)+"\n";
    }
    s += renderReport(r);
    return s;
}

void test_pipeline()
{
    Configuration c = testConfiguration(BillingInterval::Monthly);
    MemoryIntervalStore store;
    fillScenarioC(&store);

    RunReport report;
    expect(runBilling(c, &store, &report), "run billing");
    expect_int(report.months.size(), 3, "months in report");
    expect_int(report.numBillableMonths(), 2, "billable months");
    expect_int(report.periods.size(), 3, "monthly periods");
    // Two members with physical meters, two billable months.
    expect_int(report.bills.size(), 4, "bills");
    expect_int(report.excluded.size(), 1, "excluded periods");
    if (report.excluded.size() == 1)
    {
        expect_str(report.excluded[0].period.label, "2025-02", "excluded period");
        expect_str(report.excluded[0].reason, "month 2025-02 incomplete: meter C-ANNA missing 1 slot(s)", "excluded reason");
    }
    for (auto &b : report.bills)
    {
        expect(b.period.label != "2025-02", "no bill for february");
        if (b.member_id == "anna" && b.period.label == "2025-01")
        {
            // 31*96 slots of 0.6 kWh at 0.20
            expect_int(b.totals.local, 31*96*600000ll, "anna local in january");
            expect_int(b.local_cost, 35712, "anna local cost in january");
        }
    }

    // Recomputing gives the same output.
    RunReport again;
    runBilling(c, &store, &again);
    expect_str(renderAll(again), renderAll(report), "identical output of two runs");

    // The missing month excludes the whole quarter.
    Configuration q = testConfiguration(BillingInterval::Quarterly);
    RunReport rq;
    runBilling(q, &store, &rq);
    expect_int(rq.bills.size(), 0, "no bills for an incomplete quarter");
    expect_int(rq.excluded.size(), 1, "the quarter is excluded");
    if (rq.excluded.size() == 1) expect_str(rq.excluded[0].period.label, "2025-Q1", "excluded quarter");

    expect_str(renderReport(report),
               "2025-01 billable\n"
               "2025-02 NOT billable: meter C-ANNA missing 1 slot(s)\n"
               "2025-03 billable\n"
               "excluded 2025-02: month 2025-02 incomplete: meter C-ANNA missing 1 slot(s)\n",
               "rendered report");

    string header = renderFieldsHeader(';');
    expect(startsWith(header, "year;month;period;"), "fields header");

    expect_str(renderReportJson(report),
               "{\"months\":[{\"month\":\"2025-01\",\"billable\":true},"
               "{\"month\":\"2025-02\",\"billable\":false,\"reason\":\"meter C-ANNA missing 1 slot(s)\"},"
               "{\"month\":\"2025-03\",\"billable\":true}],"
               "\"excluded\":[{\"period\":\"2025-02\",\"reason\":\"month 2025-02 incomplete: meter C-ANNA missing 1 slot(s)\"}]}",
               "rendered json report");

    // With bill files the report is written beside the bills.
    char tmpl[] = "/tmp/vzevcalc_test_XXXXXX";
    if (mkdtemp(tmpl) != NULL)
    {
        string dir = tmpl;
        string nolog = "";
        Printer printer(OutputFormat::HR, ';', true, dir, false, nolog);
        printer.print(report.bills[0]);
        printer.printReport(report);
        vector<string> files;
        listFiles(dir, &files);
        expect_int(files.size(), 2, "one bill file and the report");
        vector<string> lines;
        expect(loadFile(dir+"/report.txt", &lines) == 0, "report file written");
        expect_int(lines.size(), 4, "lines of the report file");
        if (lines.size() == 4) expect_str(lines[3], "excluded 2025-02: month 2025-02 incomplete: meter C-ANNA missing 1 slot(s)", "excluded period in the report file");
        for (auto &f : files) unlink((dir+"/"+f).c_str());
        rmdir(dir.c_str());
    }

    // Bills are not appended to a file named syslog.
    if (!checkFileExists("syslog"))
    {
        string nodir = "";
        string syslog = "syslog";
        Printer printer(OutputFormat::Fields, ';', false, nodir, true, syslog);
        printer.print(report.bills[0]);
        expect(!checkFileExists("syslog"), "no syslog file created");
    }

    // Two producers whose surplus does not split evenly.
    Configuration two = testConfiguration(BillingInterval::Monthly);
    two.collective = testCollective(true);
    two.period_start = Date(2025,2,1);
    two.period_end = Date(2025,3,1);
    MemoryIntervalStore store2;
    Month feb(2025,2);
    fillMonth(&store2, feb, "C-HOST", 400001);
    fillMonth(&store2, feb, "P-HOST", 700003);
    fillMonth(&store2, feb, "C-ANNA", 600000);
    fillMonth(&store2, feb, "P-ANNA", 500000);
    fillMonth(&store2, feb, "V-C", 0);
    fillMonth(&store2, feb, "V-P", 0);
    RunReport r2;
    expect(runBilling(two, &store2, &r2), "run billing with two producers");
    expect_int(r2.numBillableMonths(), 1, "february with two producers is billable");
    expect_int(r2.bills.size(), 2, "bills with two producers");
    expect_int(r2.excluded.size(), 0, "nothing excluded with two producers");
    Energy production = 0, supplied = 0;
    for (auto &b : r2.bills)
    {
        production += b.totals.production;
        supplied += b.totals.local_supply+b.totals.exported;
    }
    expect_int(supplied, production, "production of both producers is accounted for");
    expect_int(production, 28*96*1200003ll, "production in february");

    // A month whose balance fails says so.
    MonthStatus failed;
    failed.month = feb;
    failed.allocation_failed = true;
    expect_str(failed.reason(), "energy balance of the allocation failed", "reason of a failed allocation");
}

void test_csv()
{
    Collective c = testCollective();
    MemoryIntervalStore store;
    LoadStats stats;

    vector<string> lines = {
        "Messpunkt;Zeitstempel;Bezug;Einspeisung;Status",
        "C-ANNA;1.2.2025 00:00:00;0,250;0;W",
        "P-HOST;1.2.2025 00:00:00;0;1.5;W",
        "C-ANNA;1.2.2025 00:15:00;0.1;0;X",
        "UNKNOWN;1.2.2025 00:15:00;0.1;0;W",
        "C-ANNA;bad;0.1;0;W",
        "C-ANNA;1.2.2025 00:30:00;0.3;;",
        "C-ANNA;30.3.2025 02:15:00;0.3;0;W",
    };
    LoadResult r = loadReadingsLines(lines, "test.csv", c, &store, &stats);
    expect(r.type == LoadResultType::Success, "load csv lines");
    expect_int(stats.loaded, 3, "loaded readings");
    expect_int(stats.invalid_quality, 1, "invalid quality");
    expect_int(stats.bad_rows, 1, "bad rows");
    expect_int(stats.unknown_meters.size(), 1, "unknown meters");
    expect_int(stats.nonexistent_times, 1, "readings inside the summer time gap");

    time_t from = localMidnight(Date(2025,2,1));
    time_t to = localMidnight(Date(2025,2,2));
    vector<IntervalReading> anna;
    store.readings("C-ANNA", from, to, &anna);
    expect_int(anna.size(), 2, "readings of C-ANNA");
    if (anna.size() == 2)
    {
        expect_int(anna[0].energy, 250000, "decimal comma");
        expect_int(anna[1].start-anna[0].start, 2*SLOT_SECONDS, "readings sorted on time");
    }
    vector<IntervalReading> host;
    store.readings("P-HOST", from, to, &host);
    expect(host.size() == 1 && host[0].energy == 1500000, "production meter uses the production column");

    // The repeated hour of the fall back day.
    MemoryIntervalStore fall;
    LoadStats fstats;
    vector<string> flines = { "header", "C-ANNA;26.10.2025 01:45:00;1;0;W" };
    for (int round = 0; round < 2; ++round)
    {
        for (int m = 0; m < 60; m += 15)
        {
            flines.push_back(tostrprintf("C-ANNA;26.10.2025 02:%02d:00;%d;0;W", m, round+2));
        }
    }
    flines.push_back("C-ANNA;26.10.2025 03:00:00;4;0;W");
    r = loadReadingsLines(flines, "fall.csv", c, &fall, &fstats);
    expect(r.type == LoadResultType::Success, "load fall back day");
    vector<IntervalReading> fr;
    fall.readings("C-ANNA", localMidnight(Date(2025,10,26)), localMidnight(Date(2025,10,27)), &fr);
    expect_int(fr.size(), 10, "readings of the fall back hour");
    for (size_t i = 1; i < fr.size(); ++i)
    {
        if (fr[i].start != fr[i-1].start+SLOT_SECONDS)
        {
            printf("ERROR! fall back readings not consecutive at %zu\n", i);
            errors_++;
            break;
        }
    }
    if (fr.size() == 10)
    {
        expect_int(fr[1].energy, 2*kwh, "first 02:00");
        expect_int(fr[5].energy, 3*kwh, "second 02:00");
        expect_str(Slot(fr[5].start).strz(), "2025-10-26 02:00+0100", "second 02:00 is winter time");
    }

    // A later month loaded first does not move the first 02:00 to winter time.
    MemoryIntervalStore novfirst;
    LoadStats nstats;
    r = loadReadingsLines({ "header", "C-ANNA;1.11.2025 00:00:00;1;0;W" }, "nov.csv", c, &novfirst, &nstats);
    expect(r.type == LoadResultType::Success, "load november");
    r = loadReadingsLines(flines, "oct.csv", c, &novfirst, &nstats);
    expect(r.type == LoadResultType::Success, "load october after november");
    expect_int(nstats.loaded, 11, "readings of november and october");

    // The repeated hour split over two files.
    MemoryIntervalStore split;
    LoadStats sstats;
    vector<string> first(flines.begin(), flines.begin()+6);
    vector<string> second = { "header" };
    second.insert(second.end(), flines.begin()+6, flines.end());
    r = loadReadingsLines(first, "part1.csv", c, &split, &sstats);
    expect(r.type == LoadResultType::Success, "load first part of the fall back day");
    r = loadReadingsLines(second, "part2.csv", c, &split, &sstats);
    expect(r.type == LoadResultType::Success, "load second part of the fall back day");
    expect_int(sstats.loaded, 10, "readings of the split fall back day");

    // Duplicates are input errors.
    MemoryIntervalStore dup;
    LoadStats dstats;
    vector<string> dlines = {
        "header",
        "C-ANNA;1.2.2025 00:00:00;1;0;W",
        "C-ANNA;1.2.2025 00:00:00;1;0;W",
    };
    r = loadReadingsLines(dlines, "dup.csv", c, &dup, &dstats);
    expect(r.type == LoadResultType::DuplicateReading, "duplicate reading");

    IntervalReading ir;
    ir.meter_id = "X";
    ir.start = 900;
    ir.valid = true;
    MemoryIntervalStore s;
    expect(s.add(ir), "first add");
    expect(!s.add(ir), "second add is a duplicate");
    expect_int(s.size(), 1, "store size");
}

vector<char> buf(string s)
{
    vector<char> v(s.begin(), s.end());
    v.push_back('\n');
    return v;
}

void test_config()
{
    Configuration c;
    vector<char> main_conf = buf("# Sonnenhof\n"
                                 "name=Sonnenhof\n"
                                 "\n"
                                 "periodstart=2025-01\n"
                                 "periodend=2025-04-01\n"
                                 "interval=quarterly\n"
                                 "localrate=0.20\n"
                                 "buyrate=30 ct/kWh\n"
                                 "sellrate=0.10 CHF/kWh\n"
                                 "format=json\n"
                                 "dailydetail=true\n");
    parseMainConfig(&c, main_conf, "vzevcalc.conf");
    expect_str(c.name, "Sonnenhof", "collective name");
    expect_str(c.period_start.str(), "2025-01-01", "period start");
    expect_str(c.period_end.str(), "2025-04-01", "period end");
    expect(c.interval == BillingInterval::Quarterly, "interval");
    expect_int(c.rates.local, 200000, "local rate");
    expect_int(c.rates.buy, 300000, "buy rate");
    expect_int(c.rates.sell, 100000, "sell rate");
    expect(c.format == OutputFormat::Json, "format");
    expect(c.daily_detail, "daily detail");
    expect_int(c.problems.size(), 0, "no problems in the main config");

    vector<char> anna = buf("firstname=Anna\n"
                            "lastname=Muster\n"
                            "street=Dorfstrasse 1\n"
                            "host=false\n"
                            "meter=consumption:C-ANNA:Flat 2\n");
    parseMemberConfig(&c, anna, "/etc/vzevcalc.d/anna");
    const Member *m = c.collective.findMember("anna");
    expect(m != NULL, "member anna");
    if (m)
    {
        expect_str(m->fullName(), "Anna Muster", "full name");
        expect_str(m->street, "Dorfstrasse 1", "street");
        expect_int(m->meters.size(), 1, "meters of anna");
        if (m->meters.size() == 1)
        {
            expect(m->meters[0].kind() == MeterKind::Consumption, "meter kind");
            expect_str(m->meters[0].name, "Flat 2", "meter name");
            expect_str(m->meters[0].member_id, "anna", "meter owner");
        }
    }

    vector<string> problems;
    expect(!checkConfiguration(&c, &problems), "a collective without host is not valid");

    vector<char> host = buf("firstname=Hans\n"
                            "host=true\n"
                            "meter=virtualconsumption:V-C:Grid consumption\n"
                            "meter=virtualproduction:V-P:Grid production\n"
                            "meter=production:P-HOST:Roof\n"
                            "meter=consumption:C-HOST:House\n");
    parseMemberConfig(&c, host, "/etc/vzevcalc.d/host");
    problems.clear();
    expect(checkConfiguration(&c, &problems), "a collective with host is valid");
    for (auto &p : problems) printf("    %s\n", p.c_str());
    expect(c.collective.findMember("host")->isProducer(), "the host is a producer");
    expect(!c.collective.findMember("anna")->isProducer(), "anna is not a producer");
    expect_int(c.collective.billedMembers().size(), 2, "billed members");
    expect_str(c.collective.ownerOf("P-HOST")->id, "host", "owner of P-HOST");

    Configuration d = c;
    vector<char> dup = buf("meter=consumption:C-ANNA:Again\n");
    parseMemberConfig(&d, dup, "/etc/vzevcalc.d/bob");
    problems.clear();
    expect(!checkConfiguration(&d, &problems), "duplicate meter id");

    Configuration e = c;
    vector<char> bad = buf("meter=heating:H-1:Boiler\n");
    parseMemberConfig(&e, bad, "/etc/vzevcalc.d/carl");
    problems.clear();
    expect(!checkConfiguration(&e, &problems), "unknown meter kind");

    Configuration f = c;
    vector<char> badperiod = buf("periodstart=2025-01-15\nlocalrate=-0.1\ninterval=weekly\n");
    parseMainConfig(&f, badperiod, "vzevcalc.conf");
    problems.clear();
    expect(!checkConfiguration(&f, &problems), "bad period, rate and interval");
    expect_int(problems.size(), 3, "three problems");

    Configuration h = c;
    vector<char> fees = buf("meter=consumption:C-DORA:Flat 3\n"
                            "fee=yearly:120:: Membership\n"
                            "fee=per_kwh:5 ct/kWh:local:Network: local part\n"
                            "fee=per_kwh:0.01::Grid levy\n"
                            "fee=percent:7.7::Administration\n");
    parseMemberConfig(&h, fees, "/etc/vzevcalc.d/dora");
    problems.clear();
    expect(checkConfiguration(&h, &problems), "member with fees");
    const Member *dora = h.collective.findMember("dora");
    if (dora && dora->fees.size() == 4)
    {
        expect(dora->fees[0].type == FeeType::Yearly, "yearly fee");
        expect_int(dora->fees[0].value, 12000, "yearly fee in cents");
        expect_str(dora->fees[0].name, "Membership", "yearly fee name");
        expect(!dora->fees[1].on_grid, "per kWh fee on local consumption");
        expect_int(dora->fees[1].value, 50000, "per kWh fee rate");
        expect_str(dora->fees[1].name, "Network: local part", "fee name with colon");
        expect(dora->fees[2].on_grid, "per kWh fee defaults to the grid");
        expect_int(dora->fees[3].value, 770, "percent fee");
    }
    else
    {
        printf("ERROR! expected four fees for dora\n");
        errors_++;
    }

    Configuration k = c;
    vector<char> badfee = buf("fee=monthly:5::Rent\nfee=yearly:abc::Membership\nfee=yearly:120:local:Membership\nfee=percent:5::\n");
    parseMemberConfig(&k, badfee, "/etc/vzevcalc.d/erik");
    expect_int(k.problems.size(), 4, "four bad fees");

    Configuration g = c;
    g.period_end = Date(2025,1,1);
    problems.clear();
    expect(!checkConfiguration(&g, &problems), "period start must be before end");

    ConfigOverrides o;
    o.format_override = "fields";
    o.separator_override = ",";
    o.interval_override = "annual";
    applyOverrides(&c, o);
    expect(c.format == OutputFormat::Fields, "format override");
    expect(c.separator == ',', "separator override");
    expect(c.interval == BillingInterval::Annual, "interval override");
}
