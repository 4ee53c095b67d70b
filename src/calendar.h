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

#ifndef CALENDAR_H
#define CALENDAR_H

#include<string>
#include<time.h>
#include<vector>

// The meters deliver one value per 15 minutes.
#define SLOT_SECONDS 900

// A civil date in the configured time zone. Months are 1-12.
struct Date
{
    int year {};
    int month {};
    int day {};

    Date() {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Accepts 2025-03-21 and 2025-03 (which means 2025-03-01).
    bool parse(const std::string &s);
    bool isValid() const;
    // Return for example: 2025-03-21
    std::string str() const;

    bool operator==(const Date &d) const { return year == d.year && month == d.month && day == d.day; }
    bool operator!=(const Date &d) const { return !(*this == d); }
    bool operator<(const Date &d) const;
    bool operator<=(const Date &d) const { return *this < d || *this == d; }
};

struct Month
{
    int year {};
    int month {};

    Month() {}
    Month(int y, int m) : year(y), month(m) {}
    explicit Month(const Date &d) : year(d.year), month(d.month) {}

    Date first() const { return Date(year, month, 1); }
    // The first day of the following month, ie the exclusive end.
    Date end() const;
    Month next() const;
    // Return for example: 2025-03
    std::string str() const;

    bool operator==(const Month &m) const { return year == m.year && month == m.month; }
    bool operator!=(const Month &m) const { return !(*this == m); }
    bool operator<(const Month &m) const { return year < m.year || (year == m.year && month < m.month); }
};

// A Slot is identified by the instant (seconds since epoch) when the
// 15 minute interval starts. Using the instant instead of the local
// wall clock time keeps the two 02:00-03:00 hours of a fall back day apart.
struct Slot
{
    time_t start {};

    Slot() {}
    explicit Slot(time_t t) : start(t) {}

    // Local wall clock time: 2025-10-26 02:15
    std::string str() const;
    // Local wall clock time with utc offset: 2025-10-26 02:15+0100
    std::string strz() const;

    bool operator==(const Slot &s) const { return start == s.start; }
    bool operator!=(const Slot &s) const { return start != s.start; }
    bool operator<(const Slot &s) const { return start < s.start; }
};

#define LIST_OF_BILLING_INTERVALS \
    X(Monthly,monthly,1)          \
    X(Quarterly,quarterly,3)      \
    X(SemiAnnual,semiannual,6)    \
    X(Annual,annual,12)           \

enum class BillingInterval
{
#define X(name,lcname,months) name,
LIST_OF_BILLING_INTERVALS
#undef X
    Unknown
};

BillingInterval toBillingInterval(const std::string &s);
const char *toString(BillingInterval bi);
int monthsPerPeriod(BillingInterval bi);
const char *availableBillingIntervals();

struct BillingPeriod
{
    Date start; // Inclusive
    Date end;   // Exclusive
    BillingInterval interval {};
    std::string label; // 2025-03 2025-Q1 2025-H2 2025
    std::vector<Month> months; // The calendar months overlapping start..end.

    std::string str() const;
};

enum class CalendarResultType
{
    Success,
    InvalidRange,
    InvalidInterval
};

struct CalendarResult
{
    CalendarResultType type;
    std::string msg;
};

// Select the time zone used for the local civil time of all dates, e.g. Europe/Zurich.
// Returns false if the time zone is not known to the system, the zone is still set.
bool setCalendarTimezone(const std::string &tz);
std::string calendarTimezone();

bool isLeapYear(int year);
int daysInMonth(int year, int month);
Date addDays(const Date &d, int days);
// Adding months to the last day of a month lands on the last day of the result month.
Date addMonths(const Date &d, int months);

// The instant of local midnight starting the date.
time_t localMidnight(const Date &d);
// The local date of the instant.
Date localDateOf(time_t t);

// Every slot from local midnight of start up to (but not including) local midnight of end.
// A spring forward day has 92 slots, a fall back day 100, any other day 96.
CalendarResult expectedSlots(const Date &start, const Date &end, std::vector<Slot> *slots);
CalendarResult expectedSlots(const Month &m, std::vector<Slot> *slots);

// Split start..end (end exclusive) into calendar aligned billing periods.
// The last period is truncated at end.
CalendarResult partition(const Date &start, const Date &end, BillingInterval bi, std::vector<BillingPeriod> *periods);

// The calendar months overlapping start..end (end exclusive).
std::vector<Month> monthsBetween(const Date &start, const Date &end);

// Find the instants matching a local wall clock time. Normally one, two inside the
// repeated hour of a fall back day and none inside the skipped hour of a spring forward day.
// The instants are sorted.
void localTimeToInstants(int year, int month, int day, int hour, int minute, int second, std::vector<time_t> *instants);

#endif
