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

#include"calendar.h"
#include"util.h"

#include<algorithm>
#include<stdio.h>
#include<stdlib.h>
#include<string.h>

using namespace std;

string timezone_ = "Europe/Zurich";

bool setCalendarTimezone(const string &tz)
{
    timezone_ = tz;
    setenv("TZ", tz.c_str(), 1);
    tzset();

    string file = "/usr/share/zoneinfo/"+tz;
    if (tz.length() > 0 && tz[0] == '/') file = tz;
    if (!checkFileExists(file.c_str()))
    {
        return false;
    }
    debug("(calendar) using time zone %s\n", tz.c_str());
    return true;
}

string calendarTimezone()
{
    return timezone_;
}

bool Date::parse(const string &s)
{
    int y = 0, m = 0, d = 0;
    char tail = 0;

    if (s.length() == 10 && sscanf(s.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) == 3)
    {
        year = y; month = m; day = d;
        return isValid();
    }
    if (s.length() == 7 && sscanf(s.c_str(), "%4d-%2d%c", &y, &m, &tail) == 2)
    {
        year = y; month = m; day = 1;
        return isValid();
    }
    return false;
}

bool Date::isValid() const
{
    if (year < 1970 || year > 2200) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    return true;
}

string Date::str() const
{
    return tostrprintf("%04d-%02d-%02d", year, month, day);
}

bool Date::operator<(const Date &d) const
{
    if (year != d.year) return year < d.year;
    if (month != d.month) return month < d.month;
    return day < d.day;
}

Date Month::end() const
{
    return next().first();
}

Month Month::next() const
{
    if (month == 12) return Month(year+1, 1);
    return Month(year, month+1);
}

string Month::str() const
{
    return tostrprintf("%04d-%02d", year, month);
}

string Slot::str() const
{
    char buf[64];
    struct tm tm;
    localtime_r(&start, &tm);
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

string Slot::strz() const
{
    char buf[64];
    struct tm tm;
    localtime_r(&start, &tm);
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M%z", &tm);
    return buf;
}

BillingInterval toBillingInterval(const string &s)
{
#define X(name,lcname,months) if (s == #lcname) return BillingInterval::name;
LIST_OF_BILLING_INTERVALS
#undef X
    // Older configuration files spell it with an underscore.
    if (s == "semi_annual") return BillingInterval::SemiAnnual;

    return BillingInterval::Unknown;
}

const char *toString(BillingInterval bi)
{
#define X(name,lcname,months) if (bi == BillingInterval::name) return #lcname;
LIST_OF_BILLING_INTERVALS
#undef X

    return "unknown";
}

int monthsPerPeriod(BillingInterval bi)
{
#define X(name,lcname,months) if (bi == BillingInterval::name) return months;
LIST_OF_BILLING_INTERVALS
#undef X

    return 0;
}

const char *availableBillingIntervals()
{
    return
#define X(name,lcname,months) #lcname " "
LIST_OF_BILLING_INTERVALS
#undef X
        ;
}

string BillingPeriod::str() const
{
    return label+" ("+start.str()+" - "+end.str()+")";
}

bool isLeapYear(int year)
{
    if (year % 4 != 0) return false;
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return true;
}

static int days_in_months[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

int daysInMonth(int year, int month)
{
    if (month < 1 || month > 12)
    {
        month = 1;
    }

    int days = days_in_months[month-1];

    if (month == 2 && isLeapYear(year))
    {
        // Handle february in a leap year.
        days += 1;
    }

    return days;
}

Date addDays(const Date &d, int days)
{
    Date r = d;
    while (days > 0)
    {
        if (r.day < daysInMonth(r.year, r.month))
        {
            r.day++;
        }
        else
        {
            r.day = 1;
            if (r.month == 12) { r.month = 1; r.year++; }
            else r.month++;
        }
        days--;
    }
    while (days < 0)
    {
        if (r.day > 1)
        {
            r.day--;
        }
        else
        {
            if (r.month == 1) { r.month = 12; r.year--; }
            else r.month--;
            r.day = daysInMonth(r.year, r.month);
        }
        days++;
    }
    return r;
}

Date addMonths(const Date &date, int months)
{
    bool is_last_day_in_month = date.day == daysInMonth(date.year, date.month);

    int year = date.year + months / 12;
    int month = date.month + months % 12;

    while (month > 12)
    {
        year += 1;
        month -= 12;
    }

    while (month < 1)
    {
        year -= 1;
        month += 12;
    }

    int day;

    if (is_last_day_in_month)
    {
        day = daysInMonth(year, month); // Last day of month maps to last day of result month
    }
    else
    {
        day = min(date.day, daysInMonth(year, month));
    }

    return Date(year, month, day);
}

time_t localMidnight(const Date &d)
{
    struct tm tm;
    memset(&tm, 0, sizeof(tm));
    tm.tm_year = d.year-1900;
    tm.tm_mon = d.month-1;
    tm.tm_mday = d.day;
    tm.tm_isdst = -1; // Let mktime figure out if summer time is active.
    return mktime(&tm);
}

Date localDateOf(time_t t)
{
    struct tm tm;
    localtime_r(&t, &tm);
    return Date(tm.tm_year+1900, tm.tm_mon+1, tm.tm_mday);
}

CalendarResult expectedSlots(const Date &start, const Date &end, vector<Slot> *slots)
{
    if (!(start < end))
    {
        return { CalendarResultType::InvalidRange,
                 "start date "+start.str()+" must be before end date "+end.str() };
    }

    time_t from = localMidnight(start);
    time_t to = localMidnight(end);

    // Walking the instants, not the wall clock, automatically
    // drops the skipped hour and repeats the doubled hour.
    for (time_t t = from; t < to; t += SLOT_SECONDS)
    {
        slots->push_back(Slot(t));
    }

    trace("(calendar) %s - %s has %zu slots\n", start.str().c_str(), end.str().c_str(), slots->size());
    return { CalendarResultType::Success, "" };
}

CalendarResult expectedSlots(const Month &m, vector<Slot> *slots)
{
    return expectedSlots(m.first(), m.end(), slots);
}

static string periodLabel(const Date &aligned_start, BillingInterval bi)
{
    switch (bi)
    {
    case BillingInterval::Monthly:
        return tostrprintf("%04d-%02d", aligned_start.year, aligned_start.month);
    case BillingInterval::Quarterly:
        return tostrprintf("%04d-Q%d", aligned_start.year, (aligned_start.month-1)/3+1);
    case BillingInterval::SemiAnnual:
        return tostrprintf("%04d-H%d", aligned_start.year, (aligned_start.month-1)/6+1);
    case BillingInterval::Annual:
        return tostrprintf("%04d", aligned_start.year);
    case BillingInterval::Unknown:
        break;
    }
    return "?";
}

CalendarResult partition(const Date &start, const Date &end, BillingInterval bi, vector<BillingPeriod> *periods)
{
    if (!(start < end))
    {
        return { CalendarResultType::InvalidRange,
                 "period start "+start.str()+" must be before period end "+end.str() };
    }
    int n = monthsPerPeriod(bi);
    if (n == 0)
    {
        return { CalendarResultType::InvalidInterval,
                 string("unknown billing interval, expected one of: ")+availableBillingIntervals() };
    }

    Date cur = start;
    while (cur < end)
    {
        // The calendar aligned period that contains cur.
        Date aligned(cur.year, ((cur.month-1)/n)*n+1, 1);
        Date aligned_end = addMonths(aligned, n);

        BillingPeriod bp;
        bp.start = cur;
        bp.end = aligned_end < end ? aligned_end : end;
        bp.interval = bi;
        bp.label = periodLabel(aligned, bi);
        bp.months = monthsBetween(bp.start, bp.end);

        debug("(calendar) billing period %s\n", bp.str().c_str());
        periods->push_back(bp);
        cur = bp.end;
    }

    return { CalendarResultType::Success, "" };
}

vector<Month> monthsBetween(const Date &start, const Date &end)
{
    vector<Month> months;
    if (!(start < end)) return months;

    Month m(start);
    while (m.first() < end)
    {
        months.push_back(m);
        m = m.next();
    }
    return months;
}

void localTimeToInstants(int year, int month, int day, int hour, int minute, int second, vector<time_t> *instants)
{
    for (int isdst = 0; isdst <= 1; ++isdst)
    {
        struct tm tm;
        memset(&tm, 0, sizeof(tm));
        tm.tm_year = year-1900;
        tm.tm_mon = month-1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        tm.tm_isdst = isdst;
        time_t t = mktime(&tm);
        if (t == (time_t)-1) continue;

        // mktime normalizes a time that does not exist for the given dst flag,
        // so verify that the instant really shows this wall clock time.
        struct tm back;
        localtime_r(&t, &back);
        if (back.tm_year != year-1900 || back.tm_mon != month-1 || back.tm_mday != day ||
            back.tm_hour != hour || back.tm_min != minute || back.tm_sec != second)
        {
            continue;
        }
        if (find(instants->begin(), instants->end(), t) == instants->end())
        {
            instants->push_back(t);
        }
    }
    sort(instants->begin(), instants->end());
}
