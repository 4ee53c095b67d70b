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

#ifndef READINGS_H
#define READINGS_H

#include"collective.h"
#include"units.h"

#include<map>
#include<set>
#include<string>
#include<time.h>
#include<vector>

struct IntervalReading
{
    std::string meter_id;
    time_t start {}; // Start of the 15 minute slot.
    Energy energy {};
    bool valid {};
};

// The source of interval readings. The readings returned are those of the meter
// with start >= from and start < to, with valid quality, sorted on start.
struct IntervalStore
{
    virtual bool readings(const std::string &meter_id, time_t from, time_t to,
                          std::vector<IntervalReading> *out) = 0;
    virtual ~IntervalStore() = default;
};

struct MemoryIntervalStore : public IntervalStore
{
    bool readings(const std::string &meter_id, time_t from, time_t to,
                  std::vector<IntervalReading> *out);

    // Returns false if the meter already has a reading starting at the same instant.
    bool add(const IntervalReading &r);
    bool contains(const std::string &meter_id, time_t start);
    size_t size();

private:

    std::map<std::string,std::map<time_t,IntervalReading>> readings_;
    size_t size_ {};
};

enum class LoadResultType
{
    Success,
    FileError,
    DuplicateReading
};

struct LoadResult
{
    LoadResultType type;
    std::string msg;
};

struct LoadStats
{
    int rows {};
    int loaded {};
    int invalid_quality {};
    int bad_rows {};
    int nonexistent_times {};
    std::set<std::string> unknown_meters;
};

// Parse 21.3.2025 14:15:00 (or 21.03.2025 14:15) into its parts.
bool parseUtilityTimestamp(const std::string &s, int *year, int *month, int *day,
                           int *hour, int *minute, int *second);

// The utility export dialect:
// meter id;timestamp;consumption kWh;production kWh;quality
// The first line is a header. Quality W or empty means a valid value.
LoadResult loadReadingsLines(const std::vector<std::string> &lines, const std::string &source,
                             const Collective &collective, MemoryIntervalStore *store, LoadStats *stats);
LoadResult loadReadingsFile(const std::string &file, const Collective &collective,
                            MemoryIntervalStore *store, LoadStats *stats);
// Load all *.csv files in the directory in sorted order.
LoadResult loadReadingsDir(const std::string &dir, const Collective &collective,
                           MemoryIntervalStore *store, LoadStats *stats);

// Log the skipped rows and the unknown meters found while loading.
void logLoadStats(const LoadStats &stats);

#endif
