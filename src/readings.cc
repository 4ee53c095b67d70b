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

#include"readings.h"
#include"calendar.h"
#include"util.h"

#include<stdio.h>

using namespace std;

bool MemoryIntervalStore::readings(const string &meter_id, time_t from, time_t to,
                                   vector<IntervalReading> *out)
{
    auto m = readings_.find(meter_id);
    if (m == readings_.end()) return true;

    for (auto i = m->second.lower_bound(from); i != m->second.end() && i->first < to; ++i)
    {
        if (i->second.valid) out->push_back(i->second);
    }
    return true;
}

bool MemoryIntervalStore::add(const IntervalReading &r)
{
    auto &meter = readings_[r.meter_id];
    if (meter.count(r.start) > 0) return false;
    meter[r.start] = r;
    size_++;
    return true;
}

bool MemoryIntervalStore::contains(const string &meter_id, time_t start)
{
    auto m = readings_.find(meter_id);
    return m != readings_.end() && m->second.count(start) > 0;
}

size_t MemoryIntervalStore::size()
{
    return size_;
}

bool parseUtilityTimestamp(const string &s, int *year, int *month, int *day,
                           int *hour, int *minute, int *second)
{
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, se = 0;
    char tail = 0;

    int n = sscanf(s.c_str(), "%d.%d.%d %d:%d:%d%c", &d, &mo, &y, &h, &mi, &se, &tail);
    if (n != 6)
    {
        se = 0;
        n = sscanf(s.c_str(), "%d.%d.%d %d:%d%c", &d, &mo, &y, &h, &mi, &tail);
        if (n != 5) return false;
    }
    if (!Date(y, mo, d).isValid()) return false;
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || se < 0 || se > 59) return false;

    *year = y; *month = mo; *day = d;
    *hour = h; *minute = mi; *second = se;
    return true;
}

LoadResult loadReadingsLines(const vector<string> &lines, const string &source,
                             const Collective &collective, MemoryIntervalStore *store, LoadStats *stats)
{
    // Start of the previous reading of each meter in these lines.
    map<string,time_t> previous;

    for (size_t n = 1; n < lines.size(); ++n)
    {
        const string &line = lines[n];
        if (line.length() == 0) continue;
        stats->rows++;

        vector<string> cols = splitStringKeepEmpty(line, ';');
        if (cols.size() < 4)
        {
            warning("(readings) %s:%zu expected at least 4 columns: \"%s\"\n", source.c_str(), n+1, line.c_str());
            stats->bad_rows++;
            continue;
        }
        for (auto &c : cols) trimWhitespace(&c);

        const Meter *meter = collective.findMeter(cols[0]);
        if (meter == NULL)
        {
            stats->unknown_meters.insert(cols[0]);
            continue;
        }

        string quality = cols.size() > 4 ? cols[4] : "";
        if (quality != "" && quality != "W")
        {
            trace("(readings) %s:%zu skipping %s quality \"%s\"\n", source.c_str(), n+1, meter->external_id.c_str(), quality.c_str());
            stats->invalid_quality++;
            continue;
        }

        int year, month, day, hour, minute, second;
        if (!parseUtilityTimestamp(cols[1], &year, &month, &day, &hour, &minute, &second))
        {
            warning("(readings) %s:%zu bad timestamp \"%s\"\n", source.c_str(), n+1, cols[1].c_str());
            stats->bad_rows++;
            continue;
        }

        const string &value = meter->is_production ? cols[3] : cols[2];
        Energy energy = 0;
        if (!parseQuantity(value, Unit::KWH, &energy) || energy < 0)
        {
            warning("(readings) %s:%zu bad %s value \"%s\" for meter %s\n", source.c_str(), n+1,
                    meter->is_production ? "production" : "consumption", value.c_str(), meter->external_id.c_str());
            stats->bad_rows++;
            continue;
        }

        vector<time_t> instants;
        localTimeToInstants(year, month, day, hour, minute, second, &instants);
        if (instants.size() == 0)
        {
            warning("(readings) %s:%zu local time %s does not exist (summer time gap), skipping meter %s\n",
                    source.c_str(), n+1, cols[1].c_str(), meter->external_id.c_str());
            stats->nonexistent_times++;
            continue;
        }

        time_t t = instants.front();
        if (instants.size() > 1)
        {
            // The repeated hour when summer time ends. The export lists the
            // hour twice in chronological order, so the second occurrence
            // follows a reading of the same file at or after the first instant.
            // A file that starts inside the repeated hour continues one whose
            // first occurrence is already stored.
            auto prev = previous.find(meter->external_id);
            if ((prev != previous.end() && prev->second >= instants.front()) ||
                (prev == previous.end() && store->contains(meter->external_id, instants.front())))
            {
                t = instants.back();
            }
        }

        IntervalReading r;
        r.meter_id = meter->external_id;
        r.start = t;
        r.energy = energy;
        r.valid = true;

        if (!store->add(r))
        {
            return { LoadResultType::DuplicateReading,
                     tostrprintf("%s:%zu duplicate reading for meter %s at %s",
                                 source.c_str(), n+1, meter->external_id.c_str(), Slot(t).strz().c_str()) };
        }
        previous[meter->external_id] = t;
        stats->loaded++;
    }
    return { LoadResultType::Success, "" };
}

LoadResult loadReadingsFile(const string &file, const Collective &collective,
                            MemoryIntervalStore *store, LoadStats *stats)
{
    vector<string> lines;
    if (loadFile(file, &lines) != 0)
    {
        return { LoadResultType::FileError, "could not read readings file "+file };
    }
    debug("(readings) loading %s (%zu lines)\n", file.c_str(), lines.size());
    return loadReadingsLines(lines, file, collective, store, stats);
}

LoadResult loadReadingsDir(const string &dir, const Collective &collective,
                           MemoryIntervalStore *store, LoadStats *stats)
{
    vector<string> files;
    if (!listFiles(dir, &files))
    {
        return { LoadResultType::FileError, "could not list readings directory "+dir };
    }

    int loaded = 0;
    for (auto &f : files)
    {
        if (!endsWith(f, ".csv") && !endsWith(f, ".CSV")) continue;

        LoadResult r = loadReadingsFile(dir+"/"+f, collective, store, stats);
        if (r.type != LoadResultType::Success) return r;
        loaded++;
    }
    if (loaded == 0)
    {
        warning("(readings) no csv files found in %s\n", dir.c_str());
    }
    verbose("(readings) loaded %d readings from %d files\n", stats->loaded, loaded);
    return { LoadResultType::Success, "" };
}

void logLoadStats(const LoadStats &stats)
{
    if (stats.invalid_quality > 0)
    {
        verbose("(readings) skipped %d readings with invalid quality\n", stats.invalid_quality);
    }
    if (stats.bad_rows > 0)
    {
        warning("(readings) skipped %d bad rows\n", stats.bad_rows);
    }
    if (stats.unknown_meters.size() > 0)
    {
        string ids;
        int n = 0;
        for (auto &id : stats.unknown_meters)
        {
            if (n == 5) break;
            if (ids != "") ids += " ";
            ids += id;
            n++;
        }
        if (stats.unknown_meters.size() > 5)
        {
            ids += tostrprintf(" (and %zu more)", stats.unknown_meters.size()-5);
        }
        warning("(readings) skipped readings of %zu meters not in the collective: %s\n",
                stats.unknown_meters.size(), ids.c_str());
    }
}
