/*
 Copyright (C) 2017-2022 Fredrik Öhrström (gpl-3.0-or-later)

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

#include"cmdline.h"
#include"config.h"
#include"pipeline.h"
#include"printer.h"
#include"quality.h"
#include"readings.h"
#include"util.h"
#include"version.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

using namespace std;

int main(int argc, char **argv);
shared_ptr<Printer> create_printer(Configuration *config);
void log_start_information(Configuration *config);
void setup_log_file(Configuration *config);
void load_readings(Configuration *config, MemoryIntervalStore *store);
int check_only(Configuration *config, MemoryIntervalStore *store);
int start(Configuration *config);

// The printer renders the bills to: hr, fields or json.
shared_ptr<Printer> printer_;

const char *short_manual = R"MANUAL(
Usage: vzevcalc [options] --useconfig=<root>

Calculates the bills of a self consumption collective sharing the power of
its solar plant. Reads <root>/etc/vzevcalc.conf (or <root>/vzevcalc.conf),
the member files in the vzevcalc.d directory beside it and the 15 minute
readings of the utility found in the readings directory.

    --billfiles=<dir>   write one file per bill into dir
    --checkonly         only check the completeness of the readings
    --dailydetail       add the flows of every day to the bills
    --debug             for a lot of information
    --format=<hr/fields/json> for human readable, semicolon separated or json output
    --help              list all options
    --interval=<monthly/quarterly/semiannual/annual> override the billing interval
    --logfile=<file>    use this file instead of stderr for logging
    --normal            for normal logging
    --separator=<c>     change field separator to c
    --silent            do not print informational messages nor warnings
    --trace             for tons of information
    --useconfig=<root>  load the configuration from this root directory
    --verbose           for more information
    --version           print the version
)MANUAL";

int main(int argc, char **argv)
{
    tzset(); // Load the current timezone.

    // The bills go to stdout, the log to stderr.
    stderrEnabled(true);
    enableEarlyLoggingFromCommandLine(argc, argv);

    auto cmdline = parseCommandLine(argc, argv);

    if (cmdline->version)
    {
        printf("vzevcalc: " VERSION "\n");
        exit(0);
    }

    if (cmdline->need_help)
    {
        printf("vzevcalc version: " VERSION "\n");
        puts(short_manual);
        exit(0);
    }

    auto config = loadConfiguration(cmdline->config_root, cmdline->overrides);
    config->checkonly = cmdline->checkonly;

    exit(start(config.get()));
}

shared_ptr<Printer> create_printer(Configuration *config)
{
    return shared_ptr<Printer>(new Printer(config->format,
                                           config->separator,
                                           config->billfiles, config->billfiles_dir,
                                           config->use_logfile, config->logfile));
}

void log_start_information(Configuration *config)
{
    verbose("(vzevcalc) version: " VERSION "\n");
    verbose("(config) collective: %s\n", config->name.c_str());
    verbose("(config) time zone: %s\n", calendarTimezone().c_str());
    verbose("(config) period: %s - %s %s\n", config->period_start.str().c_str(),
            config->period_end.str().c_str(), toString(config->interval));
    verbose("(config) rates local %s buy %s sell %s %s/kWh\n",
            strRate(config->rates.local).c_str(),
            strRate(config->rates.buy).c_str(),
            strRate(config->rates.sell).c_str(),
            config->rates.currency.c_str());

    if (config->billfiles) {
        verbose("(config) store bill files in: \"%s\"\n", config->billfiles_dir.c_str());
    }
    verbose("(config) number of members: %zu\n", config->collective.members().size());
    if (isDebugEnabled())
    {
        for (const Meter *m : config->collective.allMeters())
        {
            debug("(config) meter %s member %s\n", m->str().c_str(), m->member_id.c_str());
        }
    }
}

void setup_log_file(Configuration *config)
{
    if (config->use_logfile)
    {
        verbose("(vzevcalc) using log file %s\n", config->logfile.c_str());
        if (config->logfile == "syslog")
        {
            enableSyslog();
            return;
        }
        bool ok = enableLogfile(config->logfile, false);
        if (!ok) {
            error("Could not open log file %s\n", config->logfile.c_str());
        }
    }
    else
    {
        disableLogfile();
    }
}

void load_readings(Configuration *config, MemoryIntervalStore *store)
{
    LoadStats stats;
    LoadResult lr = loadReadingsDir(config->readings_dir, config->collective, store, &stats);
    logLoadStats(stats);

    if (lr.type != LoadResultType::Success)
    {
        error("(readings) %s\n", lr.msg.c_str());
    }
}

int check_only(Configuration *config, MemoryIntervalStore *store)
{
    vector<MonthStatus> statuses;
    if (!checkCollective(config->period_start, config->period_end, config->collective, store, &statuses))
    {
        error("(quality) could not fetch the readings\n");
    }

    int not_billable = 0;
    for (auto &ms : statuses)
    {
        logMonthStatus(ms);
        if (!ms.billable) not_billable++;
    }
    notice("(quality) %zu months checked, %d not billable\n", statuses.size(), not_billable);
    return not_billable == 0 ? 0 : 1;
}

int start(Configuration *config)
{
    // Configure where the logging information should end up.
    // As early as possible to get all logging into the log file.
    setup_log_file(config);

    if (config->addtimestamps == AddLogTimestamps::NotSet)
    {
        // Default is to print timestamps only when using a log file.
        if (config->use_logfile) config->addtimestamps = AddLogTimestamps::Important;
        else config->addtimestamps = AddLogTimestamps::Never;
    }
    setLogTimestamps(config->addtimestamps);

    // Configure settings.
    silentLogging(config->silent);
    verboseEnabled(config->verbose);
    debugEnabled(config->debug);
    traceEnabled(config->trace);

    if (!setCalendarTimezone(config->timezone))
    {
        error("(config) unknown time zone \"%s\"\n", config->timezone.c_str());
    }

    log_start_information(config);

    MemoryIntervalStore store;
    load_readings(config, &store);

    if (config->checkonly)
    {
        return check_only(config, &store);
    }

    RunReport report;
    if (!runBilling(*config, &store, &report))
    {
        error("(pipeline) %s\n", report.error.c_str());
    }

    for (auto &ms : report.months)
    {
        logMonthStatus(ms);
    }
    for (auto &w : report.warnings)
    {
        warning("(quality) %s\n", w.c_str());
    }

    printer_ = create_printer(config);
    for (auto &bill : report.bills)
    {
        printer_->print(bill);
    }
    printer_->printReport(report);

    return 0;
}
