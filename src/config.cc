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

#include"config.h"
#include"units.h"

#include<vector>
#include<string>
#include<string.h>

using namespace std;

pair<string,string> getNextKeyValue(vector<char> &buf, vector<char>::iterator &i)
{
    bool eof, err;
    string key, value;
    // Skip empty lines.
    while (i != buf.end() && (*i == '\n' || *i == '\r' || *i == ' ' || *i == '\t')) i++;
    if (i == buf.end()) return { "", "" };
    if (*i == '#')
    {
        string comment = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
        return { comment, "" };
    }
    key = eatToSkipWhitespace(buf, i, '=', 4096, &eof, &err);
    if (eof || err) goto nomore;
    value = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
    if (err) goto nomore;

    return { key, value };

    nomore:

    return { "", "" };
}

static string memberIdFromFile(const string &file)
{
    size_t p = file.rfind('/');
    if (p == string::npos) return file;
    return file.substr(p+1);
}

static bool parseBool(const string &s, bool *b)
{
    if (s == "true" || s == "yes") { *b = true; return true; }
    if (s == "false" || s == "no") { *b = false; return true; }
    return false;
}

void parseMemberConfig(Configuration *c, vector<char> &buf, string file)
{
    auto i = buf.begin();
    Member m;
    m.id = memberIdFromFile(file);

    debug("(config) loading member file %s\n", file.c_str());

    for (;;)
    {
        pair<string,string> p = getNextKeyValue(buf, i);

        if (p.first == "") break;

        // If the key starts with # then the line is a comment. Ignore it.
        if (p.first.length() > 0 && p.first[0] == '#') continue;

        debug("(config) %s=%s\n", p.first.c_str(), p.second.c_str());

        if (p.first == "firstname") m.first_name = p.second;
        else
        if (p.first == "lastname") m.last_name = p.second;
        else
        if (p.first == "street") m.street = p.second;
        else
        if (p.first == "zip") m.zip = p.second;
        else
        if (p.first == "city") m.city = p.second;
        else
        if (p.first == "canton") m.canton = p.second;
        else
        if (p.first == "host")
        {
            if (!parseBool(p.second, &m.is_host))
            {
                c->problems.push_back("member "+m.id+": host must be true or false, not \""+p.second+"\"");
            }
        }
        else
        if (p.first == "meter")
        {
            Meter meter;
            if (!parseMeterLine(p.second, &meter))
            {
                c->problems.push_back("member "+m.id+": bad meter \""+p.second+"\" expected <kind>:<id>:<name> where kind is one of: "+
                                      availableMeterKinds());
                continue;
            }
            m.meters.push_back(meter);
        }
        else
        if (p.first == "fee")
        {
            Fee fee;
            if (!parseFeeLine(p.second, &fee))
            {
                c->problems.push_back("member "+m.id+": bad fee \""+p.second+"\" expected <type>:<value>:<basis>:<name> where type is one of: "+
                                      availableFeeTypes());
                continue;
            }
            m.fees.push_back(fee);
        }
        else
        {
            warning("Found invalid key \"%s\" in member config file %s\n", p.first.c_str(), file.c_str());
        }
    }

    if (m.meters.size() == 0)
    {
        warning("(config) member %s has no meters\n", m.id.c_str());
    }
    c->collective.addMember(m);
}

void handleLoglevel(Configuration *c, string loglevel)
{
    if (loglevel == "verbose")
    {
        c->silent = false;
        c->verbose = true;
        c->debug = false;
        c->trace = false;
        verboseEnabled(c->verbose);
    }
    else if (loglevel == "debug")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = true;
        c->trace = false;
        // Kick in debug immediately.
        debugEnabled(c->debug);
    }
    else if (loglevel == "trace")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = false;
        c->trace = true;
        // Kick in trace immediately.
        traceEnabled(c->trace);
    }
    else if (loglevel == "silent")
    {
        c->silent = true;
        c->verbose = false;
        c->debug = false;
        c->trace = false;
    }
    else if (loglevel == "normal")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = false;
        c->trace = false;
    }
    else
    {
        warning("No such log level: \"%s\"\n", loglevel.c_str());
    }
}

void handleLogfile(Configuration *c, string logfile)
{
    if (logfile.length() > 0)
    {
        c->use_logfile = true;
        c->logfile = logfile;
    }
}

void handleFormat(Configuration *c, string format)
{
    if (format == "hr")
    {
        c->format = OutputFormat::HR;
    }
    else if (format == "json")
    {
        c->format = OutputFormat::Json;
    }
    else if (format == "fields")
    {
        c->format = OutputFormat::Fields;
    }
    else
    {
        c->problems.push_back("unknown output format \""+format+"\" expected one of: hr fields json");
    }
}

void handleSeparator(Configuration *c, string s)
{
    if (s.length() == 1) {
        c->separator = s[0];
    } else {
        c->problems.push_back("separator must be a single character");
    }
}

void handleLogTimestamps(Configuration *c, string ts)
{
    if (ts == "never")
    {
        c->addtimestamps = AddLogTimestamps::Never;
    }
    else if (ts == "always")
    {
        c->addtimestamps = AddLogTimestamps::Always;
    }
    else if (ts == "important")
    {
        c->addtimestamps = AddLogTimestamps::Important;
    }
    else
    {
        warning("(warning) No such timestamp setting \"%s\" possible values are: never always important\n",
                ts.c_str());
    }
}

static void handlePeriodDate(Configuration *c, string key, string s, Date *d)
{
    if (!d->parse(s))
    {
        c->problems.push_back(key+" \""+s+"\" is not a date, expected YYYY-MM-DD or YYYY-MM");
        return;
    }
    if (d->day != 1)
    {
        c->problems.push_back(key+" "+d->str()+" must be the first day of a month");
    }
}

void handleInterval(Configuration *c, string s)
{
    BillingInterval bi = toBillingInterval(s);
    if (bi == BillingInterval::Unknown)
    {
        c->problems.push_back("unknown billing interval \""+s+"\" expected one of: "+availableBillingIntervals());
        return;
    }
    c->interval = bi;
}

static void handleRate(Configuration *c, string key, string s, Rate *r)
{
    if (!parseQuantityWithUnit(s, Quantity::Rate, r))
    {
        c->problems.push_back(key+" \""+s+"\" is not a valid rate, known units are: "+availableUnits());
        return;
    }
    if (*r < 0)
    {
        c->problems.push_back(key+" "+s+" must not be negative");
    }
}

static void handleBillfiles(Configuration *c, string dir)
{
    if (dir.length() == 0) return;
    c->billfiles = true;
    c->billfiles_dir = dir;
}

static void handleDailyDetail(Configuration *c, string s)
{
    if (!parseBool(s, &c->daily_detail))
    {
        c->problems.push_back("dailydetail must be true or false, not \""+s+"\"");
    }
}

void parseMainConfig(Configuration *c, vector<char> &buf, string file)
{
    auto i = buf.begin();

    for (;;) {
        auto p = getNextKeyValue(buf, i);

        debug("(config) \"%s\" \"%s\"\n", p.first.c_str(), p.second.c_str());
        if (p.first == "") break;
        // If the key starts with # then the line is a comment. Ignore it.
        if (p.first.length() > 0 && p.first[0] == '#') continue;
        if (p.first == "name") c->name = p.second;
        else if (p.first == "loglevel") handleLoglevel(c, p.second);
        else if (p.first == "logfile") handleLogfile(c, p.second);
        else if (p.first == "logtimestamps") handleLogTimestamps(c, p.second);
        else if (p.first == "timezone") c->timezone = p.second;
        else if (p.first == "periodstart") handlePeriodDate(c, "periodstart", p.second, &c->period_start);
        else if (p.first == "periodend") handlePeriodDate(c, "periodend", p.second, &c->period_end);
        else if (p.first == "interval") handleInterval(c, p.second);
        else if (p.first == "localrate") handleRate(c, "localrate", p.second, &c->rates.local);
        else if (p.first == "buyrate") handleRate(c, "buyrate", p.second, &c->rates.buy);
        else if (p.first == "sellrate") handleRate(c, "sellrate", p.second, &c->rates.sell);
        else if (p.first == "currency") c->rates.currency = p.second;
        else if (p.first == "readings") c->readings_dir = p.second;
        else if (p.first == "format") handleFormat(c, p.second);
        else if (p.first == "separator") handleSeparator(c, p.second);
        else if (p.first == "billfiles") handleBillfiles(c, p.second);
        else if (p.first == "dailydetail") handleDailyDetail(c, p.second);
        else
        {
            warning("No such key: %s in %s\n", p.first.c_str(), file.c_str());
        }
    }
}

void applyOverrides(Configuration *c, const ConfigOverrides &overrides)
{
    if (overrides.loglevel_override != "")
    {
        debug("(config) overriding loglevel with %s\n", overrides.loglevel_override.c_str());
        handleLoglevel(c, overrides.loglevel_override);
    }

    if (overrides.logfile_override != "")
    {
        debug("(config) overriding logfile with %s\n", overrides.logfile_override.c_str());
        handleLogfile(c, overrides.logfile_override);
    }

    if (overrides.format_override != "")
    {
        debug("(config) overriding format with %s\n", overrides.format_override.c_str());
        handleFormat(c, overrides.format_override);
    }

    if (overrides.separator_override != "")
    {
        debug("(config) overriding separator with %s\n", overrides.separator_override.c_str());
        handleSeparator(c, overrides.separator_override);
    }

    if (overrides.interval_override != "")
    {
        debug("(config) overriding interval with %s\n", overrides.interval_override.c_str());
        handleInterval(c, overrides.interval_override);
    }

    if (overrides.billfiles_override != "")
    {
        debug("(config) overriding billfiles with %s\n", overrides.billfiles_override.c_str());
        handleBillfiles(c, overrides.billfiles_override);
    }

    if (overrides.dailydetail_override)
    {
        debug("(config) overriding dailydetail with true\n");
        c->daily_detail = true;
    }
}

bool checkConfiguration(Configuration *c, vector<string> *problems)
{
    size_t before = problems->size();
    problems->insert(problems->end(), c->problems.begin(), c->problems.end());

    if (!c->period_start.isValid())
    {
        problems->push_back("periodstart is missing");
    }
    if (!c->period_end.isValid())
    {
        problems->push_back("periodend is missing");
    }
    if (c->period_start.isValid() && c->period_end.isValid() && !(c->period_start < c->period_end))
    {
        problems->push_back("periodstart "+c->period_start.str()+" must be before periodend "+c->period_end.str());
    }

    c->collective.validate(problems);

    if (c->rates.local == 0)
    {
        warning("(config) the local rate is zero, the local solar power is given away for free\n");
    }
    if (c->rates.buy == 0)
    {
        warning("(config) the buy rate is zero\n");
    }

    return problems->size() == before;
}

shared_ptr<Configuration> loadConfiguration(string root, ConfigOverrides overrides)
{
    Configuration *c = new Configuration;

    c->useconfig = true;
    c->config_root = root;

    vector<char> global_conf;

    // --useconfig=/ will work to find /etc/vzevcalc.conf and /etc/vzevcalc.d
    // If there is no root/etc/vzevcalc.conf then it will look for root/vzevcalc.conf

    string conf_file = root+"/etc/vzevcalc.conf";
    string conf_member_dir = root+"/etc/vzevcalc.d";

    if (!checkFileExists(conf_file.c_str()))
    {
        conf_file = root+"/vzevcalc.conf";
        conf_member_dir = root+"/vzevcalc.d";
    }

    debug("(config) loading %s\n", conf_file.c_str());
    bool ok = loadFile(conf_file, &global_conf);
    global_conf.push_back('\n');

    if (!ok)
    {
        error("Could not load configuration file %s\n", conf_file.c_str());
    }

    parseMainConfig(c, global_conf, conf_file);

    vector<string> members;
    if (!listFiles(conf_member_dir, &members))
    {
        error("Could not list the member directory %s\n", conf_member_dir.c_str());
    }

    for (auto& f : members)
    {
        vector<char> member_conf;
        string file = conf_member_dir+"/"+f;
        if (!loadFile(file.c_str(), &member_conf))
        {
            error("Could not load member file %s\n", file.c_str());
        }
        member_conf.push_back('\n');
        parseMemberConfig(c, member_conf, file);
    }

    if (c->readings_dir.length() > 0 && c->readings_dir[0] != '/')
    {
        c->readings_dir = (root == "" ? string(".") : root)+"/"+c->readings_dir;
    }

    applyOverrides(c, overrides);

    vector<string> problems;
    if (!checkConfiguration(c, &problems))
    {
        for (auto &p : problems)
        {
            warning("(config) %s\n", p.c_str());
        }
        error("Configuration %s cannot be used, %zu problem(s) found.\n", conf_file.c_str(), problems.size());
    }

    return shared_ptr<Configuration>(c);
}
