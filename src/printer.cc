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

#include"printer.h"
#include"util.h"

#include<stdio.h>
#include<string.h>

using namespace std;

static bool isNumericKey(const string &key)
{
    return endsWith(key, "_kwh") ||
        endsWith(key, "_rate") ||
        endsWith(key, "_cost") ||
        endsWith(key, "_revenue") ||
        endsWith(key, "_fees") ||
        key == "net";
}

static string line(const string &label, const string &value, const string &unit)
{
    return "    "+padRight(label, 24)+padLeft(value, 12)+" "+unit+"\n";
}

static string pricedLine(const string &label, Energy e, Rate r, Money m, const string &currency)
{
    string s = "    "+padRight(label, 24)+padLeft(strEnergy(e), 12)+" kWh x "+
        strRate(r)+" "+currency+"/kWh";
    return padRight(s, 64)+padLeft(strMoney(m), 10)+" "+currency+"\n";
}

static string totalLine(const string &label, Money m, const string &currency)
{
    return padRight("    "+label, 64)+padLeft(strMoney(m), 10)+" "+currency+"\n";
}

string renderBillHR(const Bill &b)
{
    const string &cur = b.rates.currency;
    string s;

    s += "Bill "+b.period.label+" ("+b.period.start.str()+" - "+b.period.end.str()+") "+b.fullName();
    if (b.is_host) s += " (host)";
    s += "\n";
    string address = b.street;
    string city = b.zip == "" ? b.city : b.zip+" "+b.city;
    if (city != "") address += (address == "" ? "" : ", ")+city;
    if (address != "") s += "    "+address+"\n";
    s += "\n";

    s += line("consumption", strEnergy(b.totals.consumption), "kWh");
    s += pricedLine("local solar", b.totals.local, b.applied_local_rate, b.local_cost, cur);
    s += pricedLine("grid", b.totals.grid, b.rates.buy, b.grid_cost, cur);
    s += totalLine("total cost", b.total_cost, cur);

    if (b.is_producer)
    {
        s += "\n";
        s += line("production", strEnergy(b.totals.production), "kWh");
        s += line("own consumption", strEnergy(b.totals.self_supply), "kWh");
        s += pricedLine("sold locally", b.totals.local_sold, b.rates.local, b.local_revenue, cur);
        s += pricedLine("exported", b.totals.exported, b.rates.sell, b.export_revenue, cur);
        s += totalLine("total revenue", b.total_revenue, cur);
    }

    if (b.fees.size() > 0)
    {
        s += "\n";
        for (auto &fl : b.fees)
        {
            s += padRight("    "+fl.fee.str(), 64)+padLeft(strMoney(fl.amount), 10)+" "+cur+"\n";
        }
        s += totalLine("total fees", b.total_fees, cur);
    }

    s += "\n";
    if (b.net >= 0)
    {
        s += totalLine("to pay", b.net, cur);
    }
    else
    {
        s += totalLine("to receive", -b.net, cur);
    }

    if (b.days.size() > 0)
    {
        s += "\n    date        consumption       local        grid  production        sold      export        cost     revenue\n";
        for (auto &d : b.days)
        {
            s += "    "+d.date.str()+
                padLeft(strEnergy(d.flows.consumption), 13)+
                padLeft(strEnergy(d.flows.local), 12)+
                padLeft(strEnergy(d.flows.grid), 12)+
                padLeft(strEnergy(d.flows.production), 12)+
                padLeft(strEnergy(d.flows.local_sold), 12)+
                padLeft(strEnergy(d.flows.exported), 12)+
                padLeft(strMoney(d.cost), 12)+
                padLeft(strMoney(d.revenue), 12)+"\n";
        }
    }

    return s;
}

string renderFieldsHeader(char separator)
{
    Bill empty;
    string s;
    for (auto &p : toExportRow(empty))
    {
        if (s != "") s += separator;
        s += p.first;
    }
    return s;
}

string renderBillFields(const Bill &b, char separator)
{
    string s;
    bool first = true;
    for (auto &p : toExportRow(b))
    {
        if (!first) s += separator;
        first = false;
        string v = p.second;
        if (v.find(separator) != string::npos || v.find('"') != string::npos)
        {
            string q = "\"";
            for (char c : v)
            {
                if (c == '"') q += "\"\"";
                else q += c;
            }
            v = q+"\"";
        }
        s += v;
    }
    return s;
}

string renderBillJson(const Bill &b)
{
    string s = "{";
    bool first = true;
    for (auto &p : toExportRow(b))
    {
        if (!first) s += ",";
        first = false;
        s += jsonQuote(p.first)+":";
        if (p.first == "host") s += p.second;
        else if (isNumericKey(p.first)) s += p.second;
        else s += jsonQuote(p.second);
    }
    if (b.fees.size() > 0)
    {
        s += ",\"fees\":[";
        for (size_t i = 0; i < b.fees.size(); ++i)
        {
            const FeeLine &fl = b.fees[i];
            if (i > 0) s += ",";
            s += "{\"name\":"+jsonQuote(fl.fee.name)+
                ",\"type\":\""+toString(fl.fee.type)+"\"";
            if (fl.fee.type == FeeType::PerKwh)
            {
                s += string(",\"basis\":\"")+(fl.fee.on_grid ? "grid" : "local")+"\"";
            }
            s += ",\"amount\":"+strMoney(fl.amount)+"}";
        }
        s += "]";
    }
    if (b.days.size() > 0)
    {
        s += ",\"days\":[";
        for (size_t i = 0; i < b.days.size(); ++i)
        {
            const DailyDetail &d = b.days[i];
            if (i > 0) s += ",";
            s += "{\"date\":\""+d.date.str()+"\""+
                ",\"consumption_kwh\":"+strEnergy(d.flows.consumption)+
                ",\"local_consumption_kwh\":"+strEnergy(d.flows.local)+
                ",\"grid_consumption_kwh\":"+strEnergy(d.flows.grid)+
                ",\"production_kwh\":"+strEnergy(d.flows.production)+
                ",\"local_sell_kwh\":"+strEnergy(d.flows.local_sold)+
                ",\"grid_export_kwh\":"+strEnergy(d.flows.exported)+
                ",\"cost\":"+strMoney(d.cost)+
                ",\"revenue\":"+strMoney(d.revenue)+"}";
        }
        s += "]";
    }
    s += "}";
    return s;
}

string renderReport(const RunReport &r)
{
    string s;
    for (auto &ms : r.months)
    {
        if (ms.billable)
        {
            s += ms.month.str()+" billable\n";
        }
        else
        {
            s += ms.month.str()+" NOT billable: "+ms.reason()+"\n";
        }
    }
    for (auto &ep : r.excluded)
    {
        s += "excluded "+ep.period.label+": "+ep.reason+"\n";
    }
    return s;
}

string renderReportJson(const RunReport &r)
{
    string s = "{\"months\":[";
    for (size_t i = 0; i < r.months.size(); ++i)
    {
        const MonthStatus &ms = r.months[i];
        if (i > 0) s += ",";
        s += "{\"month\":\""+ms.month.str()+"\",\"billable\":"+(ms.billable ? "true" : "false");
        if (!ms.billable) s += ",\"reason\":"+jsonQuote(ms.reason());
        s += "}";
    }
    s += "],\"excluded\":[";
    for (size_t i = 0; i < r.excluded.size(); ++i)
    {
        if (i > 0) s += ",";
        s += "{\"period\":"+jsonQuote(r.excluded[i].period.label)+
            ",\"reason\":"+jsonQuote(r.excluded[i].reason)+"}";
    }
    s += "]}";
    return s;
}

Printer::Printer(OutputFormat format, char separator,
                 bool use_billfiles, string &billfiles_dir,
                 bool use_logfile, string &logfile)
{
    format_ = format;
    separator_ = separator;
    use_billfiles_ = use_billfiles;
    billfiles_dir_ = billfiles_dir;
    // Bills are never written into the syslog.
    use_logfile_ = use_logfile && logfile != "syslog";
    logfile_ = logfile;
}

void Printer::print(const Bill &bill)
{
    string human_readable, fields, json;

    switch (format_)
    {
    case OutputFormat::HR: human_readable = renderBillHR(bill); break;
    case OutputFormat::Fields: fields = renderBillFields(bill, separator_); break;
    case OutputFormat::Json: json = renderBillJson(bill); break;
    }

    printFiles(bill, human_readable, fields, json);
    fflush(stdout);
}

void Printer::printReport(const RunReport &report)
{
    FILE *output = stdout;
    string text = format_ == OutputFormat::Json ? renderReportJson(report)+"\n" : renderReport(report);

    if (use_billfiles_) {
        string filename = billfiles_dir_+"/report."+(format_ == OutputFormat::Json ? "json" : "txt");
        output = fopen(filename.c_str(), "w");
        if (!output) {
            warning("Could not open file \"%s\" for writing!\n", filename.c_str());
            return;
        }
    } else if (use_logfile_) {
        output = fopen(logfile_.c_str(), "a");
        if (!output) {
            warning("Could not open file \"%s\" for writing!\n", logfile_.c_str());
            return;
        }
    } else if (format_ == OutputFormat::Fields) {
        // Stdout only carries csv rows.
        output = stderr;
    }

    fprintf(output, "%s", text.c_str());

    if (output != stdout && output != stderr) {
        fclose(output);
    }
    fflush(stdout);
}

void Printer::printFiles(const Bill &bill, string &human_readable, string &fields, string &json)
{
    FILE *output = stdout;
    bool header = false;

    if (use_billfiles_) {
        const char *suffix = "txt";
        if (format_ == OutputFormat::Fields) suffix = "csv";
        if (format_ == OutputFormat::Json) suffix = "json";
        string filename = billfiles_dir_+"/"+bill.member_id+"_"+bill.period.label+"."+suffix;

        output = fopen(filename.c_str(), "w");
        if (!output) {
            warning("Could not open file \"%s\" for writing!\n", filename.c_str());
            return;
        }
        // Every bill file is a complete csv file.
        header = true;
    } else if (use_logfile_) {
        output = fopen(logfile_.c_str(), "a");
        if (!output) {
            warning("Could not open file \"%s\" for writing!\n", logfile_.c_str());
            return;
        }
        header = !header_printed_;
        header_printed_ = true;
    } else {
        header = !header_printed_;
        header_printed_ = true;
    }

    if (format_ == OutputFormat::Json) {
        fprintf(output, "%s\n", json.c_str());
    }
    else if (format_ == OutputFormat::Fields) {
        if (header) {
            fprintf(output, "%s\n", renderFieldsHeader(separator_).c_str());
        }
        fprintf(output, "%s\n", fields.c_str());
    }
    else {
        fprintf(output, "%s\n", human_readable.c_str());
    }

    if (output != stdout) {
        fclose(output);
    }
}
