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

#ifndef PRINTER_H
#define PRINTER_H

#include"billing.h"
#include"config.h"
#include"pipeline.h"

using namespace std;

string renderBillHR(const Bill &bill);
string renderFieldsHeader(char separator);
string renderBillFields(const Bill &bill, char separator);
string renderBillJson(const Bill &bill);
// One line per month and per excluded period.
string renderReport(const RunReport &report);
// {"months":[...],"excluded":[...]}
string renderReportJson(const RunReport &report);

struct Printer {
    Printer(OutputFormat format,
            char separator,
            bool billfiles, string &billfiles_dir,
            bool use_logfile, string &logfile);

    void print(const Bill &bill);
    // Written after the bills to the same output, report.txt or report.json
    // with bill files. With fields on stdout the report goes to stderr.
    void printReport(const RunReport &report);

    private:

    OutputFormat format_;
    char separator_;
    bool use_billfiles_;
    string billfiles_dir_;
    bool use_logfile_;
    string logfile_;
    bool header_printed_ {};

    void printFiles(const Bill &bill, string &human_readable, string &fields, string &json);
};

#endif
