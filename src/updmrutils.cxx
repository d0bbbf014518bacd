/* Copyright (C) 2024 J.F.Dockes
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */

//
// This file has a number of mostly uninteresting small utility
// functions.

#include "updmrutils.hxx"

#include <ctype.h>
#include <regex.h>
#include <string.h>
#include <time.h>

#include "libupnpp/log.hxx"

using namespace std;

string regsub1(const string& sexp, const string& input, const string& repl)
{
    regex_t expr;
    int err;
    const int ERRSIZE = 200;
    char errbuf[ERRSIZE + 1];
    regmatch_t pmatch[10];

    if ((err = regcomp(&expr, sexp.c_str(), REG_EXTENDED))) {
        regerror(err, &expr, errbuf, ERRSIZE);
        LOGERR("updmr: regsub1: regcomp() failed: " << errbuf << endl);
        return string();
    }

    if ((err = regexec(&expr, input.c_str(), 10, pmatch, 0))) {
        regfree(&expr);
        return input;
    }
    if (pmatch[0].rm_so == -1) {
        // No match
        regfree(&expr);
        return input;
    }
    string out = input.substr(0, pmatch[0].rm_so);
    out += repl;
    out += input.substr(pmatch[0].rm_eo);
    regfree(&expr);
    return out;
}

string regmatch1(const string& sexp, const string& input, int sub)
{
    regex_t expr;
    int err;
    const int ERRSIZE = 200;
    char errbuf[ERRSIZE + 1];
    regmatch_t pmatch[10];

    if (sub < 1 || sub > 9) {
        return string();
    }

    if ((err = regcomp(&expr, sexp.c_str(), REG_EXTENDED))) {
        regerror(err, &expr, errbuf, ERRSIZE);
        LOGERR("updmr: regmatch1: regcomp() failed: " << errbuf << endl);
        return string();
    }
    string out;
    if (regexec(&expr, input.c_str(), 10, pmatch, 0) == 0 &&
        pmatch[sub].rm_so != -1) {
        out = input.substr(pmatch[sub].rm_so,
                           pmatch[sub].rm_eo - pmatch[sub].rm_so);
    }
    regfree(&expr);
    return out;
}

void trimstring(string& s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());

    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length() - 1)
        s.replace(pos + 1, string::npos, string());
}

int stringicmp(const string& s1, const string& s2)
{
    string::size_type i = 0;
    for (; i < s1.size() && i < s2.size(); i++) {
        int c1 = tolower((unsigned char)s1[i]);
        int c2 = tolower((unsigned char)s2[i]);
        if (c1 != c2)
            return c1 < c2 ? -1 : 1;
    }
    if (s1.size() == s2.size())
        return 0;
    return s1.size() < s2.size() ? -1 : 1;
}

bool strToUint(const string& s, unsigned long maxval, unsigned long *value)
{
    if (s.empty() || s.size() > 20) {
        return false;
    }
    unsigned long long val = 0;
    for (string::size_type i = 0; i < s.size(); i++) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
        val = val * 10 + (s[i] - '0');
        if (val > maxval) {
            return false;
        }
    }
    if (value)
        *value = (unsigned long)val;
    return true;
}

string httpDate()
{
    char buf[100];
    time_t now = time(0);
    struct tm tmb;
    gmtime_r(&now, &tmb);
    strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tmb);
    return buf;
}
