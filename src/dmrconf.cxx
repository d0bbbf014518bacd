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

#include "dmrconf.hxx"

#include <stdlib.h>

#include <fstream>
#include <sstream>

#include "libupnpp/log.hxx"

#include "updmrutils.hxx"

using namespace std;

DmrConfig::DmrConfig(const string& fn)
{
    ifstream input(fn.c_str());
    if (!input.is_open()) {
        m_ok = false;
        m_reason = string("could not open ") + fn;
        return;
    }
    stringstream ss;
    ss << input.rdbuf();
    if (input.bad()) {
        m_ok = false;
        m_reason = string("read error for ") + fn;
        return;
    }
    parse(ss.str());
}

void DmrConfig::parse(const string& data)
{
    m_values.clear();
    istringstream input(data);
    string line;
    int lnum = 0;
    while (getline(input, line)) {
        lnum++;
        trimstring(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        string::size_type eq = line.find('=');
        if (eq == string::npos) {
            LOGDEB("DmrConfig: no '=' at line " << lnum << ", ignored\n");
            continue;
        }
        string nm = line.substr(0, eq);
        string value = line.substr(eq + 1);
        trimstring(nm);
        trimstring(value);
        if (nm.empty()) {
            LOGDEB("DmrConfig: empty name at line " << lnum << ", ignored\n");
            continue;
        }
        m_values[nm] = value;
    }
}

bool DmrConfig::get(const string& name, string& value) const
{
    map<string, string>::const_iterator it = m_values.find(name);
    if (it == m_values.end()) {
        return false;
    }
    value = it->second;
    return true;
}

bool DmrConfig::getUint(const string& name, unsigned long maxval,
                        int& value) const
{
    string s;
    if (!get(name, s)) {
        return false;
    }
    unsigned long val;
    if (!strToUint(s, maxval, &val)) {
        LOGERR("Configuration: bad value for " << name << ": [" << s <<
               "], keeping default " << value << endl);
        return false;
    }
    value = int(val);
    return true;
}

vector<string> DmrConfig::getNames() const
{
    vector<string> names;
    for (const auto& ent : m_values) {
        names.push_back(ent.first);
    }
    return names;
}

void settingsFromEnv(DmrSettings& settings)
{
    const char *cp;
    if ((cp = getenv("UPDMR_CONFIG")))
        settings.configfile = cp;
    if ((cp = getenv("UPDMR_FRIENDLYNAME")))
        settings.friendlyname = cp;
    if ((cp = getenv("UPDMR_UPNPIFACE")))
        settings.iface = cp;
    if ((cp = getenv("UPDMR_UPNPPORT"))) {
        unsigned long port;
        if (strToUint(cp, 65535, &port)) {
            settings.upnpport = int(port);
        } else {
            LOGERR("UPDMR_UPNPPORT: bad value [" << cp << "]\n");
        }
    }
}

void settingsFromConfig(const DmrConfig& conf, unsigned int cmdline,
                        DmrSettings& settings)
{
    if (!(cmdline & DMRC_LOGFILENAME))
        conf.get("logfilename", settings.logfilename);
    if (!(cmdline & DMRC_LOGLEVEL))
        conf.getUint("loglevel", 6, settings.loglevel);
    if (!(cmdline & DMRC_FRIENDLYNAME))
        conf.get("friendlyname", settings.friendlyname);
    if (!(cmdline & DMRC_IFACE)) {
        conf.get("upnpiface", settings.iface);
        if (settings.iface.empty()) {
            conf.get("upnpip", settings.upnpip);
        }
    }
    if (!(cmdline & DMRC_UPNPPORT))
        conf.getUint("upnpport", 65535, settings.upnpport);
    conf.getUint("ssdpport", 65535, settings.ssdpport);
    conf.get("uuid", settings.uuid);

    conf.get("manufacturer", settings.desc.manufacturer);
    conf.get("manufacturerurl", settings.desc.manufacturerurl);
    conf.get("modelname", settings.desc.modelname);
    conf.get("modeldescription", settings.desc.modeldescription);
    conf.get("modelurl", settings.desc.modelurl);
    conf.get("serialnumber", settings.desc.serialnumber);
}
