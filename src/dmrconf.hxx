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
#ifndef _DMRCONF_H_X_INCLUDED_
#define _DMRCONF_H_X_INCLUDED_

#include <map>
#include <string>
#include <vector>

#include "httpfs.hxx"

/**
 * Simple configuration file: "name = value" lines. Lines beginning
 * with '#' and blank lines are ignored, white space around names and
 * values is removed. The last value wins if a name is repeated.
 */
class DmrConfig {
public:
    // Empty configuration, always ok
    DmrConfig() {}
    // Read the file. ok() is false if it could not be read.
    explicit DmrConfig(const std::string& fn);

    bool ok() const {
        return m_ok;
    }
    const std::string& reason() const {
        return m_reason;
    }

    // Parse configuration text (replaces current content)
    void parse(const std::string& data);

    bool get(const std::string& name, std::string& value) const;
    /** Get an unsigned value. Returns false if absent or malformed
     *  (with a log message in this case), value is unchanged then. */
    bool getUint(const std::string& name, unsigned long maxval,
                 int& value) const;
    std::vector<std::string> getNames() const;

private:
    bool m_ok{true};
    std::string m_reason;
    std::map<std::string, std::string> m_values;
};

/** Run parameters, resolved from the built-in defaults, environment,
 * configuration file and command line */
struct DmrSettings {
    std::string configfile;
    std::string logfilename{"stderr"};
    int loglevel{3};
    std::string friendlyname{"UpDmr"};
    std::string iface;
    std::string upnpip;
    int upnpport{8080};
    int ssdpport{1900};
    std::string uuid;
    // Description fields (fname and uuid are set later from the above)
    UDevDesc desc;
};

// Values set on the command line, not to be changed by the
// configuration file
enum DmrCmdlineFlags {
    DMRC_LOGFILENAME = 0x1,
    DMRC_LOGLEVEL = 0x2,
    DMRC_FRIENDLYNAME = 0x4,
    DMRC_IFACE = 0x8,
    DMRC_UPNPPORT = 0x10,
};

/** Set the values which can come from the environment:
 *  UPDMR_CONFIG, UPDMR_FRIENDLYNAME, UPDMR_UPNPIFACE, UPDMR_UPNPPORT */
extern void settingsFromEnv(DmrSettings& settings);

/** Set values from the configuration, except those whose flag is set
 *  in cmdline. */
extern void settingsFromConfig(const DmrConfig& conf, unsigned int cmdline,
                               DmrSettings& settings);

#endif /* _DMRCONF_H_X_INCLUDED_ */
