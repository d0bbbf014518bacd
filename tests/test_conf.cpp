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

#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <string>

#include "dmrconf.hxx"

using namespace std;

static const char *confdata =
    "# Comment line\n"
    "\n"
    "friendlyname = Living Room \n"
    "  loglevel=4\n"
    "upnpport = 49000\n"
    "uuid = 11112222-3333\n"
    "this line has no equal sign\n"
    "= no name\n"
    "modelname = first\n"
    "modelname = second\n"
    "manufacturer =\n";

TEST(DmrConfig, Parse)
{
    DmrConfig conf;
    conf.parse(confdata);
    EXPECT_TRUE(conf.ok());
    string value;
    ASSERT_TRUE(conf.get("friendlyname", value));
    EXPECT_EQ("Living Room", value);
    ASSERT_TRUE(conf.get("modelname", value));
    EXPECT_EQ("second", value);
    ASSERT_TRUE(conf.get("manufacturer", value));
    EXPECT_EQ("", value);
    EXPECT_FALSE(conf.get("# Comment line", value));
    EXPECT_FALSE(conf.get("nothere", value));
    EXPECT_EQ(6u, conf.getNames().size());

    int ivalue = 3;
    EXPECT_TRUE(conf.getUint("loglevel", 6, ivalue));
    EXPECT_EQ(4, ivalue);
    EXPECT_FALSE(conf.getUint("friendlyname", 6, ivalue));
    EXPECT_EQ(4, ivalue);
    EXPECT_FALSE(conf.getUint("upnpport", 1024, ivalue));
    EXPECT_EQ(4, ivalue);
}

TEST(DmrConfig, ParseReplaces)
{
    DmrConfig conf;
    conf.parse("a = 1\n");
    conf.parse("b = 2\n");
    string value;
    EXPECT_FALSE(conf.get("a", value));
    EXPECT_TRUE(conf.get("b", value));
}

TEST(DmrConfig, Files)
{
    DmrConfig missing("/nonexistent/updmr.conf");
    EXPECT_FALSE(missing.ok());
    EXPECT_FALSE(missing.reason().empty());

    char tmpl[] = "/tmp/updmrconfXXXXXX";
    int fd = mkstemp(tmpl);
    ASSERT_GE(fd, 0);
    close(fd);
    {
        ofstream out(tmpl);
        out << confdata;
    }
    DmrConfig conf(tmpl);
    unlink(tmpl);
    EXPECT_TRUE(conf.ok());
    string value;
    EXPECT_TRUE(conf.get("uuid", value));
    EXPECT_EQ("11112222-3333", value);
}

TEST(DmrSettings, FromConfig)
{
    DmrConfig conf;
    conf.parse(string(confdata) +
               "upnpiface = eth1\nupnpip = 10.1.1.1\nssdpport = abc\n");
    DmrSettings settings;
    settingsFromConfig(conf, 0, settings);
    EXPECT_EQ("Living Room", settings.friendlyname);
    EXPECT_EQ(4, settings.loglevel);
    EXPECT_EQ(49000, settings.upnpport);
    EXPECT_EQ("eth1", settings.iface);
    // Address only used if no interface is set
    EXPECT_EQ("", settings.upnpip);
    // Malformed: default kept
    EXPECT_EQ(1900, settings.ssdpport);
    EXPECT_EQ("11112222-3333", settings.uuid);
    EXPECT_EQ("second", settings.desc.modelname);
    EXPECT_EQ("stderr", settings.logfilename);
}

TEST(DmrSettings, CommandLineWins)
{
    DmrConfig conf;
    conf.parse(string(confdata) + "upnpip = 10.1.1.1\n");
    DmrSettings settings;
    settings.friendlyname = "Cmdline";
    settings.upnpport = 9999;
    settingsFromConfig(conf, DMRC_FRIENDLYNAME | DMRC_UPNPPORT, settings);
    EXPECT_EQ("Cmdline", settings.friendlyname);
    EXPECT_EQ(9999, settings.upnpport);
    EXPECT_EQ(4, settings.loglevel);
    EXPECT_EQ("10.1.1.1", settings.upnpip);
}

TEST(DmrSettings, FromEnv)
{
    setenv("UPDMR_FRIENDLYNAME", "EnvName", 1);
    setenv("UPDMR_UPNPPORT", "12345", 1);
    setenv("UPDMR_UPNPIFACE", "wlan0", 1);
    setenv("UPDMR_CONFIG", "/etc/other.conf", 1);
    DmrSettings settings;
    settingsFromEnv(settings);
    EXPECT_EQ("EnvName", settings.friendlyname);
    EXPECT_EQ(12345, settings.upnpport);
    EXPECT_EQ("wlan0", settings.iface);
    EXPECT_EQ("/etc/other.conf", settings.configfile);

    setenv("UPDMR_UPNPPORT", "99999", 1);
    DmrSettings other;
    settingsFromEnv(other);
    EXPECT_EQ(8080, other.upnpport);

    unsetenv("UPDMR_FRIENDLYNAME");
    unsetenv("UPDMR_UPNPPORT");
    unsetenv("UPDMR_UPNPIFACE");
    unsetenv("UPDMR_CONFIG");
}
