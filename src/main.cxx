/* Copyright (C) 2015 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; either version 2 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
/////////////////////////////////////////////////////////////////////
// Main program

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <iostream>
#include <memory>
#include <string>

#include "libupnpp/log.hxx"
#include "libupnpp/upnpplib.hxx"

#include "ctldispatch.hxx"
#include "devident.hxx"
#include "discovery.hxx"
#include "dmrconf.hxx"
#include "httpfs.hxx"
#include "httpserver.hxx"
#include "renderer.hxx"
#include "shutdown.hxx"
#include "ssdpsock.hxx"
#include "supervisor.hxx"
#include "updmrutils.hxx"

using namespace std;
using namespace UPnPP;

static char *thisprog;

static const char usage[] =
    "-c configfile \t configuration file to use\n"
    "-d logfilename\t debug messages to\n"
    "-l loglevel\t  log level (0-6)\n"
    "-f friendlyname\t define device displayed name\n"
    "-i iface    \t specify network interface name to be used for UPnP\n"
    "-P upport    \t specify port number to be used for UPnP HTTP\n"
    "-v      \tprint version info\n"
    "\n"
    ;

static void
versionInfo(FILE *fp)
{
    fprintf(fp, "Updmr %s %s\n",
           UPDMR_PACKAGE_VERSION, LibUPnP::versionString().c_str());
}

static void
Usage(FILE *fp = stderr)
{
    fprintf(fp, "%s: usage:\n%s", thisprog, usage);
    versionInfo(fp);
    exit(1);
}

// Static for access from the signal handler.
static ShutdownSignal g_shutdown;

static void onsig(int)
{
    g_shutdown.requestStopFromSignal();
}

static const int catchedSigs[] = {SIGINT, SIGQUIT, SIGTERM};
static void setupsigs()
{
    struct sigaction action;
    action.sa_handler = onsig;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (unsigned int i = 0; i < sizeof(catchedSigs) / sizeof(int); i++)
        if (signal(catchedSigs[i], SIG_IGN) != SIG_IGN) {
            if (sigaction(catchedSigs[i], &action, 0) < 0) {
                perror("Sigaction failed");
            }
        }
}

static int portArg(const char *cp)
{
    unsigned long port;
    if (!strToUint(cp, 65535, &port)) {
        Usage();
    }
    return int(port);
}

int main(int argc, char *argv[])
{
    DmrSettings settings;
    settingsFromEnv(settings);

    unsigned int cmdline = 0;
    thisprog = argv[0];
    argc--; argv++;
    while (argc > 0 && **argv == '-') {
        (*argv)++;
        if (!(**argv))
            Usage();
        while (**argv)
            switch (*(*argv)++) {
            case 'c':   if (argc < 2)  Usage();
                settings.configfile = *(++argv); argc--; goto b1;
            case 'd':   if (argc < 2)  Usage();
                settings.logfilename = *(++argv); argc--;
                cmdline |= DMRC_LOGFILENAME; goto b1;
            case 'f':   if (argc < 2)  Usage();
                settings.friendlyname = *(++argv); argc--;
                cmdline |= DMRC_FRIENDLYNAME; goto b1;
            case 'i':   if (argc < 2)  Usage();
                settings.iface = *(++argv); argc--;
                cmdline |= DMRC_IFACE; goto b1;
            case 'l':   if (argc < 2)  Usage();
                settings.loglevel = atoi(*(++argv)); argc--;
                cmdline |= DMRC_LOGLEVEL; goto b1;
            case 'P':   if (argc < 2)  Usage();
                settings.upnpport = portArg(*(++argv)); argc--;
                cmdline |= DMRC_UPNPPORT; goto b1;
            case 'v': versionInfo(stdout); exit(0); break;
            default: Usage();   break;
            }
    b1: argc--; argv++;
    }

    if (argc != 0) {
        Usage();
    }

    if (!settings.configfile.empty()) {
        DmrConfig config(settings.configfile);
        if (!config.ok()) {
            cerr << "Could not open config: " << settings.configfile << ": "
                 << config.reason() << endl;
            return 1;
        }
        settingsFromConfig(config, cmdline, settings);
    }

    if (Logger::getTheLog(settings.logfilename) == 0) {
        cerr << "Can't initialize log" << endl;
        return 1;
    }
    Logger::getTheLog("")->reopen(settings.logfilename);
    Logger::getTheLog("")->setLogLevel(Logger::LogLevel(settings.loglevel));

    // Network interface and device identity
    NetIfData netif;
    string reason;
    if (!findNetIf(settings.iface, settings.upnpip, netif, reason)) {
        LOGFAT("Can't find a network address: " << reason << endl);
        return 1;
    }
    string uuid = deviceUUID(settings.uuid, settings.friendlyname,
                             netif.hwaddr);
    DeviceIdentity identity(uuid, netif.ipaddr, settings.upnpport);
    LOGINF("updmr: " << settings.friendlyname << " " << identity.udn() <<
           " at " << identity.descriptionURL() << endl);

    // The data we serve through HTTP (device and service descriptions)
    UDevDesc desc = settings.desc;
    desc.fname = settings.friendlyname;
    desc.uuid = uuid;
    DeviceDocs docs = initHttpFs(desc);

    LogRenderer renderer;
    ControlDispatcher dispatcher(docs, &renderer);
    HttpServer httpserver(netif.ipaddr, settings.upnpport, dispatcher);

    DiscoveryOptions dopts;
    dopts.port = settings.ssdpport;
    DiscoveryEngine engine(identity,
                           unique_ptr<DatagramSocket>(new SSDPSocket),
                           g_shutdown, dopts);

    setupsigs();
    Supervisor supervisor(engine, httpserver, g_shutdown);
    if (!supervisor.run()) {
        LOGFAT("updmr: startup failed\n");
        return 1;
    }
    LOGDEB("updmr: exiting\n");
    return 0;
}
