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

#include "devident.hxx"

#include <arpa/inet.h>
#include <errno.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include "libupnpp/log.hxx"
#include "libupnpp/upnpplib.hxx"

using namespace std;
using namespace UPnPP;

string DeviceIdentity::udn() const
{
    return string("uuid:") + m_uuid;
}

string DeviceIdentity::descriptionURL() const
{
    return string("http://") + m_hostaddr + ":" +
        to_string(m_httpport) + "/DeviceSpec";
}

static string getHwAddr(const string& ifname)
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        LOGERR("getHwAddr: socket() failed: " << strerror(errno) << endl);
        return string();
    }
    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    string out;
    if (ioctl(fd, SIOCGIFHWADDR, &ifr) == 0) {
        char buf[20];
        const unsigned char *hw = (const unsigned char *)ifr.ifr_hwaddr.sa_data;
        snprintf(buf, sizeof(buf), "%02x%02x%02x%02x%02x%02x",
                 hw[0], hw[1], hw[2], hw[3], hw[4], hw[5]);
        out = buf;
    } else {
        LOGDEB("getHwAddr: SIOCGIFHWADDR failed for " << ifname << ": " <<
               strerror(errno) << endl);
    }
    close(fd);
    return out;
}

bool findNetIf(const string& ifname, const string& ipaddr, NetIfData& out,
               string& reason)
{
    struct ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        reason = string("getifaddrs failed: ") + strerror(errno);
        return false;
    }

    bool found = false;
    for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (nullptr == ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
            continue;
        char buf[INET_ADDRSTRLEN];
        struct sockaddr_in *sin = (struct sockaddr_in *)ifa->ifa_addr;
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr)
            continue;
        if (!ifname.empty()) {
            if (ifname.compare(ifa->ifa_name))
                continue;
        } else if (!ipaddr.empty()) {
            if (ipaddr.compare(buf))
                continue;
        } else {
            if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP))
                continue;
        }
        out.name = ifa->ifa_name;
        out.ipaddr = buf;
        found = true;
        break;
    }
    freeifaddrs(ifaddr);

    if (!found) {
        if (!ifname.empty()) {
            reason = string("no IPv4 address for interface ") + ifname;
        } else if (!ipaddr.empty()) {
            reason = string("no interface has address ") + ipaddr;
        } else {
            reason = "no usable network interface";
        }
        return false;
    }
    out.hwaddr = getHwAddr(out.name);
    LOGDEB("findNetIf: using " << out.name << " " << out.ipaddr << " hw [" <<
           out.hwaddr << "]\n");
    return true;
}

string deviceUUID(const string& configured, const string& friendlyname,
                  const string& hwaddr)
{
    if (!configured.empty()) {
        return configured;
    }
    return LibUPnP::makeDevUUID(friendlyname, hwaddr);
}
