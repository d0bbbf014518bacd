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

#include "ssdp.hxx"

#include <string.h>
#include <sys/utsname.h>

#include <sstream>

#include "devident.hxx"

using namespace std;

const vector<string> ssdpServiceNames {
    "RenderingControl", "AVTransport", "ConnectionManager"
};

static const string sRootDevice("upnp:rootdevice");

static bool startsWith(const string& s, const char *pfx)
{
    return s.compare(0, strlen(pfx), pfx) == 0;
}

SSDPMsgType ssdpClassify(const string& msg)
{
    if (startsWith(msg, "M-SEARCH")) {
        return SSDP_MSEARCH;
    } else if (startsWith(msg, "NOTIFY")) {
        return SSDP_NOTIFY;
    }
    return SSDP_UNKNOWN;
}

const string& ssdpNTS(SSDPNotifyType nts)
{
    static const string alive("ssdp:alive");
    static const string byebye("ssdp:byebye");
    return nts == SSDP_ALIVE ? alive : byebye;
}

static string makeServerString()
{
    struct utsname unm;
    string os("Linux");
    if (uname(&unm) == 0) {
        os = string(unm.sysname) + "/" + unm.release;
    }
    return os + " UPnP/1.0 updmr/" + UPDMR_PACKAGE_VERSION;
}

const string& ssdpServerString()
{
    static const string server(makeServerString());
    return server;
}

static string notifyMessage(const DeviceIdentity& id, const string& nt,
                            SSDPNotifyType nts, const string& usn)
{
    ostringstream out;
    out << "NOTIFY * HTTP/1.1\r\n" <<
        "HOST: " << SSDP_MCAST_ADDR << ":" << SSDP_MCAST_PORT << "\r\n" <<
        "NT: " << nt << "\r\n" <<
        "NTS: " << ssdpNTS(nts) << "\r\n" <<
        "USN: " << usn << "\r\n" <<
        "LOCATION: " << id.descriptionURL() << "\r\n" <<
        "CACHE-CONTROL: max-age=" << SSDP_NOTIFY_MAXAGE << "\r\n" <<
        "SERVER: " << ssdpServerString() << "\r\n" <<
        "\r\n";
    return out.str();
}

vector<string> ssdpNotifyMessages(const DeviceIdentity& id, SSDPNotifyType nts)
{
    vector<string> msgs;
    const string udn = id.udn();
    msgs.push_back(notifyMessage(id, sRootDevice, nts,
                                 udn + "::" + sRootDevice));
    msgs.push_back(notifyMessage(id, udn, nts, udn));
    for (const auto& svc : ssdpServiceNames) {
        string stp = string("urn:schemas-upnp-org:service:") + svc + ":1";
        msgs.push_back(notifyMessage(id, stp, nts, udn + "::" + stp));
    }
    return msgs;
}

string ssdpSearchReply(const DeviceIdentity& id, const string& date)
{
    ostringstream out;
    out << "HTTP/1.1 200 OK\r\n" <<
        "ST: " << sRootDevice << "\r\n" <<
        "USN: " << id.udn() << "::" << sRootDevice << "\r\n" <<
        "LOCATION: " << id.descriptionURL() << "\r\n" <<
        "OPT: \"http://schemas.upnp.org/upnp/1/0/\"; ns=01\r\n" <<
        "CACHE-CONTROL: max-age=" << SSDP_SEARCH_MAXAGE << "\r\n" <<
        "SERVER: " << ssdpServerString() << "\r\n" <<
        "EXT:\r\n" <<
        "DATE: " << date << "\r\n" <<
        "\r\n";
    return out.str();
}
