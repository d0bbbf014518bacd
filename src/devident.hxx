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
#ifndef _DEVIDENT_H_X_INCLUDED_
#define _DEVIDENT_H_X_INCLUDED_

#include <string>

/** What the network sees of the device: UUID, address and HTTP
 * port. Built once at startup, never changed afterwards. */
class DeviceIdentity {
public:
    DeviceIdentity(const std::string& uuid, const std::string& hostaddr,
                   int httpport)
        : m_uuid(uuid), m_hostaddr(hostaddr), m_httpport(httpport) {
    }

    // Bare UUID, no "uuid:" prefix
    const std::string& uuid() const {
        return m_uuid;
    }
    const std::string& hostaddr() const {
        return m_hostaddr;
    }
    int httpport() const {
        return m_httpport;
    }
    // "uuid:" + uuid
    std::string udn() const;
    // http://host:port/DeviceSpec
    std::string descriptionURL() const;

private:
    const std::string m_uuid;
    const std::string m_hostaddr;
    const int m_httpport;
};

/** Network interface chosen for the device */
struct NetIfData {
    std::string name;
    // Dotted IPv4 address
    std::string ipaddr;
    // Hardware address as 12 lowercase hex digits, possibly empty
    std::string hwaddr;
};

/**
 * Choose the interface and address.
 *
 * If ifname is set, use its first IPv4 address, else if ipaddr is set,
 * find the interface which has it, else use the first interface which
 * is up, not loopback, and has an IPv4 address.
 *
 * @return false if nothing suitable was found, with reason set.
 */
extern bool findNetIf(const std::string& ifname, const std::string& ipaddr,
                      NetIfData& out, std::string& reason);

/** Return the configured UUID if not empty, else derive one from the
 *  friendly name and hardware address. */
extern std::string deviceUUID(const std::string& configured,
                              const std::string& friendlyname,
                              const std::string& hwaddr);

#endif /* _DEVIDENT_H_X_INCLUDED_ */
