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
#ifndef _SSDP_H_X_INCLUDED_
#define _SSDP_H_X_INCLUDED_

#include <string>
#include <vector>

class DeviceIdentity;

// SSDP multicast group and port
#define SSDP_MCAST_ADDR "239.255.255.250"
#define SSDP_MCAST_PORT 1900

// Lifetimes advertised in announcements and in search replies
#define SSDP_NOTIFY_MAXAGE 1800
#define SSDP_SEARCH_MAXAGE 900

// Services we advertise, in announcement order
extern const std::vector<std::string> ssdpServiceNames;

enum SSDPMsgType {SSDP_MSEARCH, SSDP_NOTIFY, SSDP_UNKNOWN};

/** Classify an incoming datagram by its leading token */
extern SSDPMsgType ssdpClassify(const std::string& msg);

enum SSDPNotifyType {SSDP_ALIVE, SSDP_BYEBYE};

/** Value for the NTS header */
extern const std::string& ssdpNTS(SSDPNotifyType nts);

/**
 * Build the NOTIFY messages for one announcement: root device, device
 * UDN, then one per service in ssdpServiceNames order.
 */
extern std::vector<std::string> ssdpNotifyMessages(const DeviceIdentity& id,
                                                   SSDPNotifyType nts);

/**
 * Build the reply to an M-SEARCH request.
 * @param date value for the DATE header, as returned by httpDate().
 */
extern std::string ssdpSearchReply(const DeviceIdentity& id,
                                   const std::string& date);

/** SERVER header value: "os/release UPnP/1.0 updmr/version" */
extern const std::string& ssdpServerString();

#endif /* _SSDP_H_X_INCLUDED_ */
