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
#ifndef _SSDPSOCK_H_X_INCLUDED_
#define _SSDPSOCK_H_X_INCLUDED_

#include <string>

/** UDP peer address */
struct UDPPeer {
    std::string host;
    int port{0};

    std::string toString() const {
        return host + ":" + std::to_string(port);
    }
};

/**
 * Datagram transport used by the discovery engine. The real one is a
 * multicast UDP socket, tests substitute an in-memory one.
 */
class DatagramSocket {
public:
    virtual ~DatagramSocket() {}

    enum RecvStatus {RecvOk, RecvNone, RecvError};

    /**
     * Bind to the wildcard address on port and join the SSDP group on
     * the interface with address ifaddr.
     * @return false with reason set if anything needed failed.
     */
    virtual bool open(const std::string& ifaddr, int port,
                      std::string& reason) = 0;

    /**
     * Wait at most ms milliseconds for a datagram.
     * @return RecvOk if data and from were set, RecvNone if nothing
     *   arrived, RecvError for a socket error.
     */
    virtual RecvStatus receive(int ms, std::string& data, UDPPeer& from) = 0;

    virtual bool sendTo(const std::string& data, const UDPPeer& to) = 0;

    virtual void close() = 0;
};

/** The multicast UDP implementation */
class SSDPSocket : public DatagramSocket {
public:
    SSDPSocket() {}
    virtual ~SSDPSocket();

    virtual bool open(const std::string& ifaddr, int port,
                      std::string& reason);
    virtual RecvStatus receive(int ms, std::string& data,
                               UDPPeer& from);
    virtual bool sendTo(const std::string& data, const UDPPeer& to);
    virtual void close();

private:
    int m_fd{-1};
};

#endif /* _SSDPSOCK_H_X_INCLUDED_ */
