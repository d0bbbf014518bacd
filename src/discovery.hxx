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
#ifndef _DISCOVERY_H_X_INCLUDED_
#define _DISCOVERY_H_X_INCLUDED_

#include <atomic>
#include <memory>
#include <string>

#include "devident.hxx"
#include "ssdp.hxx"
#include "ssdpsock.hxx"

class ShutdownSignal;

/** Timing and port parameters for the discovery engine */
class DiscoveryOptions {
public:
    DiscoveryOptions() {}
    // Local port we bind. Announcements always go to the SSDP group
    // port.
    int port{1900};
    // Interval between alive announcements, below the advertised
    // max-age.
    int alivesecs{1200};
    // Receive loop wake-up interval for checking the stop flag
    int pollms{500};
};

/**
 * SSDP announcer and search responder.
 *
 * open() moves the engine from Created to Bound. serve() runs the
 * receive loop (Running) until the shutdown signal is raised.
 * keepAlive() runs the periodic announcements in parallel with
 * serve(). finish() sends the byebye sequence once and closes the
 * socket (Stopped).
 */
class DiscoveryEngine {
public:
    enum State {Created, Bound, Running, Stopped};

    DiscoveryEngine(const DeviceIdentity& id,
                    std::unique_ptr<DatagramSocket> sock,
                    ShutdownSignal& shutdown,
                    const DiscoveryOptions& opts = DiscoveryOptions());
    ~DiscoveryEngine();

    /** Bind and join the multicast group. Failure is fatal for the
     * caller, we do not retry. */
    bool open(std::string& reason);

    /** Send the alive/byebye sequence to the multicast group.
     * @return the count of messages actually sent. */
    int announcePresence();
    int announceWithdrawal();

    /** Announce now, then every alivesecs until shutdown */
    void keepAlive();

    /** Receive loop, returns when shutdown is requested */
    void serve();

    /** Process one datagram. @return true if a reply was sent. */
    bool handleMessage(const std::string& msg, const UDPPeer& from);

    /** Withdraw (only the first time, and only if we were bound) and
     * close the socket. */
    void finish();

    State state() const {
        return State(m_state.load());
    }
    const DeviceIdentity& identity() const {
        return m_id;
    }

private:
    int announce(SSDPNotifyType nts);

    const DeviceIdentity m_id;
    std::unique_ptr<DatagramSocket> m_sock;
    ShutdownSignal& m_shutdown;
    DiscoveryOptions m_opts;
    std::atomic<int> m_state{Created};
    std::atomic<bool> m_finished{false};
};

#endif /* _DISCOVERY_H_X_INCLUDED_ */
