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

#include "discovery.hxx"

#include "libupnpp/log.hxx"

#include "shutdown.hxx"
#include "updmrutils.hxx"

using namespace std;

static const char *stateNames[] = {"Created", "Bound", "Running", "Stopped"};

DiscoveryEngine::DiscoveryEngine(const DeviceIdentity& id,
                                 unique_ptr<DatagramSocket> sock,
                                 ShutdownSignal& shutdown,
                                 const DiscoveryOptions& opts)
    : m_id(id), m_sock(std::move(sock)), m_shutdown(shutdown), m_opts(opts)
{
}

DiscoveryEngine::~DiscoveryEngine()
{
    if (m_sock) {
        m_sock->close();
    }
}

bool DiscoveryEngine::open(string& reason)
{
    if (state() != Created) {
        reason = string("open: bad state ") + stateNames[state()];
        return false;
    }
    if (!m_sock) {
        reason = "no socket";
        return false;
    }
    if (!m_sock->open(m_id.hostaddr(), m_opts.port, reason)) {
        LOGERR("DiscoveryEngine::open: " << reason << endl);
        return false;
    }
    m_state = Bound;
    LOGINF("DiscoveryEngine: bound, port " << m_opts.port << " interface " <<
           m_id.hostaddr() << endl);
    return true;
}

int DiscoveryEngine::announce(SSDPNotifyType nts)
{
    int st = state();
    if (st != Bound && st != Running) {
        LOGERR("DiscoveryEngine::announce: bad state " << stateNames[st] <<
               endl);
        return 0;
    }
    UDPPeer group;
    group.host = SSDP_MCAST_ADDR;
    group.port = SSDP_MCAST_PORT;
    vector<string> msgs = ssdpNotifyMessages(m_id, nts);
    int cnt = 0;
    for (const auto& msg : msgs) {
        if (m_sock->sendTo(msg, group)) {
            cnt++;
        } else {
            LOGERR("DiscoveryEngine: failed sending " << ssdpNTS(nts) <<
                   " message " << cnt << endl);
        }
    }
    LOGDEB("DiscoveryEngine: sent " << cnt << "/" << msgs.size() << " " <<
           ssdpNTS(nts) << endl);
    return cnt;
}

int DiscoveryEngine::announcePresence()
{
    return announce(SSDP_ALIVE);
}

int DiscoveryEngine::announceWithdrawal()
{
    return announce(SSDP_BYEBYE);
}

void DiscoveryEngine::keepAlive()
{
    LOGDEB("DiscoveryEngine::keepAlive: interval " << m_opts.alivesecs <<
           " S\n");
    for (;;) {
        announcePresence();
        if (m_shutdown.waitFor(m_opts.alivesecs * 1000)) {
            break;
        }
    }
    LOGDEB("DiscoveryEngine::keepAlive: done\n");
}

bool DiscoveryEngine::handleMessage(const string& msg, const UDPPeer& from)
{
    switch (ssdpClassify(msg)) {
    case SSDP_MSEARCH:
    {
        LOGDEB1("DiscoveryEngine: M-SEARCH from " << from.toString() << endl);
        string reply = ssdpSearchReply(m_id, httpDate());
        if (!m_sock->sendTo(reply, from)) {
            LOGERR("DiscoveryEngine: reply to " << from.toString() <<
                   " failed\n");
            return false;
        }
        return true;
    }
    case SSDP_NOTIFY:
        LOGDEB1("DiscoveryEngine: ignoring NOTIFY from " << from.toString() <<
                endl);
        return false;
    default:
        LOGINF("DiscoveryEngine: unrecognized message from " <<
               from.toString() << ": [" << msg.substr(0, 40) << "]\n");
        return false;
    }
}

void DiscoveryEngine::serve()
{
    if (state() != Bound) {
        LOGERR("DiscoveryEngine::serve: bad state " << stateNames[state()] <<
               endl);
        return;
    }
    m_state = Running;
    LOGDEB("DiscoveryEngine::serve: running\n");
    string data;
    UDPPeer from;
    while (!m_shutdown.stopRequested()) {
        switch (m_sock->receive(m_opts.pollms, data, from)) {
        case DatagramSocket::RecvOk:
            handleMessage(data, from);
            break;
        case DatagramSocket::RecvNone:
            break;
        case DatagramSocket::RecvError:
            // Don't spin on a persistent error
            m_shutdown.waitFor(m_opts.pollms);
            break;
        }
    }
    LOGDEB("DiscoveryEngine::serve: done\n");
}

void DiscoveryEngine::finish()
{
    if (m_finished.exchange(true)) {
        return;
    }
    int st = state();
    if (st == Bound || st == Running) {
        int cnt = announceWithdrawal();
        LOGINF("DiscoveryEngine: withdrawal sent (" << cnt << " messages)\n");
    }
    if (m_sock) {
        m_sock->close();
    }
    m_state = Stopped;
}
