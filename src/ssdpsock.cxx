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

#include "ssdpsock.hxx"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "libupnpp/log.hxx"

#include "ssdp.hxx"

using namespace std;

#define LOGSYSERR(who, call, spar)                                      \
    LOGERR((who) << ": "  << (call) << "("  << (spar) << ") errno " <<  \
           (errno) << " ("  << (strerror(errno)) << ")\n")

static const int one = 1;

// Biggest datagram we accept. SSDP messages are much smaller.
static const int maxDatagram = 8192;

static string syserr(const char *call)
{
    return string(call) + ": " + strerror(errno);
}

SSDPSocket::~SSDPSocket()
{
    close();
}

void SSDPSocket::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool SSDPSocket::open(const string& ifaddr, int port, string& reason)
{
    close();
    struct in_addr ifin;
    if (inet_pton(AF_INET, ifaddr.c_str(), &ifin) != 1) {
        reason = string("bad interface address: ") + ifaddr;
        return false;
    }

    if ((m_fd = socket(AF_INET, SOCK_DGRAM, 0)) < 0) {
        reason = syserr("socket");
        return false;
    }
    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        reason = syserr("fcntl(O_NONBLOCK)");
        close();
        return false;
    }
    if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
        reason = syserr("setsockopt(SO_REUSEADDR)");
        close();
        return false;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons((unsigned short)port);
    if (bind(m_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        reason = syserr("bind");
        close();
        return false;
    }

    if (setsockopt(m_fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0) {
        reason = syserr("setsockopt(SO_BROADCAST)");
        close();
        return false;
    }

    struct ip_mreq mreq;
    memset(&mreq, 0, sizeof(mreq));
    inet_pton(AF_INET, SSDP_MCAST_ADDR, &mreq.imr_multiaddr);
    mreq.imr_interface = ifin;
    if (setsockopt(m_fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq,
                   sizeof(mreq)) < 0) {
        reason = syserr("setsockopt(IP_ADD_MEMBERSHIP)");
        close();
        return false;
    }

    // Outgoing multicast parameters. Not fatal, the defaults usually work.
    if (setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_IF, &ifin,
                   sizeof(ifin)) < 0) {
        LOGSYSERR("SSDPSocket::open", "setsockopt", "IP_MULTICAST_IF");
    }
    unsigned char ttl = 2;
    if (setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl,
                   sizeof(ttl)) < 0) {
        LOGSYSERR("SSDPSocket::open", "setsockopt", "IP_MULTICAST_TTL");
    }
    LOGDEB("SSDPSocket::open: bound to port " << port << ", joined " <<
           SSDP_MCAST_ADDR << " on " << ifaddr << endl);
    return true;
}

DatagramSocket::RecvStatus SSDPSocket::receive(int ms, string& data,
                                               UDPPeer& from)
{
    if (m_fd < 0) {
        LOGERR("SSDPSocket::receive: socket not open\n");
        return RecvError;
    }
    struct pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, ms);
    if (ret == 0) {
        return RecvNone;
    } else if (ret < 0) {
        if (errno == EINTR)
            return RecvNone;
        LOGSYSERR("SSDPSocket::receive", "poll", "");
        return RecvError;
    }

    char buf[maxDatagram];
    struct sockaddr_in peer;
    socklen_t plen = sizeof(peer);
    ssize_t cnt = recvfrom(m_fd, buf, sizeof(buf), 0,
                           (struct sockaddr *)&peer, &plen);
    if (cnt < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return RecvNone;
        LOGSYSERR("SSDPSocket::receive", "recvfrom", "");
        return RecvError;
    }
    char abuf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &peer.sin_addr, abuf, sizeof(abuf)) == nullptr) {
        LOGSYSERR("SSDPSocket::receive", "inet_ntop", "");
        return RecvError;
    }
    data.assign(buf, cnt);
    from.host = abuf;
    from.port = ntohs(peer.sin_port);
    return RecvOk;
}

bool SSDPSocket::sendTo(const string& data, const UDPPeer& to)
{
    if (m_fd < 0) {
        LOGERR("SSDPSocket::sendTo: socket not open\n");
        return false;
    }
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons((unsigned short)to.port);
    if (inet_pton(AF_INET, to.host.c_str(), &addr.sin_addr) != 1) {
        LOGERR("SSDPSocket::sendTo: bad address " << to.host << endl);
        return false;
    }
    ssize_t cnt = sendto(m_fd, data.c_str(), data.size(), 0,
                         (struct sockaddr *)&addr, sizeof(addr));
    if (cnt < 0 || size_t(cnt) != data.size()) {
        LOGSYSERR("SSDPSocket::sendTo", "sendto", to.toString());
        return false;
    }
    return true;
}
