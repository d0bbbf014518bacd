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
#ifndef _FAKES_H_X_INCLUDED_
#define _FAKES_H_X_INCLUDED_

#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "httpserver.hxx"
#include "shutdown.hxx"
#include "ssdpsock.hxx"

// In-memory datagram socket. Incoming datagrams are queued by the
// test, outgoing ones are recorded.
class FakeSocket : public DatagramSocket {
public:
    virtual bool open(const std::string& ifaddr, int port,
                      std::string& reason) {
        std::unique_lock<std::mutex> lock(mutex);
        openaddr = ifaddr;
        openport = port;
        if (failopen) {
            reason = "fake open failure";
            return false;
        }
        isopen = true;
        return true;
    }

    virtual RecvStatus receive(int ms, std::string& data, UDPPeer& from) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (throwonreceive) {
                throw std::runtime_error("fake receive failure");
            }
            if (throwothers) {
                throw 42;
            }
            if (!incoming.empty()) {
                data = incoming.front().first;
                from = incoming.front().second;
                incoming.pop_front();
                return RecvOk;
            }
        }
        if (stopwhenempty) {
            stopwhenempty->requestStop();
        } else {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(ms < 10 ? ms : 10));
        }
        return RecvNone;
    }

    virtual bool sendTo(const std::string& data, const UDPPeer& to) {
        std::unique_lock<std::mutex> lock(mutex);
        int idx = sendcount++;
        if (failsendindex == idx) {
            return false;
        }
        sent.push_back(std::make_pair(data, to));
        return true;
    }

    virtual void close() {
        std::unique_lock<std::mutex> lock(mutex);
        isopen = false;
        closecount++;
    }

    void queue(const std::string& data, const std::string& host, int port) {
        std::unique_lock<std::mutex> lock(mutex);
        UDPPeer peer;
        peer.host = host;
        peer.port = port;
        incoming.push_back(std::make_pair(data, peer));
    }

    // Count the sent messages containing the string
    int sentWith(const std::string& s) {
        std::unique_lock<std::mutex> lock(mutex);
        int cnt = 0;
        for (const auto& ent : sent) {
            if (ent.first.find(s) != std::string::npos)
                cnt++;
        }
        return cnt;
    }

    std::vector<std::pair<std::string, UDPPeer> > sentCopy() {
        std::unique_lock<std::mutex> lock(mutex);
        return sent;
    }

    std::mutex mutex;
    std::deque<std::pair<std::string, UDPPeer> > incoming;
    std::vector<std::pair<std::string, UDPPeer> > sent;
    std::string openaddr;
    int openport{0};
    bool failopen{false};
    bool throwonreceive{false};
    // Throw something which is not a std::exception
    bool throwothers{false};
    bool isopen{false};
    int closecount{0};
    int sendcount{0};
    // Index (in send order) of a send which should fail, or -1
    int failsendindex{-1};
    // If set, request stop on this when the incoming queue is empty
    ShutdownSignal *stopwhenempty{nullptr};
};

// Control server which does nothing but record calls. If a socket is
// set, the count of byebye messages it sent is recorded when stop()
// is called.
class FakeControlServer : public ControlServer {
public:
    virtual bool start(std::string& reason) {
        started++;
        if (failstart) {
            reason = "fake start failure";
            return false;
        }
        return true;
    }
    virtual void stop() {
        stopped++;
        if (sock) {
            byebyesatstop = sock->sentWith("ssdp:byebye");
        }
    }

    bool failstart{false};
    int started{0};
    int stopped{0};
    FakeSocket *sock{nullptr};
    int byebyesatstop{-1};
};

#endif /* _FAKES_H_X_INCLUDED_ */
