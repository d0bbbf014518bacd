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

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "discovery.hxx"
#include "fakes.hxx"

using namespace std;

static const char *msearch =
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1900\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "MX: 2\r\n"
    "ST: ssdp:all\r\n\r\n";

class DiscoveryTest : public ::testing::Test {
protected:
    DiscoveryTest()
        : sock(new FakeSocket),
          engine(DeviceIdentity("1234", "10.0.0.5", 49152),
                 unique_ptr<DatagramSocket>(sock), shutdown) {
    }

    // Owned by the engine
    FakeSocket *sock;
    ShutdownSignal shutdown;
    DiscoveryEngine engine;
};

TEST_F(DiscoveryTest, OpenBindsOnInterface)
{
    string reason;
    EXPECT_EQ(DiscoveryEngine::Created, engine.state());
    ASSERT_TRUE(engine.open(reason)) << reason;
    EXPECT_EQ(DiscoveryEngine::Bound, engine.state());
    EXPECT_EQ("10.0.0.5", sock->openaddr);
    EXPECT_EQ(1900, sock->openport);
    // Only once
    EXPECT_FALSE(engine.open(reason));
}

TEST_F(DiscoveryTest, OpenFailure)
{
    string reason;
    sock->failopen = true;
    EXPECT_FALSE(engine.open(reason));
    EXPECT_EQ("fake open failure", reason);
    EXPECT_EQ(DiscoveryEngine::Created, engine.state());
    // Never bound: no withdrawal
    engine.finish();
    EXPECT_EQ(0, sock->sendcount);
    EXPECT_EQ(DiscoveryEngine::Stopped, engine.state());
}

TEST_F(DiscoveryTest, AnnounceBeforeOpen)
{
    EXPECT_EQ(0, engine.announcePresence());
    EXPECT_EQ(0, engine.announceWithdrawal());
    EXPECT_EQ(0, sock->sendcount);
}

TEST_F(DiscoveryTest, AnnouncePresence)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    EXPECT_EQ(5, engine.announcePresence());
    EXPECT_EQ(5, engine.announcePresence());
    auto sent = sock->sentCopy();
    ASSERT_EQ(10u, sent.size());
    for (unsigned int i = 0; i < 5; i++) {
        // Same sequence each time
        EXPECT_EQ(sent[i].first, sent[i+5].first);
        EXPECT_EQ("239.255.255.250", sent[i].second.host);
        EXPECT_EQ(1900, sent[i].second.port);
        EXPECT_NE(string::npos, sent[i].first.find("NTS: ssdp:alive\r\n"));
        EXPECT_NE(string::npos, sent[i].first.find(
                      "LOCATION: http://10.0.0.5:49152/DeviceSpec\r\n"));
    }
    EXPECT_NE(string::npos, sent[0].first.find("NT: upnp:rootdevice\r\n"));
    EXPECT_NE(string::npos, sent[1].first.find("NT: uuid:1234\r\n"));
}

TEST_F(DiscoveryTest, PartialSendFailure)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    sock->failsendindex = 2;
    EXPECT_EQ(4, engine.announcePresence());
}

TEST_F(DiscoveryTest, SearchGetsOneReply)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    UDPPeer from;
    from.host = "10.0.0.7";
    from.port = 50123;
    EXPECT_TRUE(engine.handleMessage(msearch, from));
    auto sent = sock->sentCopy();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ("10.0.0.7", sent[0].second.host);
    EXPECT_EQ(50123, sent[0].second.port);
    EXPECT_EQ(0u, sent[0].first.find("HTTP/1.1 200 OK\r\n"));
    EXPECT_NE(string::npos, sent[0].first.find("\r\nDATE: "));
}

TEST_F(DiscoveryTest, OtherMessagesIgnored)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    UDPPeer from;
    from.host = "10.0.0.7";
    from.port = 1900;
    EXPECT_FALSE(engine.handleMessage(
                     "NOTIFY * HTTP/1.1\r\nNTS: ssdp:alive\r\n\r\n", from));
    EXPECT_FALSE(engine.handleMessage("garbage", from));
    EXPECT_FALSE(engine.handleMessage("", from));
    EXPECT_EQ(0, sock->sendcount);
}

TEST_F(DiscoveryTest, ServeUntilStopped)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    sock->queue(msearch, "10.0.0.8", 40000);
    sock->queue("NOTIFY * HTTP/1.1\r\n\r\n", "10.0.0.9", 1900);
    sock->queue(msearch, "10.0.0.9", 40001);
    sock->stopwhenempty = &shutdown;
    engine.serve();
    EXPECT_EQ(DiscoveryEngine::Running, engine.state());
    EXPECT_TRUE(shutdown.stopRequested());
    auto sent = sock->sentCopy();
    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ("10.0.0.8", sent[0].second.host);
    EXPECT_EQ("10.0.0.9", sent[1].second.host);
}

TEST_F(DiscoveryTest, ServeNeedsBound)
{
    engine.serve();
    EXPECT_EQ(DiscoveryEngine::Created, engine.state());
}

TEST_F(DiscoveryTest, KeepAliveAnnouncesFirst)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    shutdown.requestStop();
    engine.keepAlive();
    EXPECT_EQ(5, sock->sentWith("ssdp:alive"));
}

TEST_F(DiscoveryTest, FinishWithdrawsOnce)
{
    string reason;
    ASSERT_TRUE(engine.open(reason));
    engine.finish();
    EXPECT_EQ(DiscoveryEngine::Stopped, engine.state());
    EXPECT_EQ(5, sock->sentWith("NTS: ssdp:byebye\r\n"));
    EXPECT_FALSE(sock->isopen);
    engine.finish();
    EXPECT_EQ(5, sock->sentWith("ssdp:byebye"));
    // Nothing goes out after the withdrawal
    EXPECT_EQ(0, engine.announcePresence());
    EXPECT_EQ(5, sock->sendcount);
}
