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

#include "supervisor.hxx"

#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "libupnpp/log.hxx"

#include "discovery.hxx"
#include "httpserver.hxx"
#include "shutdown.hxx"

using namespace std;

// Make sure that the byebye messages go out however we leave run()
// once the engine is bound. finish() does nothing the second time.
class WithdrawalGuard {
public:
    WithdrawalGuard(DiscoveryEngine& engine) : m_engine(engine) {}
    ~WithdrawalGuard() {
        m_engine.finish();
    }
private:
    DiscoveryEngine& m_engine;
};

// Stop the control server when leaving scope
class ServerGuard {
public:
    ServerGuard(ControlServer& server) : m_server(server) {}
    ~ServerGuard() {
        m_server.stop();
    }
private:
    ControlServer& m_server;
};

// Loop thread body. A loop returning or throwing before shutdown was
// requested is a fatal condition for the whole process.
void Supervisor::runLoop(const char *name, function<void()> loop)
{
    try {
        loop();
    } catch (const std::exception& e) {
        LOGERR("Supervisor: " << name << ": exception: " << e.what() << endl);
    } catch (...) {
        LOGERR("Supervisor: " << name << ": unknown exception\n");
    }
    if (!m_shutdown.stopRequested()) {
        LOGERR("Supervisor: " << name << " exited, shutting down\n");
        m_shutdown.requestStop();
    }
    LOGDEB("Supervisor: " << name << " done\n");
}

bool Supervisor::run()
{
    string reason;
    if (!m_server.start(reason)) {
        LOGFAT("Supervisor: could not start control server: " << reason <<
               endl);
        return false;
    }
    if (!m_engine.open(reason)) {
        LOGFAT("Supervisor: could not bind discovery socket: " << reason <<
               endl);
        m_server.stop();
        return false;
    }

    // Destroyed in reverse order: the control server is stopped
    // before the withdrawal is sent.
    WithdrawalGuard byeguard(m_engine);
    ServerGuard srvguard(m_server);
    vector<thread> threads;
    bool started = true;

    try {
        threads.push_back(
            thread(&Supervisor::runLoop, this, "discovery receive",
                   [this] () {m_engine.serve();}));
        threads.push_back(
            thread(&Supervisor::runLoop, this, "discovery keepalive",
                   [this] () {m_engine.keepAlive();}));
    } catch (const std::exception& e) {
        LOGFAT("Supervisor: could not start threads: " << e.what() << endl);
        m_shutdown.requestStop();
        started = false;
    }

    LOGINF("Supervisor: running\n");
    while (!m_shutdown.waitFor(m_waitms)) {
        continue;
    }
    LOGINF("Supervisor: shutting down\n");
    for (auto& thr : threads) {
        thr.join();
    }
    return started;
}
