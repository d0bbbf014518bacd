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
#ifndef _SUPERVISOR_H_X_INCLUDED_
#define _SUPERVISOR_H_X_INCLUDED_

#include <functional>

class ControlServer;
class DiscoveryEngine;
class ShutdownSignal;

/**
 * Runs the discovery and control services until shutdown.
 *
 * run() starts the control server, binds the discovery engine, then
 * runs the discovery receive and keep-alive loops on their own
 * threads. It returns after the shutdown signal is raised (by a
 * signal handler, or by a loop which failed), once every loop has
 * exited and the control server was stopped, and the byebye sequence
 * was sent.
 */
class Supervisor {
public:
    Supervisor(DiscoveryEngine& engine, ControlServer& server,
               ShutdownSignal& shutdown)
        : m_engine(engine), m_server(server), m_shutdown(shutdown) {
    }

    /** @return false if startup failed (nothing is left running). */
    bool run();

    // Interval for the main thread checks of the shutdown flag
    void setWaitSlice(int ms) {
        m_waitms = ms;
    }

private:
    void runLoop(const char *name, std::function<void()> loop);

    DiscoveryEngine& m_engine;
    ControlServer& m_server;
    ShutdownSignal& m_shutdown;
    int m_waitms{1000};
};

#endif /* _SUPERVISOR_H_X_INCLUDED_ */
