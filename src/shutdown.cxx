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

#include "shutdown.hxx"

#include <chrono>

using namespace std;

// Max sleep between checks of the flag, for signal handler stops
static const int sliceMs = 200;

void ShutdownSignal::requestStop()
{
    {
        unique_lock<mutex> lock(m_mutex);
        m_stop.store(true);
    }
    m_cv.notify_all();
}

void ShutdownSignal::requestStopFromSignal()
{
    m_stop.store(true);
}

bool ShutdownSignal::waitFor(int ms)
{
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(ms);
    unique_lock<mutex> lock(m_mutex);
    while (!m_stop.load()) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto slice = chrono::milliseconds(sliceMs);
        auto wakeup = now + slice < deadline ? now + slice : deadline;
        m_cv.wait_until(lock, wakeup);
    }
    return m_stop.load();
}
