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
#ifndef _SHUTDOWN_H_X_INCLUDED_
#define _SHUTDOWN_H_X_INCLUDED_

#include <atomic>
#include <condition_variable>
#include <mutex>

/**
 * The single stop trigger shared by the service loops.
 *
 * requestStopFromSignal() only stores the flag and may be called from
 * a signal handler. Waiters see it at their next wake-up, waitFor()
 * never sleeps more than a short slice without checking.
 */
class ShutdownSignal {
public:
    void requestStop();
    void requestStopFromSignal();
    bool stopRequested() const {
        return m_stop.load();
    }

    /** Wait until stop is requested or ms milliseconds have elapsed.
     * @return true if stop was requested. */
    bool waitFor(int ms);

private:
    std::atomic<bool> m_stop{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

#endif /* _SHUTDOWN_H_X_INCLUDED_ */
