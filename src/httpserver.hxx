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
#ifndef _HTTPSERVER_H_X_INCLUDED_
#define _HTTPSERVER_H_X_INCLUDED_

#include <memory>
#include <string>

class ControlDispatcher;

/** The control transport as seen by the Supervisor */
class ControlServer {
public:
    virtual ~ControlServer() {}
    /** Start listening and serving from an internal thread.
     * @return false with reason set if we could not listen. */
    virtual bool start(std::string& reason) = 0;
    /** Stop serving, returns after the server thread is gone. */
    virtual void stop() = 0;
};

/// HTTP server for the description documents and control requests.
///
/// Uses microhttpd, with its internal select thread. Requests are
/// read completely, then passed to the dispatcher.
class HttpServer : public ControlServer {
public:
    /** @param ipaddr IPv4 address to listen on. All interfaces if empty */
    HttpServer(const std::string& ipaddr, int listenport,
               const ControlDispatcher& dispatcher);
    virtual ~HttpServer();

    virtual bool start(std::string& reason);
    virtual void stop();

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* _HTTPSERVER_H_X_INCLUDED_ */
