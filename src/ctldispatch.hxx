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
#ifndef _CTLDISPATCH_H_X_INCLUDED_
#define _CTLDISPATCH_H_X_INCLUDED_

#include <string>

#include "httpfs.hxx"
#include "renderer.hxx"

/** The resources we serve */
enum CtlEndpoint {
    EP_DEVICESPEC, EP_AVTRANSPORT, EP_RENDERINGCONTROL, EP_IGNORE, EP_NONE
};

/** Exact path match. Returns EP_NONE for anything we don't serve. */
extern CtlEndpoint endpointFromPath(const std::string& path);

/**
 * Routing of control transport requests. This is independent of the
 * HTTP server implementation: dispatch() is called with the method,
 * path and complete body, and returns what should be sent back.
 *
 * The documents and the handler must outlive the dispatcher. The
 * handler may be called from several server threads at once.
 */
class ControlDispatcher {
public:
    ControlDispatcher(const DeviceDocs& docs, RendererHandler *handler)
        : m_docs(docs), m_handler(handler) {
    }

    ControlResponse dispatch(const std::string& method,
                             const std::string& path,
                             const std::string& body) const;

private:
    ControlResponse get(CtlEndpoint ep) const;
    ControlResponse post(CtlEndpoint ep, const std::string& body) const;

    const DeviceDocs& m_docs;
    RendererHandler *m_handler;
};

#endif /* _CTLDISPATCH_H_X_INCLUDED_ */
