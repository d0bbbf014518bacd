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
#ifndef _RENDERER_H_X_INCLUDED_
#define _RENDERER_H_X_INCLUDED_

#include <string>

#include "actions.hxx"

// HTTP status values used by the control side
enum CtlHttpStatus {
    CTL_HTTP_OK = 200,
    CTL_HTTP_NO_CONTENT = 204,
    CTL_HTTP_NOT_FOUND = 404,
    CTL_HTTP_METHOD_NOT_ALLOWED = 405,
};

// UPnP AV error codes we may return. These are used directly as the
// HTTP status.
enum AVTErrorCode {
    UPNP_AV_AVT_INVALID_INSTANCE_ID = 718,
};

extern const std::string& xmlContentType();

/** What the HTTP server sends back for one request */
class ControlResponse {
public:
    ControlResponse(int st = CTL_HTTP_OK) : status(st) {}
    ControlResponse(int st, const std::string& ct, const std::string& b)
        : status(st), contentType(ct), body(b) {}

    int status;
    // Empty for no Content-Type header
    std::string contentType;
    std::string body;
};

// Response for a request which we understood but do not act on
extern ControlResponse declinedResponse();

// SOAP fault carrying a UPnP error code, the code is also used as
// the HTTP status.
extern ControlResponse upnpErrorResponse(int code);

/**
 * Interface for the code which actually renders. The dispatcher holds
 * a pointer to one of these and calls it with the decoded control
 * requests, either typed actions or parse failures.
 *
 * The default implementations decline everything (405).
 */
class RendererHandler {
public:
    virtual ~RendererHandler() {}
    virtual ControlResponse avTransport(const AVTCall& call);
    virtual ControlResponse renderingControl(const RCCall& call);
};

/**
 * The bundled handler: logs what it receives. It has no renderer
 * behind it, so it rejects instance IDs other than 0 and declines the
 * rest.
 */
class LogRenderer : public RendererHandler {
public:
    virtual ControlResponse avTransport(const AVTCall& call);
    virtual ControlResponse renderingControl(const RCCall& call);
};

#endif /* _RENDERER_H_X_INCLUDED_ */
