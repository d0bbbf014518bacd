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

#include "ctldispatch.hxx"

#include "libupnpp/log.hxx"

#include "actioncodec.hxx"
#include "extractor.hxx"

using namespace std;

CtlEndpoint endpointFromPath(const string& path)
{
    if (path == "/DeviceSpec") {
        return EP_DEVICESPEC;
    } else if (path == "/AVTransport") {
        return EP_AVTRANSPORT;
    } else if (path == "/RenderingControl") {
        return EP_RENDERINGCONTROL;
    } else if (path == "/Ignore") {
        return EP_IGNORE;
    }
    return EP_NONE;
}

ControlResponse ControlDispatcher::dispatch(const string& method,
                                            const string& path,
                                            const string& body) const
{
    bool isget = method == "GET";
    if (!isget && method != "POST") {
        LOGDEB("ControlDispatcher: method " << method << " not allowed\n");
        return ControlResponse(CTL_HTTP_METHOD_NOT_ALLOWED);
    }
    CtlEndpoint ep = endpointFromPath(path);
    if (ep == EP_NONE) {
        LOGDEB("ControlDispatcher: " << method << " " << path <<
               ": not found\n");
        return ControlResponse(CTL_HTTP_NOT_FOUND);
    }
    return isget ? get(ep) : post(ep, body);
}

ControlResponse ControlDispatcher::get(CtlEndpoint ep) const
{
    switch (ep) {
    case EP_DEVICESPEC:
        return ControlResponse(CTL_HTTP_OK, xmlContentType(),
                               m_docs.description);
    case EP_AVTRANSPORT:
        return ControlResponse(CTL_HTTP_OK, xmlContentType(), m_docs.avtscpd);
    case EP_RENDERINGCONTROL:
        return ControlResponse(CTL_HTTP_OK, xmlContentType(), m_docs.rcscpd);
    default:
        return ControlResponse(CTL_HTTP_OK);
    }
}

ControlResponse ControlDispatcher::post(CtlEndpoint ep, const string& body)
    const
{
    switch (ep) {
    case EP_DEVICESPEC:
        return ControlResponse(CTL_HTTP_METHOD_NOT_ALLOWED);
    case EP_IGNORE:
        return ControlResponse(CTL_HTTP_NO_CONTENT);
    default:
        break;
    }

    BodyHighlights hl = extractHighlights(body);
    if (!hl.empty()) {
        LOGINF("ControlDispatcher: " << hl.toString() << endl);
    }

    if (nullptr == m_handler) {
        return declinedResponse();
    }
    if (ep == EP_AVTRANSPORT) {
        return m_handler->avTransport(ActionCodec::decodeAVTransport(body));
    } else {
        return m_handler->renderingControl(
            ActionCodec::decodeRenderingControl(body));
    }
}
