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
#ifndef _ACTIONCODEC_H_X_INCLUDED_
#define _ACTIONCODEC_H_X_INCLUDED_

#include <string>

#include "actions.hxx"

/**
 * Conversion of SOAP control message bodies into typed actions.
 *
 * The decoding functions never throw. Malformed XML, a missing or
 * out-of-domain argument result in PARSE_ERROR, an action element
 * name which is not part of what we implement for the addressed
 * service results in PARSE_UNKNOWN_ACTION. The reason field is set in
 * both cases.
 */
class ActionCodec {
public:
    enum Service {AVTransport, RenderingControl};

    static AVTCall decodeAVTransport(const std::string& body);
    static RCCall decodeRenderingControl(const std::string& body);

    // "AVTransport" or "RenderingControl"
    static const std::string& serviceName(Service svc);
    // urn:schemas-upnp-org:service:xxx:1
    static const std::string& serviceType(Service svc);
};

#endif /* _ACTIONCODEC_H_X_INCLUDED_ */
