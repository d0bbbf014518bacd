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
#ifndef _SOAPPARSE_H_X_INCLUDED_
#define _SOAPPARSE_H_X_INCLUDED_

#include <map>
#include <string>

/** Arguments decoded from a SOAP call body */
class SoapBody {
public:
    // Action element name, with the namespace prefix removed
    std::string name;
    // Value of the action element xmlns attribute (the service type)
    std::string serviceType;
    // Argument element name -> character data
    std::map<std::string, std::string> args;

    // Raw value access. Return false if the argument is absent.
    bool get(const char *nm, std::string *value) const;
};

/**
 * Decode the XML in a SOAP call:
 *
 *   <s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/" ...>
 *     <s:Body>
 *       <u:actionName xmlns:u="urn:schemas-upnp-org:service:serviceType:v">
 *         <argumentName>in arg value</argumentName>
 *         <!-- other in args and their values go here, if any -->
 *       </u:actionName>
 *     </s:Body>
 *   </s:Envelope>
 *
 * The document must be well-formed, have Envelope as root and Body as
 * its child, and Body must contain exactly one element. Markup nested
 * inside an argument element is dropped, only its character data is
 * kept. A document type declaration makes the parse fail.
 *
 * @param xml the HTTP POST body.
 * @param[output] out the decoded data.
 * @param[output] reason error diagnostic.
 * @return true for success, false if a decoding error occurred.
 */
extern bool decodeSoapBody(const std::string& xml, SoapBody& out,
                           std::string& reason);

#endif /* _SOAPPARSE_H_X_INCLUDED_ */
