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
#ifndef _EXTRACTOR_H_X_INCLUDED_
#define _EXTRACTOR_H_X_INCLUDED_

#include <string>
#include <vector>

// Things worth logging found in a raw control request body. This is
// a textual scan, it works on bodies the SOAP parser would reject.
class BodyHighlights {
public:
    std::string currentURI;
    std::string nextURI;

    bool empty() const {
        return currentURI.empty() && nextURI.empty();
    }
    // "CurrentURI=xxx NextURI=yyy", only for the non-empty ones.
    std::string toString() const;
};

extern BodyHighlights extractHighlights(const std::string& body);

#endif /* _EXTRACTOR_H_X_INCLUDED_ */
