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

#include "extractor.hxx"

#include "updmrutils.hxx"

using namespace std;

// Element content up to the next markup. The element may have a
// namespace prefix and attributes.
static string elementValue(const string& body, const string& elt)
{
    string value = regmatch1(string("<([a-zA-Z0-9_]+:)?") + elt +
                             "([ \t\r\n][^>]*)?>([^<]*)<", body, 3);
    trimstring(value);
    return value;
}

BodyHighlights extractHighlights(const string& body)
{
    BodyHighlights hl;
    hl.currentURI = elementValue(body, "CurrentURI");
    hl.nextURI = elementValue(body, "NextURI");
    return hl;
}

string BodyHighlights::toString() const
{
    string out;
    if (!currentURI.empty()) {
        out += "CurrentURI=" + currentURI;
    }
    if (!nextURI.empty()) {
        if (!out.empty())
            out += " ";
        out += "NextURI=" + nextURI;
    }
    return out;
}
