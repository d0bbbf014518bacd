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

#include "soapparse.hxx"

#include <expat.h>
#include <limits.h>
#include <string.h>

#include <sstream>

#include "libupnpp/log.hxx"

using namespace std;

bool SoapBody::get(const char *nm, string *value) const
{
    map<string, string>::const_iterator it = args.find(nm);
    if (it == args.end()) {
        return false;
    }
    *value = it->second;
    return true;
}

// Element depths in the SOAP document
enum SoapLevel {SL_ENVELOPE = 1, SL_BODY = 2, SL_ACTION = 3, SL_ARG = 4};

static string localName(const XML_Char *name)
{
    const char *cp = strchr(name, ':');
    return cp ? string(cp + 1) : string(name);
}

// Expat callback state. We only follow the Envelope/Body/action/args
// path and skip anything else (e.g. a SOAP Header).
class SoapBodyParser {
public:
    SoapBodyParser(const string& input, SoapBody& out)
        : m_input(input), m_out(out) {
    }
    ~SoapBodyParser() {
        if (m_parser)
            XML_ParserFree(m_parser);
    }

    bool parse(string& reason);

    static void startElementCB(void *ud, const XML_Char *nm,
                               const XML_Char **attrs) {
        static_cast<SoapBodyParser*>(ud)->startElement(nm, attrs);
    }
    static void endElementCB(void *ud, const XML_Char *nm) {
        static_cast<SoapBodyParser*>(ud)->endElement(nm);
    }
    static void characterDataCB(void *ud, const XML_Char *s, int len) {
        static_cast<SoapBodyParser*>(ud)->characterData(s, len);
    }
    static void doctypeCB(void *ud, const XML_Char *, const XML_Char *,
                          const XML_Char *, int) {
        static_cast<SoapBodyParser*>(ud)->fail("DTD not allowed in SOAP");
    }

private:
    void startElement(const XML_Char *name, const XML_Char **attrs);
    void endElement(const XML_Char *name);
    void characterData(const XML_Char *s, int len);
    void fail(const string& reason);

    const string& m_input;
    SoapBody& m_out;
    XML_Parser m_parser{nullptr};
    string m_reason;
    int m_depth{0};
    bool m_sawenvelope{false};
    bool m_inbody{false};
    bool m_sawbody{false};
    bool m_sawaction{false};
    // Current argument while inside one
    string m_curarg;
};

void SoapBodyParser::fail(const string& reason)
{
    if (m_reason.empty())
        m_reason = reason;
    XML_StopParser(m_parser, XML_FALSE);
}

void SoapBodyParser::startElement(const XML_Char *name, const XML_Char **attrs)
{
    m_depth++;
    string lname = localName(name);
    switch (m_depth) {
    case SL_ENVELOPE:
        if (lname != "Envelope") {
            fail(string("root element is ") + name + ", not Envelope");
            return;
        }
        m_sawenvelope = true;
        break;
    case SL_BODY:
        if (lname == "Body") {
            if (m_sawbody) {
                fail("multiple Body elements");
                return;
            }
            m_sawbody = m_inbody = true;
        }
        break;
    case SL_ACTION:
        if (!m_inbody)
            break;
        if (m_sawaction) {
            fail(string("unexpected second element in Body: ") + name);
            return;
        }
        m_sawaction = true;
        m_out.name = lname;
        for (int i = 0; attrs[i] != 0; i += 2) {
            if (!strncmp(attrs[i], "xmlns", 5)) {
                m_out.serviceType = attrs[i+1];
            }
        }
        break;
    case SL_ARG:
        if (!m_inbody)
            break;
        if (m_out.args.find(lname) != m_out.args.end()) {
            fail(string("duplicate argument ") + lname);
            return;
        }
        m_curarg = lname;
        m_out.args[m_curarg] = string();
        break;
    default:
        // Markup inside an argument value. Ignored, the character
        // data still goes to the current argument.
        break;
    }
}

void SoapBodyParser::endElement(const XML_Char *)
{
    if (m_depth == SL_ARG) {
        m_curarg.clear();
    } else if (m_depth == SL_BODY) {
        m_inbody = false;
    }
    m_depth--;
}

void SoapBodyParser::characterData(const XML_Char *s, int len)
{
    if (m_inbody && m_depth >= SL_ARG && !m_curarg.empty()) {
        m_out.args[m_curarg].append(s, len);
    }
}

bool SoapBodyParser::parse(string& reason)
{
    if (m_input.size() > INT_MAX) {
        reason = "document too big";
        return false;
    }
    m_parser = XML_ParserCreate(NULL);
    if (nullptr == m_parser) {
        reason = "XML_ParserCreate failed";
        return false;
    }
    XML_SetUserData(m_parser, this);
    XML_SetElementHandler(m_parser, startElementCB, endElementCB);
    XML_SetCharacterDataHandler(m_parser, characterDataCB);
    XML_SetStartDoctypeDeclHandler(m_parser, doctypeCB);

    if (XML_Parse(m_parser, m_input.c_str(), int(m_input.size()), 1) !=
        XML_STATUS_OK) {
        if (!m_reason.empty()) {
            reason = m_reason;
        } else {
            ostringstream ss;
            ss << "XML error: " <<
                XML_ErrorString(XML_GetErrorCode(m_parser)) <<
                " at line " << XML_GetCurrentLineNumber(m_parser);
            reason = ss.str();
        }
        return false;
    }
    if (!m_sawenvelope) {
        reason = "no Envelope element";
        return false;
    }
    if (!m_sawbody) {
        reason = "no Body element in Envelope";
        return false;
    }
    if (!m_sawaction) {
        reason = "no action element in Body";
        return false;
    }
    return true;
}

bool decodeSoapBody(const string& xml, SoapBody& out, string& reason)
{
    out = SoapBody();
    SoapBodyParser parser(xml, out);
    if (!parser.parse(reason)) {
        LOGDEB1("decodeSoapBody: failed: " << reason << endl);
        return false;
    }
    LOGDEB1("decodeSoapBody: action " << out.name << " nargs " <<
            out.args.size() << endl);
    return true;
}
