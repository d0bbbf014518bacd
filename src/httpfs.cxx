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

#include "httpfs.hxx"

#include <string.h>

#include <vector>

#include "libupnpp/log.hxx"
#include "libupnpp/soaphelp.hxx"

#include "actions.hxx"
#include "updmrutils.hxx"

using namespace std;
using namespace UPnPP;

// The description XML document is the first thing downloaded by
// clients and tells them what services we export, and where to find
// them. The SCPD/control URLs are the paths served by the
// ControlDispatcher. ConnectionManager is advertised but inert, it
// points to /Ignore.
static const string description_tmpl(
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
    "<specVersion><major>1</major><minor>0</minor></specVersion>\n"
    "<device>\n"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>\n"
    "<friendlyName>@FRIENDLYNAME@</friendlyName>\n"
    "<manufacturer>@MANUFACTURER@</manufacturer>\n"
    "<manufacturerURL>@MANUFACTURERURL@</manufacturerURL>\n"
    "<modelDescription>@MODELDESCRIPTION@</modelDescription>\n"
    "<modelName>@MODELNAME@</modelName>\n"
    "<modelURL>@MODELURL@</modelURL>\n"
    "<serialNumber>@SERIALNUMBER@</serialNumber>\n"
    "<UDN>uuid:@UUID@</UDN>\n"
    "<serviceList>\n"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>"
    "<SCPDURL>/RenderingControl</SCPDURL>"
    "<controlURL>/RenderingControl</controlURL>"
    "<eventSubURL>/Ignore</eventSubURL>"
    "</service>\n"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
    "<SCPDURL>/AVTransport</SCPDURL>"
    "<controlURL>/AVTransport</controlURL>"
    "<eventSubURL>/Ignore</eventSubURL>"
    "</service>\n"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:ConnectionManager:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:ConnectionManager</serviceId>"
    "<SCPDURL>/Ignore</SCPDURL>"
    "<controlURL>/Ignore</controlURL>"
    "<eventSubURL>/Ignore</eventSubURL>"
    "</service>\n"
    "</serviceList>\n"
    "</device>\n"
    "</root>\n"
    );

// Service description tables. The SCPD documents are generated from
// these.
struct ArgDesc {
    const char *name;
    bool in;
    const char *var;
};
struct ActionDesc {
    const char *name;
    vector<ArgDesc> args;
};
struct StateVarDesc {
    const char *name;
    const char *type;
    bool evented;
    vector<string> allowed;
};

static const vector<ActionDesc> avtActions {
    {"SetAVTransportURI", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"CurrentURI", true, "AVTransportURI"},
            {"CurrentURIMetaData", true, "AVTransportURIMetaData"}}},
    {"SetNextAVTransportURI", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"NextURI", true, "NextAVTransportURI"},
            {"NextURIMetaData", true, "NextAVTransportURIMetaData"}}},
    {"GetMediaInfo", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"NrTracks", false, "NumberOfTracks"},
            {"MediaDuration", false, "CurrentMediaDuration"},
            {"CurrentURI", false, "AVTransportURI"},
            {"CurrentURIMetaData", false, "AVTransportURIMetaData"},
            {"NextURI", false, "NextAVTransportURI"},
            {"NextURIMetaData", false, "NextAVTransportURIMetaData"},
            {"PlayMedium", false, "PlaybackStorageMedium"},
            {"RecordMedium", false, "RecordStorageMedium"},
            {"WriteStatus", false, "RecordMediumWriteStatus"}}},
    {"GetTransportInfo", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"CurrentTransportState", false, "TransportState"},
            {"CurrentTransportStatus", false, "TransportStatus"},
            {"CurrentSpeed", false, "TransportPlaySpeed"}}},
    {"GetPositionInfo", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Track", false, "CurrentTrack"},
            {"TrackDuration", false, "CurrentTrackDuration"},
            {"TrackMetaData", false, "CurrentTrackMetaData"},
            {"TrackURI", false, "CurrentTrackURI"},
            {"RelTime", false, "RelativeTimePosition"},
            {"AbsTime", false, "AbsoluteTimePosition"},
            {"RelCount", false, "RelativeCounterPosition"},
            {"AbsCount", false, "AbsoluteCounterPosition"}}},
    {"GetDeviceCapabilities", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"PlayMedia", false, "PossiblePlaybackStorageMedia"},
            {"RecMedia", false, "PossibleRecordStorageMedia"},
            {"RecQualityModes", false, "PossibleRecordQualityModes"}}},
    {"GetTransportSettings", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"PlayMode", false, "CurrentPlayMode"},
            {"RecQualityMode", false, "CurrentRecordQualityMode"}}},
    {"Stop", {{"InstanceID", true, "A_ARG_TYPE_InstanceID"}}},
    {"Play", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Speed", true, "TransportPlaySpeed"}}},
    {"Pause", {{"InstanceID", true, "A_ARG_TYPE_InstanceID"}}},
    {"Seek", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Unit", true, "A_ARG_TYPE_SeekMode"},
            {"Target", true, "A_ARG_TYPE_SeekTarget"}}},
    {"Next", {{"InstanceID", true, "A_ARG_TYPE_InstanceID"}}},
    {"Previous", {{"InstanceID", true, "A_ARG_TYPE_InstanceID"}}},
    {"GetCurrentTransportActions", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Actions", false, "CurrentTransportActions"}}},
};

static vector<StateVarDesc> avtStateVars()
{
    vector<string> units;
    for (int u = SEEK_TRACK_NR; u <= SEEK_FRAME; u++) {
        units.push_back(seekUnitToString(SeekUnit(u)));
    }
    return vector<StateVarDesc> {
        {"TransportState", "string", false,
         {"STOPPED", "PLAYING", "TRANSITIONING", "PAUSED_PLAYBACK",
          "NO_MEDIA_PRESENT"}},
        {"TransportStatus", "string", false, {"OK", "ERROR_OCCURRED"}},
        {"PlaybackStorageMedium", "string", false, {"NONE", "NETWORK"}},
        {"RecordStorageMedium", "string", false, {"NOT_IMPLEMENTED"}},
        {"PossiblePlaybackStorageMedia", "string", false, {}},
        {"PossibleRecordStorageMedia", "string", false, {}},
        {"CurrentPlayMode", "string", false, {"NORMAL"}},
        {"TransportPlaySpeed", "string", false, {"1"}},
        {"RecordMediumWriteStatus", "string", false, {"NOT_IMPLEMENTED"}},
        {"CurrentRecordQualityMode", "string", false, {"NOT_IMPLEMENTED"}},
        {"PossibleRecordQualityModes", "string", false, {}},
        {"NumberOfTracks", "ui4", false, {}},
        {"CurrentTrack", "ui4", false, {}},
        {"CurrentTrackDuration", "string", false, {}},
        {"CurrentMediaDuration", "string", false, {}},
        {"CurrentTrackMetaData", "string", false, {}},
        {"CurrentTrackURI", "string", false, {}},
        {"AVTransportURI", "string", false, {}},
        {"AVTransportURIMetaData", "string", false, {}},
        {"NextAVTransportURI", "string", false, {}},
        {"NextAVTransportURIMetaData", "string", false, {}},
        {"RelativeTimePosition", "string", false, {}},
        {"AbsoluteTimePosition", "string", false, {}},
        {"RelativeCounterPosition", "i4", false, {}},
        {"AbsoluteCounterPosition", "i4", false, {}},
        {"CurrentTransportActions", "string", false, {}},
        {"LastChange", "string", true, {}},
        {"A_ARG_TYPE_SeekMode", "string", false, units},
        {"A_ARG_TYPE_SeekTarget", "string", false, {}},
        {"A_ARG_TYPE_InstanceID", "ui4", false, {}},
    };
}

static const vector<ActionDesc> rcActions {
    {"ListPresets", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"CurrentPresetNameList", false, "PresetNameList"}}},
    {"SelectPreset", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"PresetName", true, "A_ARG_TYPE_PresetName"}}},
    {"GetMute", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Channel", true, "A_ARG_TYPE_Channel"},
            {"CurrentMute", false, "Mute"}}},
    {"SetMute", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Channel", true, "A_ARG_TYPE_Channel"},
            {"DesiredMute", true, "Mute"}}},
    {"GetVolume", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Channel", true, "A_ARG_TYPE_Channel"},
            {"CurrentVolume", false, "Volume"}}},
    {"SetVolume", {
            {"InstanceID", true, "A_ARG_TYPE_InstanceID"},
            {"Channel", true, "A_ARG_TYPE_Channel"},
            {"DesiredVolume", true, "Volume"}}},
};

static vector<StateVarDesc> rcStateVars()
{
    vector<string> channels;
    for (int c = CHAN_MASTER; c <= CHAN_B; c++) {
        channels.push_back(channelToString(Channel(c)));
    }
    vector<string> presets{presetToString(PRESET_FACTORY_DEFAULTS)};
    return vector<StateVarDesc> {
        {"PresetNameList", "string", false, {}},
        {"LastChange", "string", true, {}},
        {"Mute", "boolean", false, {}},
        {"Volume", "ui2", false, {}},
        {"A_ARG_TYPE_Channel", "string", false, channels},
        {"A_ARG_TYPE_InstanceID", "ui4", false, {}},
        {"A_ARG_TYPE_PresetName", "string", false, presets},
    };
}

static string makeScpd(const vector<ActionDesc>& actions,
                       const vector<StateVarDesc>& vars)
{
    string out(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<scpd xmlns=\"urn:schemas-upnp-org:service-1-0\">\n"
        "<specVersion><major>1</major><minor>0</minor></specVersion>\n"
        "<actionList>\n");
    for (const auto& act : actions) {
        out += string("<action><name>") + act.name + "</name><argumentList>\n";
        for (const auto& arg : act.args) {
            out += string("<argument><name>") + arg.name + "</name>"
                "<direction>" + (arg.in ? "in" : "out") + "</direction>"
                "<relatedStateVariable>" + arg.var +
                "</relatedStateVariable></argument>\n";
        }
        out += "</argumentList></action>\n";
    }
    out += "</actionList>\n<serviceStateTable>\n";
    for (const auto& var : vars) {
        out += string("<stateVariable sendEvents=\"") +
            (var.evented ? "yes" : "no") + "\"><name>" + var.name +
            "</name><dataType>" + var.type + "</dataType>";
        if (!strcmp(var.name, "Volume")) {
            out += "<allowedValueRange><minimum>0</minimum>"
                "<maximum>100</maximum><step>1</step></allowedValueRange>";
        }
        if (!var.allowed.empty()) {
            out += "<allowedValueList>";
            for (const auto& val : var.allowed) {
                out += "<allowedValue>" + SoapHelp::xmlQuote(val) +
                    "</allowedValue>";
            }
            out += "</allowedValueList>";
        }
        out += "</stateVariable>\n";
    }
    out += "</serviceStateTable>\n</scpd>\n";
    return out;
}

static string valueOr(const string& value, const string& dflt)
{
    return value.empty() ? dflt : value;
}

// XML-quote a value for the description. '@' is also escaped so
// that an inserted value can't be taken for a later @FIELD@.
static string descQuote(const string& value)
{
    string quoted = SoapHelp::xmlQuote(value);
    string out;
    for (const auto ch : quoted) {
        if (ch == '@') {
            out += "&#64;";
        } else {
            out += ch;
        }
    }
    return out;
}

DeviceDocs initHttpFs(const UDevDesc& desc)
{
    DeviceDocs docs;

    string data = description_tmpl;
    data = regsub1("@UUID@", data, descQuote(desc.uuid));
    data = regsub1("@FRIENDLYNAME@", data,
                   descQuote(valueOr(desc.fname, "UpDmr")));
    data = regsub1("@MANUFACTURER@", data,
                   descQuote(valueOr(desc.manufacturer, "UpDmr")));
    data = regsub1("@MANUFACTURERURL@", data,
                   descQuote(desc.manufacturerurl));
    data = regsub1("@MODELDESCRIPTION@", data,
                   descQuote(valueOr(desc.modeldescription,
                                     "UPnP media renderer")));
    data = regsub1("@MODELNAME@", data,
                   descQuote(valueOr(desc.modelname, "UpDmr renderer")));
    data = regsub1("@MODELURL@", data, descQuote(desc.modelurl));
    data = regsub1("@SERIALNUMBER@", data,
                   descQuote(valueOr(desc.serialnumber, desc.uuid)));
    docs.description = data;

    docs.avtscpd = makeScpd(avtActions, avtStateVars());
    docs.rcscpd = makeScpd(rcActions, rcStateVars());
    LOGDEB1("initHttpFs: description:\n" << docs.description << endl);
    return docs;
}
