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

#include "actioncodec.hxx"

#include <functional>
#include <map>
#include <utility>

#include "libupnpp/log.hxx"

#include "soapparse.hxx"
#include "updmrutils.hxx"

using namespace std;
using namespace std::placeholders;

static const string sNmTransport("AVTransport");
static const string sNmRendering("RenderingControl");
static const string sTpTransport("urn:schemas-upnp-org:service:AVTransport:1");
static const string sTpRendering(
    "urn:schemas-upnp-org:service:RenderingControl:1");

const string& ActionCodec::serviceName(Service svc)
{
    return svc == AVTransport ? sNmTransport : sNmRendering;
}

const string& ActionCodec::serviceType(Service svc)
{
    return svc == AVTransport ? sTpTransport : sTpRendering;
}

// Argument accessors. All return false and set reason if the
// argument is absent or its value is not legal.

static bool getString(const SoapBody& sb, const char *nm, string *value,
                      string& reason)
{
    if (!sb.get(nm, value)) {
        reason = string("missing argument ") + nm;
        return false;
    }
    return true;
}

// Get a value from an enumerated domain or a number, after trimming.
static bool getTrimmed(const SoapBody& sb, const char *nm, string *value,
                       string& reason)
{
    if (!getString(sb, nm, value, reason))
        return false;
    trimstring(*value);
    return true;
}

static bool getUint(const SoapBody& sb, const char *nm, unsigned long maxval,
                    unsigned long *value, string& reason)
{
    string s;
    if (!getTrimmed(sb, nm, &s, reason))
        return false;
    if (!strToUint(s, maxval, value)) {
        reason = string("bad value for ") + nm + ": [" + s + "]";
        return false;
    }
    return true;
}

static bool getInstanceID(const SoapBody& sb, unsigned int *id, string& reason)
{
    unsigned long val;
    if (!getUint(sb, "InstanceID", 4294967295UL, &val, reason))
        return false;
    *id = (unsigned int)val;
    return true;
}

static bool getBool(const SoapBody& sb, const char *nm, bool *value,
                    string& reason)
{
    string s;
    if (!getTrimmed(sb, nm, &s, reason))
        return false;
    if (!s.compare("1") || !stringicmp(s, "true") || !stringicmp(s, "yes")) {
        *value = true;
    } else if (!s.compare("0") || !stringicmp(s, "false") ||
               !stringicmp(s, "no")) {
        *value = false;
    } else {
        reason = string("bad boolean value for ") + nm + ": [" + s + "]";
        return false;
    }
    return true;
}

static bool getChannel(const SoapBody& sb, Channel *chan, string& reason)
{
    string s;
    if (!getTrimmed(sb, "Channel", &s, reason))
        return false;
    if (!channelFromString(s, chan)) {
        reason = string("bad Channel value: [") + s + "]";
        return false;
    }
    return true;
}

////////////// AVTransport

typedef function<bool (const SoapBody&, AVTAction&, string&)> AVTDecoder;

static bool avtUri(const SoapBody& sb, AVTAction& act, string& reason,
                   bool setnext)
{
    return getInstanceID(sb, &act.instanceID, reason) &&
        getString(sb, setnext ? "NextURI" : "CurrentURI", &act.uri, reason) &&
        getString(sb, setnext ? "NextURIMetaData" : "CurrentURIMetaData",
                  &act.metadata, reason);
}

static bool avtPlay(const SoapBody& sb, AVTAction& act, string& reason)
{
    if (!getInstanceID(sb, &act.instanceID, reason) ||
        !getTrimmed(sb, "Speed", &act.speed, reason))
        return false;
    if (act.speed.compare("1")) {
        reason = string("unsupported Speed: [") + act.speed + "]";
        return false;
    }
    return true;
}

static bool avtSeek(const SoapBody& sb, AVTAction& act, string& reason)
{
    string unit;
    if (!getInstanceID(sb, &act.instanceID, reason) ||
        !getTrimmed(sb, "Unit", &unit, reason) ||
        !getTrimmed(sb, "Target", &act.target, reason))
        return false;
    if (!seekUnitFromString(unit, &act.unit)) {
        reason = string("bad Unit value: [") + unit + "]";
        return false;
    }
    return true;
}

// All other actions only have an InstanceID
static bool avtSimple(const SoapBody& sb, AVTAction& act, string& reason)
{
    return getInstanceID(sb, &act.instanceID, reason);
}

static const map<string, pair<AVTAction::Type, AVTDecoder> >& avtDecoders()
{
    static const map<string, pair<AVTAction::Type, AVTDecoder> > decoders {
        {"SetAVTransportURI", {AVTAction::SetAVTransportURI,
                               bind(avtUri, _1, _2, _3, false)}},
        {"SetNextAVTransportURI", {AVTAction::SetNextAVTransportURI,
                                   bind(avtUri, _1, _2, _3, true)}},
        {"Stop", {AVTAction::Stop, avtSimple}},
        {"Play", {AVTAction::Play, avtPlay}},
        {"Pause", {AVTAction::Pause, avtSimple}},
        {"Next", {AVTAction::Next, avtSimple}},
        {"Previous", {AVTAction::Previous, avtSimple}},
        {"Seek", {AVTAction::Seek, avtSeek}},
        {"GetMediaInfo", {AVTAction::GetMediaInfo, avtSimple}},
        {"GetTransportInfo", {AVTAction::GetTransportInfo, avtSimple}},
        {"GetPositionInfo", {AVTAction::GetPositionInfo, avtSimple}},
        {"GetDeviceCapabilities", {AVTAction::GetDeviceCapabilities,
                                   avtSimple}},
        {"GetTransportSettings", {AVTAction::GetTransportSettings,
                                  avtSimple}},
        {"GetCurrentTransportActions", {AVTAction::GetCurrentTransportActions,
                                        avtSimple}},
    };
    return decoders;
}

////////////// RenderingControl

typedef function<bool (const SoapBody&, RCAction&, string&)> RCDecoder;

static bool rcSimple(const SoapBody& sb, RCAction& act, string& reason)
{
    return getInstanceID(sb, &act.instanceID, reason);
}

static bool rcSelectPreset(const SoapBody& sb, RCAction& act, string& reason)
{
    string preset;
    if (!getInstanceID(sb, &act.instanceID, reason) ||
        !getTrimmed(sb, "PresetName", &preset, reason))
        return false;
    if (!presetFromString(preset, &act.preset)) {
        reason = string("bad PresetName value: [") + preset + "]";
        return false;
    }
    return true;
}

static bool rcChannel(const SoapBody& sb, RCAction& act, string& reason)
{
    return getInstanceID(sb, &act.instanceID, reason) &&
        getChannel(sb, &act.channel, reason);
}

static bool rcSetMute(const SoapBody& sb, RCAction& act, string& reason)
{
    return rcChannel(sb, act, reason) &&
        getBool(sb, "DesiredMute", &act.mute, reason);
}

static bool rcSetVolume(const SoapBody& sb, RCAction& act, string& reason)
{
    unsigned long vol;
    if (!rcChannel(sb, act, reason) ||
        !getUint(sb, "DesiredVolume", 100, &vol, reason))
        return false;
    act.volume = (unsigned int)vol;
    return true;
}

static const map<string, pair<RCAction::Type, RCDecoder> >& rcDecoders()
{
    static const map<string, pair<RCAction::Type, RCDecoder> > decoders {
        {"ListPresets", {RCAction::ListPresets, rcSimple}},
        {"SelectPreset", {RCAction::SelectPreset, rcSelectPreset}},
        {"GetMute", {RCAction::GetMute, rcChannel}},
        {"SetMute", {RCAction::SetMute, rcSetMute}},
        {"GetVolume", {RCAction::GetVolume, rcChannel}},
        {"SetVolume", {RCAction::SetVolume, rcSetVolume}},
    };
    return decoders;
}

// Common part: XML decoding, table lookup, then the action-specific
// decoder.
template <class T, class D>
static ParsedAction<T> decodeCall(
    const string& body, const map<string, pair<typename T::Type, D> >& table,
    const string& svcname)
{
    ParsedAction<T> call;
    SoapBody sb;
    if (!decodeSoapBody(body, sb, call.reason)) {
        call.status = PARSE_ERROR;
        return call;
    }
    call.actname = sb.name;
    auto it = table.find(sb.name);
    if (it == table.end()) {
        call.status = PARSE_UNKNOWN_ACTION;
        call.reason = svcname + ": action not recognized: " + sb.name;
        return call;
    }
    call.action.type = it->second.first;
    if (!it->second.second(sb, call.action, call.reason)) {
        call.status = PARSE_ERROR;
        call.reason = sb.name + ": " + call.reason;
        return call;
    }
    call.status = PARSE_OK;
    return call;
}

AVTCall ActionCodec::decodeAVTransport(const string& body)
{
    AVTCall call = decodeCall<AVTAction>(body, avtDecoders(), sNmTransport);
    LOGDEB1("ActionCodec::decodeAVTransport: " << call.actname << " -> " <<
            parseStatusToString(call.status) << endl);
    return call;
}

RCCall ActionCodec::decodeRenderingControl(const string& body)
{
    RCCall call = decodeCall<RCAction>(body, rcDecoders(), sNmRendering);
    LOGDEB1("ActionCodec::decodeRenderingControl: " << call.actname << " -> "
            << parseStatusToString(call.status) << endl);
    return call;
}
