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

#include "renderer.hxx"

#include "libupnpp/log.hxx"

#include "updmrutils.hxx"

using namespace std;

const string& xmlContentType()
{
    static const string ct("text/xml; charset=\"utf-8\"");
    return ct;
}

ControlResponse declinedResponse()
{
    return ControlResponse(CTL_HTTP_METHOD_NOT_ALLOWED);
}

static string serviceErrString(int error)
{
    switch (error) {
    case UPNP_AV_AVT_INVALID_INSTANCE_ID:
        return "Invalid InstanceID";
    default:
        return "Unknown Error";
    }
}

ControlResponse upnpErrorResponse(int code)
{
    string body(
        "<?xml version=\"1.0\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
        "<s:Body>\n"
        "<s:Fault>\n"
        "<faultcode>s:Client</faultcode>\n"
        "<faultstring>UPnPError</faultstring>\n"
        "<detail>\n"
        "<UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\">\n"
        "<errorCode>");
    body += to_string(code) + "</errorCode>\n<errorDescription>" +
        serviceErrString(code) + "</errorDescription>\n"
        "</UPnPError>\n</detail>\n</s:Fault>\n</s:Body>\n</s:Envelope>\n";
    return ControlResponse(code, xmlContentType(), body);
}

ControlResponse RendererHandler::avTransport(const AVTCall& call)
{
    UPDMR_UNUSED(call);
    return declinedResponse();
}

ControlResponse RendererHandler::renderingControl(const RCCall& call)
{
    UPDMR_UNUSED(call);
    return declinedResponse();
}

// Parse failure logging common to both services
template <class T>
static void logFailure(const char *svc, const ParsedAction<T>& call)
{
    if (call.status == PARSE_UNKNOWN_ACTION) {
        LOGINF(svc << ": unsupported action " << call.actname << endl);
    } else {
        LOGERR(svc << ": bad request: " << call.reason << endl);
    }
}

ControlResponse LogRenderer::avTransport(const AVTCall& call)
{
    if (!call.ok()) {
        logFailure("AVTransport", call);
        return declinedResponse();
    }
    const AVTAction& act = call.action;
    if (act.instanceID != 0) {
        LOGINF("AVTransport: " << act.name() << ": bad instance id " <<
               act.instanceID << endl);
        return upnpErrorResponse(UPNP_AV_AVT_INVALID_INSTANCE_ID);
    }
    switch (act.type) {
    case AVTAction::SetAVTransportURI:
    case AVTAction::SetNextAVTransportURI:
        LOGINF("AVTransport: " << act.name() << ": uri [" << act.uri <<
               "]\n");
        LOGDEB("AVTransport: metadata [" << act.metadata << "]\n");
        break;
    case AVTAction::Play:
        LOGINF("AVTransport: Play: speed " << act.speed << endl);
        break;
    case AVTAction::Seek:
        LOGINF("AVTransport: Seek: unit " << seekUnitToString(act.unit) <<
               " target " << act.target << endl);
        break;
    default:
        LOGINF("AVTransport: " << act.name() << endl);
        break;
    }
    return declinedResponse();
}

ControlResponse LogRenderer::renderingControl(const RCCall& call)
{
    if (!call.ok()) {
        logFailure("RenderingControl", call);
        return declinedResponse();
    }
    const RCAction& act = call.action;
    if (act.instanceID != 0) {
        LOGINF("RenderingControl: " << act.name() << ": bad instance id " <<
               act.instanceID << endl);
        return upnpErrorResponse(UPNP_AV_AVT_INVALID_INSTANCE_ID);
    }
    switch (act.type) {
    case RCAction::SelectPreset:
        LOGINF("RenderingControl: SelectPreset: " <<
               presetToString(act.preset) << endl);
        break;
    case RCAction::SetMute:
        LOGINF("RenderingControl: SetMute: " << channelToString(act.channel)
               << " " << (act.mute ? "on" : "off") << endl);
        break;
    case RCAction::SetVolume:
        LOGINF("RenderingControl: SetVolume: " << channelToString(act.channel)
               << " " << act.volume << endl);
        break;
    case RCAction::GetMute:
    case RCAction::GetVolume:
        LOGINF("RenderingControl: " << act.name() << ": " <<
               channelToString(act.channel) << endl);
        break;
    default:
        LOGINF("RenderingControl: " << act.name() << endl);
        break;
    }
    return declinedResponse();
}
