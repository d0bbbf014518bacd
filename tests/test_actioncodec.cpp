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

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "actioncodec.hxx"

using namespace std;

typedef vector<pair<string, string> > ArgList;

static string soapCall(ActionCodec::Service svc, const string& action,
                       const ArgList& args)
{
    string xml(
        "<?xml version=\"1.0\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body><u:");
    xml += action + " xmlns:u=\"" + ActionCodec::serviceType(svc) + "\">";
    for (const auto& arg : args) {
        xml += "<" + arg.first + ">" + arg.second + "</" + arg.first + ">";
    }
    xml += "</u:" + action + "></s:Body></s:Envelope>";
    return xml;
}

static AVTCall avt(const string& action, const ArgList& args)
{
    return ActionCodec::decodeAVTransport(
        soapCall(ActionCodec::AVTransport, action, args));
}

static RCCall rc(const string& action, const ArgList& args)
{
    return ActionCodec::decodeRenderingControl(
        soapCall(ActionCodec::RenderingControl, action, args));
}

TEST(ActionCodec, ServiceNames)
{
    EXPECT_EQ("AVTransport", ActionCodec::serviceName(ActionCodec::AVTransport));
    EXPECT_EQ("RenderingControl",
              ActionCodec::serviceName(ActionCodec::RenderingControl));
    EXPECT_EQ("urn:schemas-upnp-org:service:RenderingControl:1",
              ActionCodec::serviceType(ActionCodec::RenderingControl));
}

TEST(ActionCodec, SetAVTransportURI)
{
    AVTCall call = avt("SetAVTransportURI",
                       {{"InstanceID", "0"},
                        {"CurrentURI", "http://192.168.1.2/track.flac"},
                        {"CurrentURIMetaData", "&lt;DIDL-Lite/&gt;"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(AVTAction::SetAVTransportURI, call.action.type);
    EXPECT_EQ("SetAVTransportURI", call.action.name());
    EXPECT_EQ(0u, call.action.instanceID);
    EXPECT_EQ("http://192.168.1.2/track.flac", call.action.uri);
    EXPECT_EQ("<DIDL-Lite/>", call.action.metadata);
}

TEST(ActionCodec, SetNextAVTransportURI)
{
    AVTCall call = avt("SetNextAVTransportURI",
                       {{"InstanceID", "0"}, {"NextURI", "http://h/next.mp3"},
                        {"NextURIMetaData", ""}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(AVTAction::SetNextAVTransportURI, call.action.type);
    EXPECT_EQ("http://h/next.mp3", call.action.uri);
    EXPECT_EQ("", call.action.metadata);

    // The Current arguments don't do for SetNext
    call = avt("SetNextAVTransportURI",
               {{"InstanceID", "0"}, {"CurrentURI", "http://h/next.mp3"},
                {"CurrentURIMetaData", ""}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, SetAVTransportURIMissingMetadata)
{
    AVTCall call = avt("SetAVTransportURI",
                       {{"InstanceID", "0"}, {"CurrentURI", "http://h/x"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    EXPECT_NE(string::npos, call.reason.find("CurrentURIMetaData"));
}

TEST(ActionCodec, Play)
{
    AVTCall call = avt("Play", {{"InstanceID", "0"}, {"Speed", "1"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(AVTAction::Play, call.action.type);
    EXPECT_EQ("1", call.action.speed);

    call = avt("Play", {{"InstanceID", "0"}, {"Speed", " 1\n"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ("1", call.action.speed);

    call = avt("Play", {{"InstanceID", "0"}, {"Speed", "2"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    call = avt("Play", {{"InstanceID", "0"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, Seek)
{
    AVTCall call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "REL_TIME"},
                                {"Target", "12"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(AVTAction::Seek, call.action.type);
    EXPECT_EQ(SEEK_REL_TIME, call.action.unit);
    EXPECT_EQ("12", call.action.target);
    EXPECT_EQ(0u, call.action.instanceID);

    call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "TAPE-INDEX"},
                        {"Target", "3"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(SEEK_TAPE_INDEX, call.action.unit);

    call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "TRACK_NR"},
                        {"Target", "2"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(SEEK_TRACK_NR, call.action.unit);
}

TEST(ActionCodec, SeekBadUnit)
{
    // Values are case-sensitive
    AVTCall call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "rel_time"},
                                {"Target", "12"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    EXPECT_NE(string::npos, call.reason.find("Unit"));

    call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "SECONDS"},
                        {"Target", "12"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    call = avt("Seek", {{"InstanceID", "0"}, {"Unit", "REL_TIME"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, InstanceOnlyActions)
{
    const vector<pair<string, AVTAction::Type> > actions {
        {"Stop", AVTAction::Stop},
        {"Pause", AVTAction::Pause},
        {"Next", AVTAction::Next},
        {"Previous", AVTAction::Previous},
        {"GetMediaInfo", AVTAction::GetMediaInfo},
        {"GetTransportInfo", AVTAction::GetTransportInfo},
        {"GetPositionInfo", AVTAction::GetPositionInfo},
        {"GetDeviceCapabilities", AVTAction::GetDeviceCapabilities},
        {"GetTransportSettings", AVTAction::GetTransportSettings},
        {"GetCurrentTransportActions", AVTAction::GetCurrentTransportActions},
    };
    for (const auto& ent : actions) {
        AVTCall call = avt(ent.first, {{"InstanceID", "7"}});
        ASSERT_TRUE(call.ok()) << ent.first << ": " << call.reason;
        EXPECT_EQ(ent.second, call.action.type) << ent.first;
        EXPECT_EQ(ent.first, call.action.name());
        EXPECT_EQ(ent.first, call.actname);
        EXPECT_EQ(7u, call.action.instanceID) << ent.first;

        call = avt(ent.first, {});
        EXPECT_EQ(PARSE_ERROR, call.status) << ent.first;
    }
}

TEST(ActionCodec, InstanceIDDomain)
{
    AVTCall call = avt("Stop", {{"InstanceID", "4294967295"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(4294967295u, call.action.instanceID);

    call = avt("Stop", {{"InstanceID", "  0 "}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(0u, call.action.instanceID);

    const char *bad[] = {"4294967296", "-1", "", "zero", "1.0", "0x10", "+1"};
    for (const char *value : bad) {
        call = avt("Stop", {{"InstanceID", value}});
        EXPECT_EQ(PARSE_ERROR, call.status) << "[" << value << "]";
    }
}

TEST(ActionCodec, UnknownActions)
{
    AVTCall call = avt("SetPlayMode", {{"InstanceID", "0"},
                                       {"NewPlayMode", "NORMAL"}});
    EXPECT_EQ(PARSE_UNKNOWN_ACTION, call.status);
    EXPECT_EQ("SetPlayMode", call.actname);
    EXPECT_FALSE(call.reason.empty());

    // RenderingControl action sent to AVTransport
    call = avt("SetVolume", {{"InstanceID", "0"}, {"Channel", "Master"},
                             {"DesiredVolume", "10"}});
    EXPECT_EQ(PARSE_UNKNOWN_ACTION, call.status);

    RCCall rcall = rc("Play", {{"InstanceID", "0"}, {"Speed", "1"}});
    EXPECT_EQ(PARSE_UNKNOWN_ACTION, rcall.status);
    rcall = rc("GetLoudness", {{"InstanceID", "0"}, {"Channel", "Master"}});
    EXPECT_EQ(PARSE_UNKNOWN_ACTION, rcall.status);
}

TEST(ActionCodec, MalformedXML)
{
    AVTCall call = ActionCodec::decodeAVTransport("<s:Envelope><s:Body>");
    EXPECT_EQ(PARSE_ERROR, call.status);
    EXPECT_FALSE(call.reason.empty());
    RCCall rcall = ActionCodec::decodeRenderingControl("not xml at all");
    EXPECT_EQ(PARSE_ERROR, rcall.status);
    EXPECT_EQ(PARSE_ERROR,
              ActionCodec::decodeRenderingControl(string()).status);
}

TEST(ActionCodec, SetVolume)
{
    RCCall call = rc("SetVolume", {{"InstanceID", "0"}, {"Channel", "Master"},
                                   {"DesiredVolume", "50"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(RCAction::SetVolume, call.action.type);
    EXPECT_EQ(CHAN_MASTER, call.action.channel);
    EXPECT_EQ(50u, call.action.volume);
    EXPECT_EQ(0u, call.action.instanceID);

    call = rc("SetVolume", {{"InstanceID", "0"}, {"Channel", "LF"},
                            {"DesiredVolume", "100"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(CHAN_LF, call.action.channel);
    EXPECT_EQ(100u, call.action.volume);

    call = rc("SetVolume", {{"InstanceID", "0"}, {"Channel", "Master"},
                            {"DesiredVolume", "101"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    call = rc("SetVolume", {{"InstanceID", "0"}, {"Channel", "Master"},
                            {"DesiredVolume", "-5"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, BadChannel)
{
    RCCall call = rc("SetVolume", {{"InstanceID", "0"},
                                   {"Channel", "LeftRear"},
                                   {"DesiredVolume", "50"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    EXPECT_NE(string::npos, call.reason.find("LeftRear"));

    call = rc("GetVolume", {{"InstanceID", "0"}, {"Channel", "master"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    call = rc("GetMute", {{"InstanceID", "0"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, GetVolumeAndMute)
{
    RCCall call = rc("GetVolume", {{"InstanceID", "0"}, {"Channel", "RF"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(RCAction::GetVolume, call.action.type);
    EXPECT_EQ(CHAN_RF, call.action.channel);

    call = rc("GetMute", {{"InstanceID", "0"}, {"Channel", "B"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(RCAction::GetMute, call.action.type);
    EXPECT_EQ(CHAN_B, call.action.channel);
}

TEST(ActionCodec, SetMute)
{
    const vector<pair<string, bool> > values {
        {"1", true}, {"0", false}, {"true", true}, {"FALSE", false},
        {"Yes", true}, {"no", false}, {" True ", true},
    };
    for (const auto& ent : values) {
        RCCall call = rc("SetMute", {{"InstanceID", "0"}, {"Channel", "Master"},
                                     {"DesiredMute", ent.first}});
        ASSERT_TRUE(call.ok()) << ent.first << ": " << call.reason;
        EXPECT_EQ(RCAction::SetMute, call.action.type);
        EXPECT_EQ(ent.second, call.action.mute) << ent.first;
    }
    RCCall call = rc("SetMute", {{"InstanceID", "0"}, {"Channel", "Master"},
                                 {"DesiredMute", "maybe"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
    call = rc("SetMute", {{"InstanceID", "0"}, {"Channel", "Master"},
                          {"DesiredMute", "2"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, Presets)
{
    RCCall call = rc("ListPresets", {{"InstanceID", "0"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(RCAction::ListPresets, call.action.type);

    call = rc("SelectPreset", {{"InstanceID", "0"},
                               {"PresetName", "FactoryDefaults"}});
    ASSERT_TRUE(call.ok()) << call.reason;
    EXPECT_EQ(RCAction::SelectPreset, call.action.type);
    EXPECT_EQ(PRESET_FACTORY_DEFAULTS, call.action.preset);

    call = rc("SelectPreset", {{"InstanceID", "0"},
                               {"PresetName", "InstallationDefaults"}});
    EXPECT_EQ(PARSE_ERROR, call.status);
}

TEST(ActionCodec, EnumSpellings)
{
    EXPECT_EQ("TAPE-INDEX", seekUnitToString(SEEK_TAPE_INDEX));
    EXPECT_EQ("Master", channelToString(CHAN_MASTER));
    EXPECT_EQ("FactoryDefaults", presetToString(PRESET_FACTORY_DEFAULTS));
    EXPECT_EQ("action not recognized",
              parseStatusToString(PARSE_UNKNOWN_ACTION));
}
