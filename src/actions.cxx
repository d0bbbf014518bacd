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

#include "actions.hxx"

#include <vector>

using namespace std;

// Value/spelling tables. The spellings are the allowedValueList
// entries from the service descriptions, and they are compared
// exactly (UPnP string values are case-sensitive).
struct EnumName {
    int value;
    string name;
};

static const vector<EnumName> seekUnitNames {
    {SEEK_TRACK_NR, "TRACK_NR"},
    {SEEK_ABS_TIME, "ABS_TIME"},
    {SEEK_REL_TIME, "REL_TIME"},
    {SEEK_ABS_COUNT, "ABS_COUNT"},
    {SEEK_REL_COUNT, "REL_COUNT"},
    {SEEK_CHANNEL_FREQ, "CHANNEL_FREQ"},
    {SEEK_TAPE_INDEX, "TAPE-INDEX"},
    {SEEK_FRAME, "FRAME"},
};

static const vector<EnumName> channelNames {
    {CHAN_MASTER, "Master"},
    {CHAN_LF, "LF"},
    {CHAN_RF, "RF"},
    {CHAN_CF, "CF"},
    {CHAN_LFE, "LFE"},
    {CHAN_LS, "LS"},
    {CHAN_RS, "RS"},
    {CHAN_LFC, "LFC"},
    {CHAN_RFC, "RFC"},
    {CHAN_SD, "SD"},
    {CHAN_SL, "SL"},
    {CHAN_SR, "SR"},
    {CHAN_T, "T"},
    {CHAN_B, "B"},
};

static const vector<EnumName> presetNames {
    {PRESET_FACTORY_DEFAULTS, "FactoryDefaults"},
};

static const vector<EnumName> avtActionNames {
    {AVTAction::SetAVTransportURI, "SetAVTransportURI"},
    {AVTAction::SetNextAVTransportURI, "SetNextAVTransportURI"},
    {AVTAction::Stop, "Stop"},
    {AVTAction::Play, "Play"},
    {AVTAction::Pause, "Pause"},
    {AVTAction::Next, "Next"},
    {AVTAction::Previous, "Previous"},
    {AVTAction::Seek, "Seek"},
    {AVTAction::GetMediaInfo, "GetMediaInfo"},
    {AVTAction::GetTransportInfo, "GetTransportInfo"},
    {AVTAction::GetPositionInfo, "GetPositionInfo"},
    {AVTAction::GetDeviceCapabilities, "GetDeviceCapabilities"},
    {AVTAction::GetTransportSettings, "GetTransportSettings"},
    {AVTAction::GetCurrentTransportActions, "GetCurrentTransportActions"},
};

static const vector<EnumName> rcActionNames {
    {RCAction::ListPresets, "ListPresets"},
    {RCAction::SelectPreset, "SelectPreset"},
    {RCAction::GetMute, "GetMute"},
    {RCAction::SetMute, "SetMute"},
    {RCAction::GetVolume, "GetVolume"},
    {RCAction::SetVolume, "SetVolume"},
};

static const string& valToName(const vector<EnumName>& table, int val)
{
    static const string unknown("Unknown");
    for (const auto& ent : table) {
        if (ent.value == val) {
            return ent.name;
        }
    }
    return unknown;
}

static bool nameToVal(const vector<EnumName>& table, const string& nm,
                      int *val)
{
    for (const auto& ent : table) {
        if (ent.name == nm) {
            *val = ent.value;
            return true;
        }
    }
    return false;
}

const string& seekUnitToString(SeekUnit u)
{
    return valToName(seekUnitNames, u);
}

bool seekUnitFromString(const string& s, SeekUnit *u)
{
    int v;
    if (!nameToVal(seekUnitNames, s, &v))
        return false;
    *u = SeekUnit(v);
    return true;
}

const string& channelToString(Channel c)
{
    return valToName(channelNames, c);
}

bool channelFromString(const string& s, Channel *c)
{
    int v;
    if (!nameToVal(channelNames, s, &v))
        return false;
    *c = Channel(v);
    return true;
}

const string& presetToString(PresetName p)
{
    return valToName(presetNames, p);
}

bool presetFromString(const string& s, PresetName *p)
{
    int v;
    if (!nameToVal(presetNames, s, &v))
        return false;
    *p = PresetName(v);
    return true;
}

const string& AVTAction::name() const
{
    return valToName(avtActionNames, type);
}

const string& RCAction::name() const
{
    return valToName(rcActionNames, type);
}

const string& parseStatusToString(ParseStatus st)
{
    static const vector<EnumName> statusNames {
        {PARSE_OK, "ok"},
        {PARSE_ERROR, "parse error"},
        {PARSE_UNKNOWN_ACTION, "action not recognized"},
    };
    return valToName(statusNames, st);
}
