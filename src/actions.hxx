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
#ifndef _ACTIONS_H_X_INCLUDED_
#define _ACTIONS_H_X_INCLUDED_

#include <string>

// Typed values for the actions we understand on the AVTransport and
// RenderingControl services. These are produced by the ActionCodec
// from the SOAP requests and handed to the RendererHandler.
//
// Each service has one action struct with a type tag. Only the fields
// relevant to the tagged action are significant, the others keep
// their default values.

// Seek modes (A_ARG_TYPE_SeekMode)
enum SeekUnit {
    SEEK_TRACK_NR, SEEK_ABS_TIME, SEEK_REL_TIME, SEEK_ABS_COUNT,
    SEEK_REL_COUNT, SEEK_CHANNEL_FREQ, SEEK_TAPE_INDEX, SEEK_FRAME
};

// RenderingControl channels (A_ARG_TYPE_Channel)
enum Channel {
    CHAN_MASTER, CHAN_LF, CHAN_RF, CHAN_CF, CHAN_LFE, CHAN_LS, CHAN_RS,
    CHAN_LFC, CHAN_RFC, CHAN_SD, CHAN_SL, CHAN_SR, CHAN_T, CHAN_B
};

// Presets (A_ARG_TYPE_PresetName). We only have the mandatory one.
enum PresetName {
    PRESET_FACTORY_DEFAULTS
};

// Conversions between the enumerated values and their protocol
// spelling. The xxxFromString() functions return false if the input
// is not one of the legal values.
extern const std::string& seekUnitToString(SeekUnit u);
extern bool seekUnitFromString(const std::string& s, SeekUnit *u);
extern const std::string& channelToString(Channel c);
extern bool channelFromString(const std::string& s, Channel *c);
extern const std::string& presetToString(PresetName p);
extern bool presetFromString(const std::string& s, PresetName *p);

class AVTAction {
public:
    enum Type {
        SetAVTransportURI, SetNextAVTransportURI,
        Stop, Play, Pause, Next, Previous, Seek,
        GetMediaInfo, GetTransportInfo, GetPositionInfo,
        GetDeviceCapabilities, GetTransportSettings,
        GetCurrentTransportActions
    };
    Type type{Stop};
    unsigned int instanceID{0};
    // SetAVTransportURI (CurrentURI...) and SetNextAVTransportURI (NextURI...)
    std::string uri;
    std::string metadata;
    // Play. Always "1", the only TransportPlaySpeed value we accept
    std::string speed;
    // Seek
    SeekUnit unit{SEEK_REL_TIME};
    std::string target;

    // Action name as it appears in the SOAP call
    const std::string& name() const;
};

class RCAction {
public:
    enum Type {
        ListPresets, SelectPreset, GetMute, SetMute, GetVolume, SetVolume
    };
    Type type{ListPresets};
    unsigned int instanceID{0};
    Channel channel{CHAN_MASTER};
    PresetName preset{PRESET_FACTORY_DEFAULTS};
    bool mute{false};
    // 0-100
    unsigned int volume{0};

    const std::string& name() const;
};

/**
 * Outcome of decoding one control message: either a typed action, or
 * a failure with a diagnostic. UNKNOWN_ACTION is kept separate from
 * the other errors because control points legitimately call actions
 * from the full service definition which we do not implement.
 */
enum ParseStatus {PARSE_OK, PARSE_ERROR, PARSE_UNKNOWN_ACTION};

template <class T> class ParsedAction {
public:
    ParseStatus status{PARSE_ERROR};
    // Action element name from the body, if we got that far.
    std::string actname;
    // Diagnostic for status != PARSE_OK
    std::string reason;
    // Only significant if status == PARSE_OK
    T action;

    bool ok() const {
        return status == PARSE_OK;
    }
};

typedef ParsedAction<AVTAction> AVTCall;
typedef ParsedAction<RCAction> RCCall;

extern const std::string& parseStatusToString(ParseStatus st);

#endif /* _ACTIONS_H_X_INCLUDED_ */
