// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterTables.hpp"

namespace JDXi
{

using namespace Table;

// SuperNATURAL synth tone, common section (19 01 00 00 / 19 21 00 00)
static constexpr Family DC = Family::DigitalCommon;
static constexpr ParameterDescriptor DigitalCommon[] =
{
	Character(DC, "TONE_NAME_1", 0x00),
	Character(DC, "TONE_NAME_2", 0x01),
	Character(DC, "TONE_NAME_3", 0x02),
	Character(DC, "TONE_NAME_4", 0x03),
	Character(DC, "TONE_NAME_5", 0x04),
	Character(DC, "TONE_NAME_6", 0x05),
	Character(DC, "TONE_NAME_7", 0x06),
	Character(DC, "TONE_NAME_8", 0x07),
	Character(DC, "TONE_NAME_9", 0x08),
	Character(DC, "TONE_NAME_10", 0x09),
	Character(DC, "TONE_NAME_11", 0x0A),
	Character(DC, "TONE_NAME_12", 0x0B),
	Value(DC, "TONE_LEVEL", 0x0C, 0, 127, "Adjusts the overall volume of the tone"),
	Switch(DC, "PORTAMENTO_SWITCH", 0x12),
	Value(DC, "PORTAMENTO_TIME", 0x13, 0, 127, "Time taken for the pitch to change when playing portamento"),
	Switch(DC, "MONO_SWITCH", 0x14),
	Bipolar(DC, "OCTAVE_SHIFT", 0x15, 61, 67),
	Value(DC, "PITCH_BEND_UP", 0x16, 0, 24),
	Value(DC, "PITCH_BEND_DOWN", 0x17, 0, 24),
	Switch(DC, "PARTIAL1_SWITCH", 0x19),
	Switch(DC, "PARTIAL1_SELECT", 0x1A),
	Switch(DC, "PARTIAL2_SWITCH", 0x1B),
	Switch(DC, "PARTIAL2_SELECT", 0x1C),
	Switch(DC, "PARTIAL3_SWITCH", 0x1D),
	Switch(DC, "PARTIAL3_SELECT", 0x1E),
	Value(DC, "RING_SWITCH", 0x1F, 0, 2, "OFF, ---, ON"),
	Switch(DC, "UNISON_SWITCH", 0x2E),
	Value(DC, "PORTAMENTO_MODE", 0x31, 0, 1, "NORMAL, LEGATO"),
	Switch(DC, "LEGATO_SWITCH", 0x32),
	Value(DC, "ANALOG_FEEL", 0x34, 0, 127, "Amount of 1/f fluctuation applied to the tone"),
	Value(DC, "WAVE_SHAPE", 0x35, 0, 127, "Partial 1 will be modulated by the pitch of partial 2"),
	Value(DC, "TONE_CATEGORY", 0x36, 0, 127),
	Value(DC, "UNISON_SIZE", 0x3C, 0, 3, "2, 4, 6 or 8 voices"),
};

// SuperNATURAL synth tone, partial section (LMB 20...22)
static constexpr Family DP = Family::DigitalPartial;
static constexpr ParameterDescriptor DigitalPartial[] =
{
	Value(DP, "OSC_WAVE", 0x00, 0, 7, "SAW, SQR, PW-SQR, TRI, SINE, NOISE, SUPER-SAW, PCM"),
	Value(DP, "OSC_WAVE_VARIATION", 0x01, 0, 2, "A, B, C"),
	Bipolar(DP, "OSC_PITCH", 0x03, 40, 88, 64, "Coarse pitch in semitones"),
	Bipolar(DP, "OSC_DETUNE", 0x04, 14, 114, 64, "Fine pitch in cents"),
	Value(DP, "OSC_PULSE_WIDTH_MOD_DEPTH", 0x05, 0, 127),
	Value(DP, "OSC_PULSE_WIDTH", 0x06, 0, 127),
	Value(DP, "OSC_PITCH_ENV_ATTACK_TIME", 0x07, 0, 127),
	Value(DP, "OSC_PITCH_ENV_DECAY_TIME", 0x08, 0, 127),
	Bipolar(DP, "OSC_PITCH_ENV_DEPTH", 0x09, 1, 127),
	Value(DP, "FILTER_MODE", 0x0A, 0, 7, "BYPASS, LPF, HPF, BPF, PKG, LPF2, LPF3, LPF4"),
	Value(DP, "FILTER_SLOPE", 0x0B, 0, 1, "-12 dB, -24 dB"),
	Value(DP, "FILTER_CUTOFF", 0x0C, 0, 127),
	Scaled(DP, "FILTER_CUTOFF_KEYFOLLOW", 0x0D, 54, 74, 64, 10),
	Bipolar(DP, "FILTER_ENV_VELOCITY_SENSITIVITY", 0x0E, 1, 127),
	Value(DP, "FILTER_RESONANCE", 0x0F, 0, 127),
	Value(DP, "FILTER_ENV_ATTACK_TIME", 0x10, 0, 127),
	Value(DP, "FILTER_ENV_DECAY_TIME", 0x11, 0, 127),
	Value(DP, "FILTER_ENV_SUSTAIN_LEVEL", 0x12, 0, 127),
	Value(DP, "FILTER_ENV_RELEASE_TIME", 0x13, 0, 127),
	Bipolar(DP, "FILTER_ENV_DEPTH", 0x14, 1, 127),
	Value(DP, "AMP_LEVEL", 0x15, 0, 127),
	Bipolar(DP, "AMP_VELOCITY", 0x16, 1, 127),
	Value(DP, "AMP_ENV_ATTACK_TIME", 0x17, 0, 127),
	Value(DP, "AMP_ENV_DECAY_TIME", 0x18, 0, 127),
	Value(DP, "AMP_ENV_SUSTAIN_LEVEL", 0x19, 0, 127),
	Value(DP, "AMP_ENV_RELEASE_TIME", 0x1A, 0, 127),
	Bipolar(DP, "AMP_PAN", 0x1B, 0, 127, 64, "L64 - 63R"),
	Value(DP, "LFO_SHAPE", 0x1C, 0, 5, "TRI, SIN, SAW, SQR, S&H, RND"),
	Value(DP, "LFO_RATE", 0x1D, 0, 127),
	Switch(DP, "LFO_TEMPO_SYNC_SWITCH", 0x1E),
	Value(DP, "LFO_TEMPO_SYNC_NOTE", 0x1F, 0, 19),
	Value(DP, "LFO_FADE_TIME", 0x20, 0, 127),
	Switch(DP, "LFO_KEY_TRIGGER", 0x21),
	Bipolar(DP, "LFO_PITCH_DEPTH", 0x22, 1, 127),
	Bipolar(DP, "LFO_FILTER_DEPTH", 0x23, 1, 127),
	Bipolar(DP, "LFO_AMP_DEPTH", 0x24, 1, 127),
	Bipolar(DP, "LFO_PAN_DEPTH", 0x25, 1, 127),
	Value(DP, "MOD_LFO_SHAPE", 0x26, 0, 5, "TRI, SIN, SAW, SQR, S&H, RND"),
	Value(DP, "MOD_LFO_RATE", 0x27, 0, 127),
	Switch(DP, "MOD_LFO_TEMPO_SYNC_SWITCH", 0x28),
	Value(DP, "MOD_LFO_TEMPO_SYNC_NOTE", 0x29, 0, 19),
	Value(DP, "OSC_PULSE_WIDTH_SHIFT", 0x2A, 0, 127),
	Bipolar(DP, "MOD_LFO_PITCH_DEPTH", 0x2C, 1, 127),
	Bipolar(DP, "MOD_LFO_FILTER_DEPTH", 0x2D, 1, 127),
	Bipolar(DP, "MOD_LFO_AMP_DEPTH", 0x2E, 1, 127),
	Bipolar(DP, "MOD_LFO_PAN", 0x2F, 1, 127),
	Bipolar(DP, "CUTOFF_AFTERTOUCH", 0x30, 1, 127),
	Bipolar(DP, "LEVEL_AFTERTOUCH", 0x31, 1, 127),
	Value(DP, "WAVE_GAIN", 0x34, 0, 3, "-6, 0, +6, +12 dB"),
	Nibbles(DP, "PCM_WAVE_NUMBER", 0x35, 0, 16384, 4),
	Value(DP, "HPF_CUTOFF", 0x39, 0, 127),
	Value(DP, "SUPER_SAW_DETUNE", 0x3A, 0, 127),
	Bipolar(DP, "MOD_LFO_RATE_CTRL", 0x3B, 1, 127),
	Scaled(DP, "AMP_LEVEL_KEYFOLLOW", 0x3C, 54, 74, 64, 10),
};

// SuperNATURAL synth tone, modify section (LMB 50)
static constexpr Family DM = Family::DigitalModify;
static constexpr ParameterDescriptor DigitalModify[] =
{
	Value(DM, "ATTACK_TIME_INTERVAL_SENS", 0x01, 0, 127, "Shortens the filter and amp attack time according to the spacing between note-on events"),
	Value(DM, "RELEASE_TIME_INTERVAL_SENS", 0x02, 0, 127, "Shortens the filter and amp release time according to the spacing between note-on events"),
	Value(DM, "PORTAMENTO_TIME_INTERVAL_SENS", 0x03, 0, 127),
	Value(DM, "ENVELOPE_LOOP_MODE", 0x04, 0, 2, "OFF, FREE-RUN, TEMPO-SYNC"),
	Value(DM, "ENVELOPE_LOOP_SYNC_NOTE", 0x05, 0, 19),
	Switch(DM, "CHROMATIC_PORTAMENTO", 0x06),
};

std::span<const ParameterDescriptor> DigitalCommonParameters()
{
	return DigitalCommon;
}

std::span<const ParameterDescriptor> DigitalPartialParameters()
{
	return DigitalPartial;
}

std::span<const ParameterDescriptor> DigitalModifyParameters()
{
	return DigitalModify;
}

}
