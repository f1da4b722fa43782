// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterTables.hpp"

namespace JDXi
{

using namespace Table;

static constexpr Family DCM = Family::DrumCommon;
static constexpr ParameterDescriptor DrumCommon[] =
{
	Character(DCM, "TONE_NAME_1", 0x00),
	Character(DCM, "TONE_NAME_2", 0x01),
	Character(DCM, "TONE_NAME_3", 0x02),
	Character(DCM, "TONE_NAME_4", 0x03),
	Character(DCM, "TONE_NAME_5", 0x04),
	Character(DCM, "TONE_NAME_6", 0x05),
	Character(DCM, "TONE_NAME_7", 0x06),
	Character(DCM, "TONE_NAME_8", 0x07),
	Character(DCM, "TONE_NAME_9", 0x08),
	Character(DCM, "TONE_NAME_10", 0x09),
	Character(DCM, "TONE_NAME_11", 0x0A),
	Character(DCM, "TONE_NAME_12", 0x0B),
	Value(DCM, "KIT_LEVEL", 0x0C, 0, 127, "Overall volume of the drum kit"),
};

// One drum key; the section spans two LMB pages
static constexpr Family DK = Family::DrumPartial;
static constexpr ParameterDescriptor DrumPartial[] =
{
	Character(DK, "PARTIAL_NAME_1", 0x00),
	Character(DK, "PARTIAL_NAME_2", 0x01),
	Character(DK, "PARTIAL_NAME_3", 0x02),
	Character(DK, "PARTIAL_NAME_4", 0x03),
	Character(DK, "PARTIAL_NAME_5", 0x04),
	Character(DK, "PARTIAL_NAME_6", 0x05),
	Character(DK, "PARTIAL_NAME_7", 0x06),
	Character(DK, "PARTIAL_NAME_8", 0x07),
	Character(DK, "PARTIAL_NAME_9", 0x08),
	Character(DK, "PARTIAL_NAME_10", 0x09),
	Character(DK, "PARTIAL_NAME_11", 0x0A),
	Character(DK, "PARTIAL_NAME_12", 0x0B),
	Value(DK, "ASSIGN_TYPE", 0x0C, 0, 1, "MULTI, SINGLE"),
	Value(DK, "MUTE_GROUP", 0x0D, 0, 31, "OFF, 1 - 31"),
	Value(DK, "PARTIAL_LEVEL", 0x0E, 0, 127),
	Value(DK, "PARTIAL_COARSE_TUNE", 0x0F, 0, 127, "Note number C-1 - G9"),
	Bipolar(DK, "PARTIAL_FINE_TUNE", 0x10, 14, 114),
	Value(DK, "PARTIAL_RANDOM_PITCH_DEPTH", 0x11, 0, 30),
	Bipolar(DK, "PARTIAL_PAN", 0x12, 0, 127, 64, "L64 - 63R"),
	Value(DK, "PARTIAL_RANDOM_PAN_DEPTH", 0x13, 0, 63),
	Bipolar(DK, "PARTIAL_ALTERNATE_PAN_DEPTH", 0x14, 1, 127),
	Value(DK, "PARTIAL_ENV_MODE", 0x15, 0, 1, "NO-SUS, SUSTAIN"),
	Value(DK, "PARTIAL_OUTPUT_LEVEL", 0x16, 0, 127),
	Value(DK, "PARTIAL_CHORUS_SEND_LEVEL", 0x19, 0, 127),
	Value(DK, "PARTIAL_REVERB_SEND_LEVEL", 0x1A, 0, 127),
	Value(DK, "PARTIAL_OUTPUT_ASSIGN", 0x1B, 0, 4, "EFX1, EFX2, DLY, REV, DIR"),
	Value(DK, "PARTIAL_PITCH_BEND_RANGE", 0x1C, 0, 48),
	Switch(DK, "PARTIAL_RECEIVE_EXPRESSION", 0x1D),
	Switch(DK, "PARTIAL_RECEIVE_HOLD_1", 0x1E),
	Value(DK, "WMT_VELOCITY_CONTROL", 0x20, 0, 2, "OFF, ON, RANDOM"),
	// Wave mix tables, 0x1D bytes each
	Switch(DK, "WMT1_WAVE_SWITCH", 0x21),
	Value(DK, "WMT1_WAVE_GROUP_TYPE", 0x22, 0, 0),
	Nibbles(DK, "WMT1_WAVE_GROUP_ID", 0x23, 0, 16384, 4),
	Nibbles(DK, "WMT1_WAVE_NUMBER_L", 0x27, 0, 16384, 4),
	Nibbles(DK, "WMT1_WAVE_NUMBER_R", 0x2B, 0, 16384, 4),
	Value(DK, "WMT1_WAVE_GAIN", 0x2F, 0, 3),
	Switch(DK, "WMT1_WAVE_FXM_SWITCH", 0x30),
	Shifted(DK, "WMT1_WAVE_FXM_COLOR", 0x31, 0, 3, 1),
	Value(DK, "WMT1_WAVE_FXM_DEPTH", 0x32, 0, 16),
	Switch(DK, "WMT1_WAVE_TEMPO_SYNC", 0x33),
	Bipolar(DK, "WMT1_WAVE_COARSE_TUNE", 0x34, 16, 112),
	Bipolar(DK, "WMT1_WAVE_FINE_TUNE", 0x35, 14, 114),
	Bipolar(DK, "WMT1_WAVE_PAN", 0x36, 0, 127),
	Switch(DK, "WMT1_WAVE_RANDOM_PAN_SWITCH", 0x37),
	Value(DK, "WMT1_WAVE_ALTERNATE_PAN_SWITCH", 0x38, 0, 2),
	Value(DK, "WMT1_WAVE_LEVEL", 0x39, 0, 127),
	Value(DK, "WMT1_VELOCITY_RANGE_LOWER", 0x3A, 1, 127),
	Value(DK, "WMT1_VELOCITY_RANGE_UPPER", 0x3B, 1, 127),
	Value(DK, "WMT1_VELOCITY_FADE_WIDTH_LOWER", 0x3C, 0, 127),
	Value(DK, "WMT1_VELOCITY_FADE_WIDTH_UPPER", 0x3D, 0, 127),
	// WMT2
	Switch(DK, "WMT2_WAVE_SWITCH", 0x3E),
	Value(DK, "WMT2_WAVE_GROUP_TYPE", 0x3F, 0, 0),
	Nibbles(DK, "WMT2_WAVE_GROUP_ID", 0x40, 0, 16384, 4),
	Nibbles(DK, "WMT2_WAVE_NUMBER_L", 0x44, 0, 16384, 4),
	Nibbles(DK, "WMT2_WAVE_NUMBER_R", 0x48, 0, 16384, 4),
	Value(DK, "WMT2_WAVE_GAIN", 0x4C, 0, 3),
	Switch(DK, "WMT2_WAVE_FXM_SWITCH", 0x4D),
	Shifted(DK, "WMT2_WAVE_FXM_COLOR", 0x4E, 0, 3, 1),
	Value(DK, "WMT2_WAVE_FXM_DEPTH", 0x4F, 0, 16),
	Switch(DK, "WMT2_WAVE_TEMPO_SYNC", 0x50),
	Bipolar(DK, "WMT2_WAVE_COARSE_TUNE", 0x51, 16, 112),
	Bipolar(DK, "WMT2_WAVE_FINE_TUNE", 0x52, 14, 114),
	Bipolar(DK, "WMT2_WAVE_PAN", 0x53, 0, 127),
	Switch(DK, "WMT2_WAVE_RANDOM_PAN_SWITCH", 0x54),
	Value(DK, "WMT2_WAVE_ALTERNATE_PAN_SWITCH", 0x55, 0, 2),
	Value(DK, "WMT2_WAVE_LEVEL", 0x56, 0, 127),
	Value(DK, "WMT2_VELOCITY_RANGE_LOWER", 0x57, 1, 127),
	Value(DK, "WMT2_VELOCITY_RANGE_UPPER", 0x58, 1, 127),
	Value(DK, "WMT2_VELOCITY_FADE_WIDTH_LOWER", 0x59, 0, 127),
	Value(DK, "WMT2_VELOCITY_FADE_WIDTH_UPPER", 0x5A, 0, 127),
	// WMT3
	Switch(DK, "WMT3_WAVE_SWITCH", 0x5B),
	Value(DK, "WMT3_WAVE_GROUP_TYPE", 0x5C, 0, 0),
	Nibbles(DK, "WMT3_WAVE_GROUP_ID", 0x5D, 0, 16384, 4),
	Nibbles(DK, "WMT3_WAVE_NUMBER_L", 0x61, 0, 16384, 4),
	Nibbles(DK, "WMT3_WAVE_NUMBER_R", 0x65, 0, 16384, 4),
	Value(DK, "WMT3_WAVE_GAIN", 0x69, 0, 3),
	Switch(DK, "WMT3_WAVE_FXM_SWITCH", 0x6A),
	Shifted(DK, "WMT3_WAVE_FXM_COLOR", 0x6B, 0, 3, 1),
	Value(DK, "WMT3_WAVE_FXM_DEPTH", 0x6C, 0, 16),
	Switch(DK, "WMT3_WAVE_TEMPO_SYNC", 0x6D),
	Bipolar(DK, "WMT3_WAVE_COARSE_TUNE", 0x6E, 16, 112),
	Bipolar(DK, "WMT3_WAVE_FINE_TUNE", 0x6F, 14, 114),
	Bipolar(DK, "WMT3_WAVE_PAN", 0x70, 0, 127),
	Switch(DK, "WMT3_WAVE_RANDOM_PAN_SWITCH", 0x71),
	Value(DK, "WMT3_WAVE_ALTERNATE_PAN_SWITCH", 0x72, 0, 2),
	Value(DK, "WMT3_WAVE_LEVEL", 0x73, 0, 127),
	Value(DK, "WMT3_VELOCITY_RANGE_LOWER", 0x74, 1, 127),
	Value(DK, "WMT3_VELOCITY_RANGE_UPPER", 0x75, 1, 127),
	Value(DK, "WMT3_VELOCITY_FADE_WIDTH_LOWER", 0x76, 0, 127),
	Value(DK, "WMT3_VELOCITY_FADE_WIDTH_UPPER", 0x77, 0, 127),
	// WMT4
	Switch(DK, "WMT4_WAVE_SWITCH", 0x78),
	Value(DK, "WMT4_WAVE_GROUP_TYPE", 0x79, 0, 0),
	Nibbles(DK, "WMT4_WAVE_GROUP_ID", 0x7A, 0, 16384, 4),
	Nibbles(DK, "WMT4_WAVE_NUMBER_L", 0x7E, 0, 16384, 4),
	Nibbles(DK, "WMT4_WAVE_NUMBER_R", 0x102, 0, 16384, 4),
	Value(DK, "WMT4_WAVE_GAIN", 0x106, 0, 3),
	Switch(DK, "WMT4_WAVE_FXM_SWITCH", 0x107),
	Shifted(DK, "WMT4_WAVE_FXM_COLOR", 0x108, 0, 3, 1),
	Value(DK, "WMT4_WAVE_FXM_DEPTH", 0x109, 0, 16),
	Switch(DK, "WMT4_WAVE_TEMPO_SYNC", 0x10A),
	Bipolar(DK, "WMT4_WAVE_COARSE_TUNE", 0x10B, 16, 112),
	Bipolar(DK, "WMT4_WAVE_FINE_TUNE", 0x10C, 14, 114),
	Bipolar(DK, "WMT4_WAVE_PAN", 0x10D, 0, 127),
	Switch(DK, "WMT4_WAVE_RANDOM_PAN_SWITCH", 0x10E),
	Value(DK, "WMT4_WAVE_ALTERNATE_PAN_SWITCH", 0x10F, 0, 2),
	Value(DK, "WMT4_WAVE_LEVEL", 0x110, 0, 127),
	Value(DK, "WMT4_VELOCITY_RANGE_LOWER", 0x111, 1, 127),
	Value(DK, "WMT4_VELOCITY_RANGE_UPPER", 0x112, 1, 127),
	Value(DK, "WMT4_VELOCITY_FADE_WIDTH_LOWER", 0x113, 0, 127),
	Value(DK, "WMT4_VELOCITY_FADE_WIDTH_UPPER", 0x114, 0, 127),

	Bipolar(DK, "PITCH_ENV_DEPTH", 0x115, 52, 76),
	Bipolar(DK, "PITCH_ENV_VELOCITY_SENS", 0x116, 1, 127),
	Bipolar(DK, "PITCH_ENV_TIME_1_VELOCITY_SENS", 0x117, 1, 127),
	Bipolar(DK, "PITCH_ENV_TIME_4_VELOCITY_SENS", 0x118, 1, 127),
	Value(DK, "PITCH_ENV_TIME_1", 0x119, 0, 127),
	Value(DK, "PITCH_ENV_TIME_2", 0x11A, 0, 127),
	Value(DK, "PITCH_ENV_TIME_3", 0x11B, 0, 127),
	Value(DK, "PITCH_ENV_TIME_4", 0x11C, 0, 127),
	Bipolar(DK, "PITCH_ENV_LEVEL_0", 0x11D, 1, 127),
	Bipolar(DK, "PITCH_ENV_LEVEL_1", 0x11E, 1, 127),
	Bipolar(DK, "PITCH_ENV_LEVEL_2", 0x11F, 1, 127),
	Bipolar(DK, "PITCH_ENV_LEVEL_3", 0x120, 1, 127),
	Bipolar(DK, "PITCH_ENV_LEVEL_4", 0x121, 1, 127),

	Value(DK, "TVF_FILTER_TYPE", 0x122, 0, 6, "OFF, LPF, BPF, HPF, PKG, LPF2, LPF3"),
	Value(DK, "TVF_CUTOFF_FREQUENCY", 0x123, 0, 127),
	Value(DK, "TVF_CUTOFF_VELOCITY_CURVE", 0x124, 0, 7, "FIXED, 1 - 7"),
	Bipolar(DK, "TVF_CUTOFF_VELOCITY_SENS", 0x125, 1, 127),
	Value(DK, "TVF_RESONANCE", 0x126, 0, 127),
	Bipolar(DK, "TVF_RESONANCE_VELOCITY_SENS", 0x127, 1, 127),
	Bipolar(DK, "TVF_ENV_DEPTH", 0x128, 1, 127),
	Value(DK, "TVF_ENV_VELOCITY_CURVE_TYPE", 0x129, 0, 7, "FIXED, 1 - 7"),
	Bipolar(DK, "TVF_ENV_VELOCITY_SENS", 0x12A, 1, 127),
	Bipolar(DK, "TVF_ENV_TIME_1_VELOCITY_SENS", 0x12B, 1, 127),
	Bipolar(DK, "TVF_ENV_TIME_4_VELOCITY_SENS", 0x12C, 1, 127),
	Value(DK, "TVF_ENV_TIME_1", 0x12D, 0, 127),
	Value(DK, "TVF_ENV_TIME_2", 0x12E, 0, 127),
	Value(DK, "TVF_ENV_TIME_3", 0x12F, 0, 127),
	Value(DK, "TVF_ENV_TIME_4", 0x130, 0, 127),
	Value(DK, "TVF_ENV_LEVEL_0", 0x131, 0, 127),
	Value(DK, "TVF_ENV_LEVEL_1", 0x132, 0, 127),
	Value(DK, "TVF_ENV_LEVEL_2", 0x133, 0, 127),
	Value(DK, "TVF_ENV_LEVEL_3", 0x134, 0, 127),
	Value(DK, "TVF_ENV_LEVEL_4", 0x135, 0, 127),

	Value(DK, "TVA_LEVEL_VELOCITY_CURVE", 0x136, 0, 7, "FIXED, 1 - 7"),
	Bipolar(DK, "TVA_LEVEL_VELOCITY_SENS", 0x137, 1, 127),
	Bipolar(DK, "TVA_ENV_TIME_1_VELOCITY_SENS", 0x138, 1, 127),
	Bipolar(DK, "TVA_ENV_TIME_4_VELOCITY_SENS", 0x139, 1, 127),
	Value(DK, "TVA_ENV_TIME_1", 0x13A, 0, 127),
	Value(DK, "TVA_ENV_TIME_2", 0x13B, 0, 127),
	Value(DK, "TVA_ENV_TIME_3", 0x13C, 0, 127),
	Value(DK, "TVA_ENV_TIME_4", 0x13D, 0, 127),
	Value(DK, "TVA_ENV_LEVEL_1", 0x13E, 0, 127),
	Value(DK, "TVA_ENV_LEVEL_2", 0x13F, 0, 127),
	Value(DK, "TVA_ENV_LEVEL_3", 0x140, 0, 127),
	Switch(DK, "ONE_SHOT_MODE", 0x141),
	Bipolar(DK, "RELATIVE_LEVEL", 0x142, 0, 127),
};

std::span<const ParameterDescriptor> DrumCommonParameters()
{
	return DrumCommon;
}

std::span<const ParameterDescriptor> DrumPartialParameters()
{
	return DrumPartial;
}

}
