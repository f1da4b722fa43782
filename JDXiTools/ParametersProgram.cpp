// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterTables.hpp"

namespace JDXi
{

using namespace Table;

// Offsets of the level and tempo as used by the program editor.
// See ProgramCommonLayout for the alternative layout.
static constexpr Family PC = Family::ProgramCommon;
static constexpr ParameterDescriptor ProgramCommon[] =
{
	Character(PC, "PROGRAM_NAME_1", 0x00),
	Character(PC, "PROGRAM_NAME_2", 0x01),
	Character(PC, "PROGRAM_NAME_3", 0x02),
	Character(PC, "PROGRAM_NAME_4", 0x03),
	Character(PC, "PROGRAM_NAME_5", 0x04),
	Character(PC, "PROGRAM_NAME_6", 0x05),
	Character(PC, "PROGRAM_NAME_7", 0x06),
	Character(PC, "PROGRAM_NAME_8", 0x07),
	Character(PC, "PROGRAM_NAME_9", 0x08),
	Character(PC, "PROGRAM_NAME_10", 0x09),
	Character(PC, "PROGRAM_NAME_11", 0x0A),
	Character(PC, "PROGRAM_NAME_12", 0x0B),
	Value(PC, "PROGRAM_LEVEL", 0x10, 0, 127, "Volume of the program"),
	Nibbles(PC, "PROGRAM_TEMPO", 0x11, 500, 30000, 4, "5.00 - 300.00 BPM"),
	Value(PC, "VOCAL_EFFECT", 0x16, 0, 2, "OFF, VOCODER, AUTO-PITCH"),
	Shifted(PC, "VOCAL_EFFECT_NUMBER", 0x1C, 0, 20, 1),
	Shifted(PC, "VOCAL_EFFECT_PART", 0x1D, 0, 1, 1),
	Switch(PC, "AUTO_NOTE_SWITCH", 0x1E),
};

static constexpr Family VF = Family::VocalFx;
static constexpr ParameterDescriptor VocalFx[] =
{
	Value(VF, "LEVEL", 0x00, 0, 127),
	Bipolar(VF, "PAN", 0x01, 0, 127, 64, "L64 - 63R"),
	Value(VF, "DELAY_SEND_LEVEL", 0x02, 0, 127),
	Value(VF, "REVERB_SEND_LEVEL", 0x03, 0, 127),
	Value(VF, "OUTPUT_ASSIGN", 0x04, 0, 4, "EFX1, EFX2, DLY, REV, DIR"),
	Switch(VF, "AUTO_PITCH_SWITCH", 0x05),
	Value(VF, "AUTO_PITCH_TYPE", 0x06, 0, 3, "SOFT, HARD, ELECTRIC1, ELECTRIC2"),
	Value(VF, "AUTO_PITCH_SCALE", 0x07, 0, 1, "CHROMATIC, Maj(Min)"),
	Value(VF, "AUTO_PITCH_KEY", 0x08, 0, 23),
	Value(VF, "AUTO_PITCH_NOTE", 0x09, 0, 11),
	Bipolar(VF, "AUTO_PITCH_GENDER", 0x0A, 0, 20, 10),
	Bipolar(VF, "AUTO_PITCH_OCTAVE", 0x0B, 0, 2, 1),
	Value(VF, "AUTO_PITCH_BALANCE", 0x0C, 0, 100, "D100:0W - D0:100W"),
	Switch(VF, "VOCODER_SWITCH", 0x0D),
	Value(VF, "VOCODER_ENVELOPE", 0x0E, 0, 2, "SHARP, SOFT, LONG"),
	Value(VF, "VOCODER_LEVEL", 0x0F, 0, 127),
	Value(VF, "VOCODER_MIC_SENS", 0x10, 0, 127),
	Value(VF, "VOCODER_SYNTH_LEVEL", 0x11, 0, 127),
	Value(VF, "VOCODER_MIC_MIX", 0x12, 0, 127),
	Value(VF, "VOCODER_MIC_HPF", 0x13, 0, 13, "BYPASS, 1000 - 16000 Hz"),
};

// Effect parameters are 4 nibbles each, centered at 32768
static constexpr int32_t EFFECT_PARAM_MIN = 12768;
static constexpr int32_t EFFECT_PARAM_MAX = 52768;
static constexpr int32_t EFFECT_PARAM_CENTER = 32768;

static constexpr Family E1 = Family::Effect1;
static constexpr ParameterDescriptor Effect1[] =
{
	Value(E1, "EFX1_TYPE", 0x00, 0, 4, "THRU, DISTORTION, FUZZ, COMPRESSOR, BIT CRUSHER"),
	Value(E1, "EFX1_LEVEL", 0x01, 0, 127),
	Value(E1, "EFX1_DELAY_SEND_LEVEL", 0x02, 0, 127),
	Value(E1, "EFX1_REVERB_SEND_LEVEL", 0x03, 0, 127),
	Value(E1, "EFX1_OUTPUT_ASSIGN", 0x04, 0, 1, "DIR, EFX2"),
	BipolarNibbles(E1, "EFX1_PARAM_1", 0x11, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(E1, "EFX1_PARAM_2", 0x15, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(E1, "EFX1_PARAM_32", 0x10D, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
};

static constexpr Family E2 = Family::Effect2;
static constexpr ParameterDescriptor Effect2[] =
{
	Value(E2, "EFX2_TYPE", 0x00, 0, 8, "OFF, FLANGER, PHASER, RING MOD, SLICER"),
	Value(E2, "EFX2_LEVEL", 0x01, 0, 127),
	Value(E2, "EFX2_DELAY_SEND_LEVEL", 0x02, 0, 127),
	Value(E2, "EFX2_REVERB_SEND_LEVEL", 0x03, 0, 127),
	BipolarNibbles(E2, "EFX2_PARAM_1", 0x11, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(E2, "EFX2_PARAM_2", 0x15, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(E2, "EFX2_PARAM_32", 0x10D, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
};

static constexpr Family DL = Family::Delay;
static constexpr ParameterDescriptor Delay[] =
{
	Value(DL, "DELAY_LEVEL", 0x01, 0, 127),
	Value(DL, "DELAY_REVERB_SEND_LEVEL", 0x06, 0, 127),
	BipolarNibbles(DL, "DELAY_PARAM_1", 0x08, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(DL, "DELAY_PARAM_2", 0x0C, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(DL, "DELAY_PARAM_24", 0x60, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
};

static constexpr Family RV = Family::Reverb;
static constexpr ParameterDescriptor Reverb[] =
{
	Value(RV, "REVERB_LEVEL", 0x03, 0, 127),
	BipolarNibbles(RV, "REVERB_PARAM_1", 0x07, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(RV, "REVERB_PARAM_2", 0x0B, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
	BipolarNibbles(RV, "REVERB_PARAM_24", 0x5F, EFFECT_PARAM_MIN, EFFECT_PARAM_MAX, EFFECT_PARAM_CENTER),
};

static constexpr Family PP = Family::ProgramPart;
static constexpr ParameterDescriptor ProgramPart[] =
{
	Shifted(PP, "RECEIVE_CHANNEL", 0x00, 0, 15, 1),
	Switch(PP, "PART_SWITCH", 0x01),
	Value(PP, "TONE_BANK_SELECT_MSB", 0x06, 0, 127, "CC# 0"),
	Value(PP, "TONE_BANK_SELECT_LSB", 0x07, 0, 127, "CC# 32"),
	Value(PP, "TONE_PROGRAM_NUMBER", 0x08, 0, 127),
	Value(PP, "PART_LEVEL", 0x09, 0, 127, "CC# 7"),
	Bipolar(PP, "PART_PAN", 0x0A, 0, 127, 64, "CC# 10"),
	Bipolar(PP, "PART_COARSE_TUNE", 0x0B, 16, 112, 64, "RPN# 2"),
	Bipolar(PP, "PART_FINE_TUNE", 0x0C, 14, 114, 64, "RPN# 1"),
	Value(PP, "PART_MONO_POLY", 0x0D, 0, 2, "MONO, POLY, TONE"),
	Value(PP, "PART_LEGATO_SWITCH", 0x0E, 0, 2, "OFF, ON, TONE"),
	Value(PP, "PART_PITCH_BEND_RANGE", 0x0F, 0, 25, "0 - 24, TONE"),
	Value(PP, "PART_PORTAMENTO_SWITCH", 0x10, 0, 2, "OFF, ON, TONE"),
	Nibbles(PP, "PART_PORTAMENTO_TIME", 0x11, 0, 128, 2, "0 - 127, TONE"),
	Bipolar(PP, "PART_CUTOFF_OFFSET", 0x13, 0, 127, 64, "CC# 74"),
	Bipolar(PP, "PART_RESONANCE_OFFSET", 0x14, 0, 127, 64, "CC# 71"),
	Bipolar(PP, "PART_ATTACK_TIME_OFFSET", 0x15, 0, 127, 64, "CC# 73"),
	Bipolar(PP, "PART_DECAY_TIME_OFFSET", 0x16, 0, 127, 64, "CC# 75"),
	Bipolar(PP, "PART_RELEASE_TIME_OFFSET", 0x17, 0, 127, 64, "CC# 72"),
	Bipolar(PP, "PART_VIBRATO_RATE", 0x18, 0, 127, 64, "CC# 76"),
	Bipolar(PP, "PART_VIBRATO_DEPTH", 0x19, 0, 127, 64, "CC# 77"),
	Bipolar(PP, "PART_VIBRATO_DELAY", 0x1A, 0, 127, 64, "CC# 78"),
	Bipolar(PP, "PART_OCTAVE_SHIFT", 0x1B, 61, 67),
	Bipolar(PP, "PART_VELOCITY_SENS_OFFSET", 0x1C, 1, 127),
	Value(PP, "VELOCITY_RANGE_LOWER", 0x21, 1, 127),
	Value(PP, "VELOCITY_RANGE_UPPER", 0x22, 1, 127),
	Value(PP, "VELOCITY_FADE_WIDTH_LOWER", 0x23, 0, 127),
	Value(PP, "VELOCITY_FADE_WIDTH_UPPER", 0x24, 0, 127),
	Switch(PP, "MUTE_SWITCH", 0x25),
	Value(PP, "PART_DELAY_SEND_LEVEL", 0x2B, 0, 127, "CC# 94"),
	Value(PP, "PART_REVERB_SEND_LEVEL", 0x2C, 0, 127, "CC# 91"),
	Value(PP, "PART_OUTPUT_ASSIGN", 0x2D, 0, 4, "EFX1, EFX2, DLY, REV, DIR"),
	Value(PP, "PART_SCALE_TUNE_TYPE", 0x2F, 0, 8, "CUSTOM, EQUAL, JUST-MAJ, JUST-MIN, PYTHAGORE, KIRNBERGE, MEANTONE, WERCKMEIS, ARABIC"),
	Value(PP, "PART_SCALE_TUNE_KEY", 0x30, 0, 11, "C - B"),
	Bipolar(PP, "PART_SCALE_TUNE_C", 0x31, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_CS", 0x32, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_D", 0x33, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_DS", 0x34, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_E", 0x35, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_F", 0x36, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_FS", 0x37, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_G", 0x38, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_GS", 0x39, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_A", 0x3A, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_AS", 0x3B, 0, 127),
	Bipolar(PP, "PART_SCALE_TUNE_B", 0x3C, 0, 127),
	Switch(PP, "RECEIVE_PROGRAM_CHANGE", 0x3D),
	Switch(PP, "RECEIVE_BANK_SELECT", 0x3E),
	Switch(PP, "RECEIVE_PITCH_BEND", 0x3F),
	Switch(PP, "RECEIVE_POLYPHONIC_KEY_PRESSURE", 0x40),
	Switch(PP, "RECEIVE_CHANNEL_PRESSURE", 0x41),
	Switch(PP, "RECEIVE_MODULATION", 0x42),
	Switch(PP, "RECEIVE_VOLUME", 0x43),
	Switch(PP, "RECEIVE_PAN", 0x44),
	Switch(PP, "RECEIVE_EXPRESSION", 0x45),
	Switch(PP, "RECEIVE_HOLD_1", 0x46),
};

static constexpr Family PZ = Family::ProgramZone;
static constexpr ParameterDescriptor ProgramZone[] =
{
	Switch(PZ, "ARPEGGIO_SWITCH", 0x03, "Master arpeggiator"),
	Bipolar(PZ, "ZONAL_OCTAVE_SHIFT", 0x19, 61, 67),
};

static constexpr Family AR = Family::Arpeggio;
static constexpr ParameterDescriptor Arpeggio[] =
{
	Value(AR, "ARPEGGIO_GRID", 0x01, 0, 8, "04_, 08_, 08L, 08H, 08t, 16_, 16L, 16H, 16t"),
	Value(AR, "ARPEGGIO_DURATION", 0x02, 0, 9, "30% - 120%, FULL"),
	Switch(AR, "ARPEGGIO_SWITCH", 0x03),
	Value(AR, "ARPEGGIO_STYLE", 0x05, 0, 127),
	Value(AR, "ARPEGGIO_MOTIF", 0x06, 0, 11, "UP/L, UP/H, UP/_, dn/L, dn/H, dn/_, Ud/L, Ud/H, Ud/_, rn/L, rn/_, PHRASE"),
	Bipolar(AR, "ARPEGGIO_OCTAVE_RANGE", 0x07, 61, 67),
	Value(AR, "ARPEGGIO_ACCENT_RATE", 0x09, 0, 100),
	Value(AR, "ARPEGGIO_VELOCITY", 0x0A, 0, 127, "REAL, 1 - 127"),
};

std::span<const ParameterDescriptor> ProgramCommonParameters() { return ProgramCommon; }
std::span<const ParameterDescriptor> VocalFxParameters() { return VocalFx; }
std::span<const ParameterDescriptor> Effect1Parameters() { return Effect1; }
std::span<const ParameterDescriptor> Effect2Parameters() { return Effect2; }
std::span<const ParameterDescriptor> DelayParameters() { return Delay; }
std::span<const ParameterDescriptor> ReverbParameters() { return Reverb; }
std::span<const ParameterDescriptor> ProgramPartParameters() { return ProgramPart; }
std::span<const ParameterDescriptor> ProgramZoneParameters() { return ProgramZone; }
std::span<const ParameterDescriptor> ArpeggioParameters() { return Arpeggio; }

}
