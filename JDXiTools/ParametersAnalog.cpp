// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterTables.hpp"

namespace JDXi
{

using namespace Table;

static constexpr Family AN = Family::Analog;
static constexpr ParameterDescriptor Analog[] =
{
	Character(AN, "TONE_NAME_1", 0x00),
	Character(AN, "TONE_NAME_2", 0x01),
	Character(AN, "TONE_NAME_3", 0x02),
	Character(AN, "TONE_NAME_4", 0x03),
	Character(AN, "TONE_NAME_5", 0x04),
	Character(AN, "TONE_NAME_6", 0x05),
	Character(AN, "TONE_NAME_7", 0x06),
	Character(AN, "TONE_NAME_8", 0x07),
	Character(AN, "TONE_NAME_9", 0x08),
	Character(AN, "TONE_NAME_10", 0x09),
	Character(AN, "TONE_NAME_11", 0x0A),
	Character(AN, "TONE_NAME_12", 0x0B),

	// LFO
	Value(AN, "LFO_SHAPE", 0x0D, 0, 5, "TRI, SIN, SAW, SQR, S&H, RND"),
	Value(AN, "LFO_RATE", 0x0E, 0, 127),
	Value(AN, "LFO_FADE_TIME", 0x0F, 0, 127),
	Switch(AN, "LFO_TEMPO_SYNC_SWITCH", 0x10),
	Value(AN, "LFO_TEMPO_SYNC_NOTE", 0x11, 0, 19),
	Bipolar(AN, "LFO_PITCH_DEPTH", 0x12, 1, 127),
	Bipolar(AN, "LFO_FILTER_DEPTH", 0x13, 1, 127),
	Bipolar(AN, "LFO_AMP_DEPTH", 0x14, 1, 127),
	Switch(AN, "LFO_KEY_TRIGGER", 0x15),

	// Oscillator
	Value(AN, "OSC_WAVEFORM", 0x16, 0, 2, "SAW, TRI, PW-SQR"),
	Bipolar(AN, "OSC_PITCH_COARSE", 0x17, 40, 88),
	Bipolar(AN, "OSC_PITCH_FINE", 0x18, 14, 114),
	Value(AN, "OSC_PULSE_WIDTH", 0x19, 0, 127),
	Value(AN, "OSC_PULSE_WIDTH_MOD_DEPTH", 0x1A, 0, 127),
	Bipolar(AN, "OSC_PITCH_ENV_VELOCITY_SENS", 0x1B, 1, 127),
	Value(AN, "OSC_PITCH_ENV_ATTACK_TIME", 0x1C, 0, 127),
	Value(AN, "OSC_PITCH_ENV_DECAY", 0x1D, 0, 127),
	Bipolar(AN, "OSC_PITCH_ENV_DEPTH", 0x1E, 1, 127),
	Value(AN, "SUB_OSCILLATOR_TYPE", 0x1F, 0, 2, "OFF, OCT -1, OCT -2"),

	// Filter
	Value(AN, "FILTER_SWITCH", 0x20, 0, 1, "BYPASS, LPF"),
	Value(AN, "FILTER_CUTOFF", 0x21, 0, 127),
	Scaled(AN, "FILTER_CUTOFF_KEYFOLLOW", 0x22, 54, 74, 64, 10),
	Value(AN, "FILTER_RESONANCE", 0x23, 0, 127),
	Bipolar(AN, "FILTER_ENV_VELOCITY_SENS", 0x24, 1, 127),
	Value(AN, "FILTER_ENV_ATTACK_TIME", 0x25, 0, 127),
	Value(AN, "FILTER_ENV_DECAY_TIME", 0x26, 0, 127),
	Value(AN, "FILTER_ENV_SUSTAIN_LEVEL", 0x27, 0, 127),
	Value(AN, "FILTER_ENV_RELEASE_TIME", 0x28, 0, 127),
	Bipolar(AN, "FILTER_ENV_DEPTH", 0x29, 1, 127),

	// Amp
	Value(AN, "AMP_LEVEL", 0x2A, 0, 127),
	Scaled(AN, "AMP_LEVEL_KEYFOLLOW", 0x2B, 54, 74, 64, 10),
	Bipolar(AN, "AMP_LEVEL_VELOCITY_SENS", 0x2C, 1, 127),
	Value(AN, "AMP_ENV_ATTACK_TIME", 0x2D, 0, 127),
	Value(AN, "AMP_ENV_DECAY_TIME", 0x2E, 0, 127),
	Value(AN, "AMP_ENV_SUSTAIN_LEVEL", 0x2F, 0, 127),
	Value(AN, "AMP_ENV_RELEASE_TIME", 0x30, 0, 127),

	Switch(AN, "PORTAMENTO_SWITCH", 0x31),
	Value(AN, "PORTAMENTO_TIME", 0x32, 0, 127),
	Switch(AN, "LEGATO_SWITCH", 0x33),
	Bipolar(AN, "OCTAVE_SHIFT", 0x34, 61, 67),
	Value(AN, "PITCH_BEND_RANGE_UP", 0x35, 0, 24),
	Value(AN, "PITCH_BEND_RANGE_DOWN", 0x36, 0, 24),

	// Modulation wheel assignment
	Bipolar(AN, "LFO_PITCH_MODULATION_CONTROL", 0x38, 1, 127),
	Bipolar(AN, "LFO_FILTER_MODULATION_CONTROL", 0x39, 1, 127),
	Bipolar(AN, "LFO_AMP_MODULATION_CONTROL", 0x3A, 1, 127),
	Bipolar(AN, "LFO_RATE_MODULATION_CONTROL", 0x3B, 1, 127),
};

std::span<const ParameterDescriptor> AnalogParameters()
{
	return Analog;
}

}
