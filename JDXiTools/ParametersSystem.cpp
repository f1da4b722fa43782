// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterTables.hpp"

namespace JDXi
{

using namespace Table;

static constexpr Family SC = Family::SystemCommon;
static constexpr ParameterDescriptor SystemCommon[] =
{
	// 1/10 cent steps
	BipolarNibbles(SC, "MASTER_TUNE", 0x00, 24, 2024, 1024, "-100.0 - +100.0 cents"),
	Bipolar(SC, "MASTER_KEY_SHIFT", 0x04, 40, 88),
	Value(SC, "MASTER_LEVEL", 0x05, 0, 127),
};

std::span<const ParameterDescriptor> SystemCommonParameters()
{
	return SystemCommon;
}

std::span<const ParameterDescriptor> GetParameterTable(Family family)
{
	switch (family)
	{
	case Family::DigitalCommon: return DigitalCommonParameters();
	case Family::DigitalPartial: return DigitalPartialParameters();
	case Family::DigitalModify: return DigitalModifyParameters();
	case Family::Analog: return AnalogParameters();
	case Family::DrumCommon: return DrumCommonParameters();
	case Family::DrumPartial: return DrumPartialParameters();
	case Family::ProgramCommon: return ProgramCommonParameters();
	case Family::VocalFx: return VocalFxParameters();
	case Family::Effect1: return Effect1Parameters();
	case Family::Effect2: return Effect2Parameters();
	case Family::Delay: return DelayParameters();
	case Family::Reverb: return ReverbParameters();
	case Family::ProgramPart: return ProgramPartParameters();
	case Family::ProgramZone: return ProgramZoneParameters();
	case Family::Arpeggio: return ArpeggioParameters();
	case Family::SystemCommon: return SystemCommonParameters();
	}
	return {};
}

}
