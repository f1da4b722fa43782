// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "Parameter.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace JDXi
{

static std::optional<AddressOffset> SingleSectionOffset(int)
{
	return AddressOffset{};
}

static std::optional<AddressOffset> DigitalPartialOffset(int partial)
{
	if (partial < 1 || partial > NUM_DIGITAL_PARTIALS)
		return std::nullopt;
	return AddressOffset{ 0, 0, partial - 1, 0 };
}

// Every drum key occupies two LMB pages
static std::optional<AddressOffset> DrumPartialOffset(int partial)
{
	if (partial < 1 || partial > NUM_DRUM_KEYS)
		return std::nullopt;
	return AddressOffset{ 0, 0, (partial - 1) * 2, 0 };
}

static std::optional<AddressOffset> ProgramPartOffset(int partial)
{
	if (partial < 1 || partial > NUM_PROGRAM_PARTS)
		return std::nullopt;
	return AddressOffset{ 0, 0, partial - 1, 0 };
}

static constexpr uint8_t DigitalAreas = AreaBit(TemporaryArea::Digital1) | AreaBit(TemporaryArea::Digital2);
static constexpr uint8_t AnalogArea = AreaBit(TemporaryArea::Analog);
static constexpr uint8_t DrumArea = AreaBit(TemporaryArea::Drum);
static constexpr uint8_t ProgramArea = AreaBit(TemporaryArea::Program);
static constexpr uint8_t SystemArea = AreaBit(TemporaryArea::System);

static const FamilyInfo FamilyInfos[NUM_FAMILIES] =
{
	{ Family::DigitalCommon,  "Digital Common",  Section::Common,      DigitalAreas, { 0, 0x01, 0x00, 0 }, 0,                    SingleSectionOffset,  true },
	{ Family::DigitalPartial, "Digital Partial", Section::Partial,     DigitalAreas, { 0, 0x01, 0x20, 0 }, NUM_DIGITAL_PARTIALS, DigitalPartialOffset, false },
	{ Family::DigitalModify,  "Digital Modify",  Section::Modify,      DigitalAreas, { 0, 0x01, 0x50, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::Analog,         "Analog",          Section::Common,      AnalogArea,   { 0, 0x02, 0x00, 0 }, 0,                    SingleSectionOffset,  true },
	{ Family::DrumCommon,     "Drum Common",     Section::Common,      DrumArea,     { 0, 0x10, 0x00, 0 }, 0,                    SingleSectionOffset,  true },
	{ Family::DrumPartial,    "Drum Partial",    Section::Partial,     DrumArea,     { 0, 0x10, 0x2E, 0 }, NUM_DRUM_KEYS,        DrumPartialOffset,    true },
	{ Family::ProgramCommon,  "Program Common",  Section::Common,      ProgramArea,  { 0, 0x00, 0x00, 0 }, 0,                    SingleSectionOffset,  true },
	{ Family::VocalFx,        "Vocal FX",        Section::VocalEffect, ProgramArea,  { 0, 0x00, 0x01, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::Effect1,        "Effect 1",        Section::Effect1,     ProgramArea,  { 0, 0x00, 0x02, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::Effect2,        "Effect 2",        Section::Effect2,     ProgramArea,  { 0, 0x00, 0x04, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::Delay,          "Delay",           Section::Delay,       ProgramArea,  { 0, 0x00, 0x06, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::Reverb,         "Reverb",          Section::Reverb,      ProgramArea,  { 0, 0x00, 0x08, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::ProgramPart,    "Program Part",    Section::Part,        ProgramArea,  { 0, 0x00, 0x20, 0 }, NUM_PROGRAM_PARTS,    ProgramPartOffset,    false },
	{ Family::ProgramZone,    "Program Zone",    Section::Zone,        ProgramArea,  { 0, 0x00, 0x30, 0 }, NUM_PROGRAM_PARTS,    ProgramPartOffset,    false },
	{ Family::Arpeggio,       "Arpeggio",        Section::Controller,  ProgramArea,  { 0, 0x00, 0x40, 0 }, 0,                    SingleSectionOffset,  false },
	{ Family::SystemCommon,   "System Common",   Section::Common,      SystemArea,   { 0, 0x00, 0x00, 0 }, 0,                    SingleSectionOffset,  false },
};

static constexpr std::pair<TemporaryArea, Address> PartBases[] =
{
	{ TemporaryArea::Setup, BASE_ADDR_SETUP },
	{ TemporaryArea::System, BASE_ADDR_SYSTEM },
	{ TemporaryArea::Program, BASE_ADDR_PROGRAM_TEMPORARY },
	{ TemporaryArea::Digital1, BASE_ADDR_DIGITAL1_TEMPORARY },
	{ TemporaryArea::Digital2, BASE_ADDR_DIGITAL2_TEMPORARY },
	{ TemporaryArea::Analog, BASE_ADDR_ANALOG_TEMPORARY },
	{ TemporaryArea::Drum, BASE_ADDR_DRUM_TEMPORARY },
};

static constexpr const char *DrumKeyNames[NUM_DRUM_KEYS] =
{
	"BD1", "RIM", "BD2", "CLAP", "BD3", "SD1", "CHH", "SD2", "PHH", "SD3", "OHH", "SD4",
	"TOM1", "PRC1", "TOM2", "PRC2", "TOM3", "PRC3", "CYM1", "PRC4", "CYM2", "PRC5", "CYM3", "HIT",
	"OTH1", "OTH2", "D4", "Eb4", "E4", "F4", "F#4", "G4", "G#4", "A4", "Bb4", "B4",
	"C5",
};

const FamilyInfo &GetFamilyInfo(Family family)
{
	return FamilyInfos[static_cast<size_t>(family)];
}

std::optional<AddressOffset> GetOffsetForPartial(Family family, int partial)
{
	return GetFamilyInfo(family).partialOffset(partial);
}

std::optional<Address> GetPartBase(TemporaryArea area)
{
	for (const auto &[baseArea, address] : PartBases)
	{
		if (baseArea == area)
			return address;
	}
	return std::nullopt;
}

TemporaryArea GetPartBaseArea(const Address &address)
{
	for (const auto &[area, base] : PartBases)
	{
		if (base.MSB() == address.MSB() && base.UMB() == address.UMB())
			return area;
	}
	return TemporaryArea::Unknown;
}

int32_t ValidateValue(const ParameterDescriptor &descriptor, int32_t rawValue)
{
	return std::clamp(rawValue, descriptor.minValue, descriptor.maxValue);
}

static int64_t RoundedDivide(int64_t value, int64_t divisor)
{
	if (divisor <= 1)
		return value;
	if (value >= 0)
		return (value + divisor / 2) / divisor;
	else
		return -((-value + divisor / 2) / divisor);
}

// Results outside the int32_t range saturate
static int32_t SaturateToInt32(int64_t value)
{
	return static_cast<int32_t>(std::clamp<int64_t>(value, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));
}

int32_t ConvertToMidi(const ParameterDescriptor &descriptor, int32_t displayValue)
{
	if (descriptor.bipolarCenter)
		return SaturateToInt32(int64_t{*descriptor.bipolarCenter} + RoundedDivide(displayValue, descriptor.displayStep));
	else
		return SaturateToInt32(int64_t{descriptor.minValue} + RoundedDivide(int64_t{displayValue} - descriptor.displayMin, descriptor.displayStep));
}

int32_t ConvertFromMidi(const ParameterDescriptor &descriptor, int32_t rawValue)
{
	if (descriptor.bipolarCenter)
		return SaturateToInt32((int64_t{rawValue} - *descriptor.bipolarCenter) * descriptor.displayStep);
	else
		return SaturateToInt32(descriptor.displayMin + (int64_t{rawValue} - descriptor.minValue) * descriptor.displayStep);
}

uint32_t PayloadLimit(const ParameterDescriptor &descriptor)
{
	if (descriptor.size <= 1)
		return 0x7F;
	return (1u << (descriptor.size * 4)) - 1u;
}

const char *FamilyName(Family family)
{
	return GetFamilyInfo(family).name;
}

const char *AreaName(TemporaryArea area)
{
	static constexpr const char *AreaNames[] = { "Unknown", "Setup", "System", "Temporary Program", "Digital Synth 1", "Digital Synth 2", "Analog Synth", "Drum Kit" };
	return SafeTable(AreaNames, static_cast<uint8_t>(area));
}

const char *SectionName(Section section)
{
	static constexpr const char *SectionNames[] = { "Unknown", "Common", "Partial", "Modify", "Vocal Effect", "Effect 1", "Effect 2", "Delay", "Reverb", "Part", "Zone", "Controller" };
	return SafeTable(SectionNames, static_cast<uint8_t>(section));
}

const char *DrumKeyName(int partial)
{
	if (partial < 1 || partial > NUM_DRUM_KEYS)
		return "???";
	return DrumKeyNames[partial - 1];
}

}
