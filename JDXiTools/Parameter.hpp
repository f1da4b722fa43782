// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include "Address.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace JDXi
{

enum class Family : uint8_t
{
	DigitalCommon,
	DigitalPartial,
	DigitalModify,
	Analog,
	DrumCommon,
	DrumPartial,
	ProgramCommon,
	VocalFx,
	Effect1,
	Effect2,
	Delay,
	Reverb,
	ProgramPart,
	ProgramZone,
	Arpeggio,
	SystemCommon,
};
inline constexpr size_t NUM_FAMILIES = static_cast<size_t>(Family::SystemCommon) + 1;

enum class TemporaryArea : uint8_t
{
	Unknown,
	Setup,
	System,
	Program,
	Digital1,
	Digital2,
	Analog,
	Drum,
};

enum class Section : uint8_t
{
	Unknown,
	Common,
	Partial,
	Modify,
	VocalEffect,
	Effect1,
	Effect2,
	Delay,
	Reverb,
	Part,
	Zone,
	Controller,
};

struct ParameterDescriptor
{
	const char *name;
	Family family;
	uint16_t offset;  // Inside the section, as LMB/LSB pair: 0x0102 = LMB + 1, LSB 0x02
	int32_t minValue, maxValue;
	int32_t displayMin, displayMax;
	std::optional<int32_t> bipolarCenter;  // Raw value shown as 0
	int32_t displayStep = 1;
	bool isSwitch = false;
	uint8_t size = 1;  // 1 = plain data byte, 2 or 4 = value split into nibbles
	const char *tooltip = nullptr;

	// Position of the first byte in a dump that starts at the beginning of the section
	constexpr uint32_t DataIndex() const noexcept
	{
		return ((offset >> 8) << 7) | (offset & 0x7F);
	}

	constexpr AddressOffset Offset() const noexcept
	{
		return { 0, 0, offset >> 8, offset & 0xFF };
	}

	constexpr bool IsBipolar() const noexcept { return bipolarCenter.has_value(); }
};

// Returns nothing if the partial number is not valid for the family
using PartialOffsetFunc = std::optional<AddressOffset> (*)(int partial);

struct FamilyInfo
{
	Family family;
	const char *name;
	Section section;
	uint8_t areaMask;
	AddressOffset areaOffset;  // From the part base to the family's first section
	int numPartials;           // 0 if the family is not addressed per partial
	PartialOffsetFunc partialOffset;
	bool hasName;              // Section starts with a 12 character name
};

constexpr uint8_t AreaBit(TemporaryArea area) noexcept
{
	return static_cast<uint8_t>(1u << static_cast<uint8_t>(area));
}

inline constexpr size_t TONE_NAME_LENGTH = 12;
inline constexpr int NUM_DIGITAL_PARTIALS = 3;
inline constexpr int NUM_DRUM_KEYS = 37;
inline constexpr int FIRST_DRUM_KEY = 36;
inline constexpr int NUM_PROGRAM_PARTS = 4;

const FamilyInfo &GetFamilyInfo(Family family);
std::optional<AddressOffset> GetOffsetForPartial(Family family, int partial);

// Part base address of a temporary area, and the reverse lookup by (MSB, UMB)
std::optional<Address> GetPartBase(TemporaryArea area);
TemporaryArea GetPartBaseArea(const Address &address);

int32_t ValidateValue(const ParameterDescriptor &descriptor, int32_t rawValue);
int32_t ConvertToMidi(const ParameterDescriptor &descriptor, int32_t displayValue);
int32_t ConvertFromMidi(const ParameterDescriptor &descriptor, int32_t rawValue);

// Largest raw value that fits into the descriptor's payload
uint32_t PayloadLimit(const ParameterDescriptor &descriptor);

const char *FamilyName(Family family);
const char *AreaName(TemporaryArea area);
const char *SectionName(Section section);
// Drum partial 1 is key 36 ("BD1")
const char *DrumKeyName(int partial);

}
