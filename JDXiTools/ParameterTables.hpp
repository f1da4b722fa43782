// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include "Parameter.hpp"

#include <span>

namespace JDXi
{

// Static descriptor tables, one per family
std::span<const ParameterDescriptor> DigitalCommonParameters();
std::span<const ParameterDescriptor> DigitalPartialParameters();
std::span<const ParameterDescriptor> DigitalModifyParameters();
std::span<const ParameterDescriptor> AnalogParameters();
std::span<const ParameterDescriptor> DrumCommonParameters();
std::span<const ParameterDescriptor> DrumPartialParameters();
std::span<const ParameterDescriptor> ProgramCommonParameters();
std::span<const ParameterDescriptor> VocalFxParameters();
std::span<const ParameterDescriptor> Effect1Parameters();
std::span<const ParameterDescriptor> Effect2Parameters();
std::span<const ParameterDescriptor> DelayParameters();
std::span<const ParameterDescriptor> ReverbParameters();
std::span<const ParameterDescriptor> ProgramPartParameters();
std::span<const ParameterDescriptor> ProgramZoneParameters();
std::span<const ParameterDescriptor> ArpeggioParameters();
std::span<const ParameterDescriptor> SystemCommonParameters();

std::span<const ParameterDescriptor> GetParameterTable(Family family);

namespace Table
{

constexpr ParameterDescriptor Value(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, minValue, maxValue, std::nullopt, 1, false, 1, tooltip };
}

constexpr ParameterDescriptor Switch(Family family, const char *name, uint16_t offset, const char *tooltip = nullptr)
{
	return { name, family, offset, 0, 1, 0, 1, std::nullopt, 1, true, 1, tooltip };
}

// Display range is the raw range moved so that the center shows as 0
constexpr ParameterDescriptor Bipolar(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, int32_t center = 64, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, minValue - center, maxValue - center, center, 1, false, 1, tooltip };
}

// Bipolar, each raw step is worth several display units (e.g. key follow in steps of 10)
constexpr ParameterDescriptor Scaled(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, int32_t center, int32_t step, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, (minValue - center) * step, (maxValue - center) * step, center, step, false, 1, tooltip };
}

// Plain range shown with a different origin (e.g. 0...3 shown as 1...4)
constexpr ParameterDescriptor Shifted(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, int32_t displayMin, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, displayMin, displayMin + (maxValue - minValue), std::nullopt, 1, false, 1, tooltip };
}

// Values transmitted as 2 or 4 nibbles
constexpr ParameterDescriptor Nibbles(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, uint8_t size, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, minValue, maxValue, std::nullopt, 1, false, size, tooltip };
}

constexpr ParameterDescriptor BipolarNibbles(Family family, const char *name, uint16_t offset, int32_t minValue, int32_t maxValue, int32_t center, const char *tooltip = nullptr)
{
	return { name, family, offset, minValue, maxValue, minValue - center, maxValue - center, center, 1, false, 4, tooltip };
}

constexpr ParameterDescriptor Character(Family family, const char *name, uint16_t offset)
{
	return Value(family, name, offset, 32, 127);
}

}

}
