// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "JDXiTools.hpp"
#include "DeviceInfo.hpp"
#include "ParameterRegistry.hpp"
#include "SysExParser.hpp"
#include "Utils.hpp"

#include <iostream>
#include <string_view>

namespace JDXi
{

static void PrintProperty(const char *name, bool value)
{
	std::cout << name << ": " << (value ? "ON" : "OFF") << std::endl;
}

static void PrintProperty(const char *name, int value)
{
	std::cout << name << ": " << value << std::endl;
}

static void PrintProperty(const char *name, const char *value)
{
	std::cout << name << ": " << value << std::endl;
}

static void PrintProperty(const char *name, const std::string_view value)
{
	std::cout << name << ": " << value << std::endl;
}

std::string DescribeSection(const ParsedToneData &data)
{
	std::string description = data.address.ToHexString() + " " + AreaName(data.area);
	if (!data.family)
		return description + " / Unknown section";

	description += " / ";
	description += FamilyName(*data.family);
	if (*data.family == Family::DrumPartial)
		description += " " + std::to_string(data.partial) + " (" + DrumKeyName(data.partial) + ")";
	else if (data.partial > 0)
		description += " " + std::to_string(data.partial);
	return description;
}

void PrintToneData(const ParameterRegistries &registries, const ParsedToneData &data)
{
	PrintProperty("Address", data.address.ToHexString());
	PrintProperty("Area", AreaName(data.area));
	PrintProperty("Section", SectionName(data.section));
	if (!data.family)
	{
		std::cout << "Unknown section, " << data.unmatchedOffsets.size() << " bytes not decoded" << std::endl;
		return;
	}

	PrintProperty("Family", FamilyName(*data.family));
	if (*data.family == Family::DrumPartial)
		std::cout << "Key: " << data.partial << " (" << DrumKeyName(data.partial) << ", note " << (FIRST_DRUM_KEY + data.partial - 1) << ")" << std::endl;
	else if (data.partial > 0)
		PrintProperty("Partial", data.partial);
	if (data.startOffset)
		PrintProperty("Start offset", static_cast<int>(data.startOffset));
	if (!data.name.empty())
		PrintProperty("Name", std::string_view{data.name});

	const ParameterRegistry &registry = registries.Get(*data.family);
	for (const auto &name : data.successes)
	{
		const auto value = data.values.find(name);
		if (value == data.values.end())
			continue;
		const std::string label = "\t" + name;
		const ParameterDescriptor *descriptor = registry.GetByName(name);
		if (descriptor && descriptor->isSwitch)
			PrintProperty(label.c_str(), value->second != 0);
		else
			PrintProperty(label.c_str(), static_cast<int>(value->second));
	}

	if (!data.failures.empty())
		std::cout << data.failures.size() << " parameters not covered by this message" << std::endl;
	if (!data.unmatchedOffsets.empty())
	{
		std::cout << "Unmatched offsets:";
		for (const auto offset : data.unmatchedOffsets)
			std::cout << ' ' << offset;
		std::cout << std::endl;
	}
}

void PrintDeviceInfo(const DeviceInfo &info)
{
	PrintProperty("Device", std::string_view{info.ToString()});
	PrintProperty("Device ID", static_cast<int>(info.deviceId));
	PrintProperty("Manufacturer", std::string_view{ToHexString(&info.manufacturerId, 1)});
	PrintProperty("Family code", std::string_view{ToHexString(info.familyCode)});
	PrintProperty("Revision", std::string_view{ToHexString(info.revision.data(), info.revision.size())});
	PrintProperty("Firmware", std::string_view{info.VersionString()});
}

}
