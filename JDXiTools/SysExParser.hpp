// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include "Address.hpp"
#include "Parameter.hpp"
#include "SysEx.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace JDXi
{

class ParameterRegistries;

struct ParsedToneData
{
	Address address;
	TemporaryArea area = TemporaryArea::Unknown;
	Section section = Section::Unknown;
	int partial = 0;                   // Partial, drum key, part or zone number (1-based), 0 if not applicable
	std::optional<Family> family;
	uint32_t startOffset = 0;          // Position of the first data byte inside the section
	std::string name;                  // Empty if the section has no name or the message does not cover it
	std::map<std::string, int32_t> values;  // Display values
	std::vector<std::string> successes;
	std::vector<std::string> failures;
	std::vector<uint32_t> unmatchedOffsets;  // Data positions no descriptor covers
};

// Temporary area from the (MSB, UMB) pair of a device address, e.g. 19 42 = Analog
TemporaryArea ResolveTemporaryArea(const Address &address);

// Decodes a DT1 message. Framing, header and checksum errors reject the whole message,
// everything after that is best effort and recorded in the result.
SysExError ParseToneData(const ParameterRegistries &registries, const std::vector<uint8_t> &message, ParsedToneData &result);

}
