// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "SysExParser.hpp"
#include "Codec.hpp"
#include "ParameterRegistry.hpp"

namespace JDXi
{

struct AreaAddress
{
	uint8_t msb, umb;
	TemporaryArea area;
};

// Tone areas as seen on the wire (part base + area offset)
static constexpr AreaAddress AreaAddresses[] =
{
	{ 0x01, 0x00, TemporaryArea::Setup },
	{ 0x02, 0x00, TemporaryArea::System },
	{ 0x18, 0x00, TemporaryArea::Program },
	{ 0x19, 0x01, TemporaryArea::Digital1 },
	{ 0x19, 0x21, TemporaryArea::Digital2 },
	{ 0x19, 0x42, TemporaryArea::Analog },
	{ 0x19, 0x70, TemporaryArea::Drum },
};

TemporaryArea ResolveTemporaryArea(const Address &address)
{
	for (const auto &entry : AreaAddresses)
	{
		if (entry.msb == address.MSB() && entry.umb == address.UMB())
			return entry.area;
	}
	return TemporaryArea::Unknown;
}

struct SectionMatch
{
	Family family;
	int partial;
	uint32_t startOffset;
};

// Finds the family section whose LMB range contains the message address
static std::optional<SectionMatch> ResolveSection(const ParameterRegistries &registries, TemporaryArea area, const Address &address)
{
	for (size_t i = 0; i < NUM_FAMILIES; i++)
	{
		const auto family = static_cast<Family>(i);
		const FamilyInfo &info = GetFamilyInfo(family);
		if (!(info.areaMask & AreaBit(area)))
			continue;

		const int numPages = registries.Get(family).NumPages();
		const int firstPartial = info.numPartials > 0 ? 1 : 0;
		for (int partial = firstPartial; partial <= info.numPartials; partial++)
		{
			const auto partialOffset = info.partialOffset(partial);
			if (!partialOffset)
				continue;
			const int firstLmb = info.areaOffset.lmb + partialOffset->lmb;
			const int lmb = address.LMB();
			if (lmb >= firstLmb && lmb < firstLmb + numPages)
				return SectionMatch{ family, partial, static_cast<uint32_t>((lmb - firstLmb) * 128 + address.LSB()) };
		}
	}
	return std::nullopt;
}

// Printable ASCII only, without leading and trailing blanks
static std::string ExtractName(const uint8_t *data, size_t length)
{
	std::string name;
	for (size_t i = 0; i < length; i++)
	{
		if (data[i] >= 0x20 && data[i] < 0x7F)
			name += static_cast<char>(data[i]);
	}
	const auto first = name.find_first_not_of(' ');
	if (first == std::string::npos)
		return {};
	const auto last = name.find_last_not_of(' ');
	return name.substr(first, last - first + 1);
}

SysExError ParseToneData(const ParameterRegistries &registries, const std::vector<uint8_t> &message, ParsedToneData &result)
{
	if (message.empty() || message.front() != SYSEX_START || message.back() != SYSEX_END)
		return SysExError::HeaderMismatch;
	if (message.size() < MIN_FRAME_SIZE)
		return SysExError::TruncatedMessage;
	if (!ValidateHeader(message) || message[POS_COMMAND] != CMD_DT1)
		return SysExError::HeaderMismatch;

	const std::vector<uint8_t> addressAndData(message.begin() + POS_ADDRESS, message.end() - 2);
	if (!ValidateChecksum(addressAndData, message[message.size() - 2]))
		return SysExError::ChecksumMismatch;

	ParsedToneData parsed;
	parsed.address = Address::FromBytes(message.data() + POS_ADDRESS);
	parsed.area = ResolveTemporaryArea(parsed.address);
	const std::vector<uint8_t> data(message.begin() + POS_DATA, message.end() - 2);

	const auto match = ResolveSection(registries, parsed.area, parsed.address);
	if (!match)
	{
		// Unknown sections are reported, not rejected
		parsed.startOffset = parsed.address.LSB();
		for (uint32_t i = 0; i < data.size(); i++)
			parsed.unmatchedOffsets.push_back(parsed.startOffset + i);
		result = std::move(parsed);
		return SysExError::None;
	}

	const ParameterRegistry &registry = registries.Get(match->family);
	const FamilyInfo &info = registry.GetInfo();
	parsed.family = match->family;
	parsed.section = info.section;
	parsed.partial = match->partial;
	parsed.startOffset = match->startOffset;

	if (info.hasName && parsed.startOffset == 0 && data.size() >= TONE_NAME_LENGTH)
		parsed.name = ExtractName(data.data(), TONE_NAME_LENGTH);

	const uint32_t dataEnd = parsed.startOffset + static_cast<uint32_t>(data.size());
	for (const auto &descriptor : registry.Descriptors())
	{
		const uint32_t index = descriptor.DataIndex();
		if (index < parsed.startOffset || index + descriptor.size > dataEnd)
		{
			parsed.failures.push_back(descriptor.name);
			continue;
		}

		const uint8_t *value = data.data() + (index - parsed.startOffset);
		int32_t rawValue = 0;
		if (descriptor.size <= 1)
			rawValue = *value;
		else
			rawValue = static_cast<int32_t>(DecodeNibbles(value, descriptor.size));

		parsed.values[descriptor.name] = ConvertFromMidi(descriptor, ValidateValue(descriptor, rawValue));
		parsed.successes.push_back(descriptor.name);
	}

	for (uint32_t index = parsed.startOffset; index < dataEnd; index++)
	{
		if (!registry.GetByDataIndex(index))
			parsed.unmatchedOffsets.push_back(index);
	}

	result = std::move(parsed);
	return SysExError::None;
}

}
