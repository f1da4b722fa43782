// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "SysEx.hpp"
#include "Codec.hpp"
#include "ParameterRegistry.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <iostream>

namespace JDXi
{

const char *ErrorName(SysExError error)
{
	static constexpr const char *ErrorNames[] = { "None", "Header mismatch", "Truncated message", "Checksum mismatch", "Unknown parameter", "Value out of range", "Address resolution failed" };
	return SafeTable(ErrorNames, static_cast<uint8_t>(error));
}

uint8_t Checksum(const uint8_t *data, size_t size)
{
	uint32_t sum = 0;
	for (size_t i = 0; i < size; i++)
		sum += data[i];
	return static_cast<uint8_t>((0x80 - (sum & 0x7F)) & 0x7F);
}

uint8_t Checksum(const std::vector<uint8_t> &addressAndData)
{
	return Checksum(addressAndData.data(), addressAndData.size());
}

bool ValidateChecksum(const std::vector<uint8_t> &addressAndData, uint8_t checksum)
{
	return Checksum(addressAndData) == checksum;
}

bool ValidateFrame(const std::vector<uint8_t> &message)
{
	return message.size() >= MIN_FRAME_SIZE
		&& message.front() == SYSEX_START
		&& message.back() == SYSEX_END;
}

bool ValidateHeader(const std::vector<uint8_t> &message)
{
	if (message.size() < POS_COMMAND)
		return false;
	return message[1] == ROLAND_ID
		&& message[2] == DEVICE_ID
		&& std::equal(MODEL_ID.begin(), MODEL_ID.end(), message.begin() + 3);
}

SysExMessage::SysExMessage(uint8_t command, const Address &address, std::vector<uint8_t> data)
	: m_command{command}
	, m_address{address}
	, m_data{std::move(data)}
{
	const auto addressBytes = m_address.ToBytes();
	std::vector<uint8_t> addressAndData(addressBytes.begin(), addressBytes.end());
	addressAndData.insert(addressAndData.end(), m_data.begin(), m_data.end());
	m_checksum = Checksum(addressAndData);
}

std::vector<uint8_t> SysExMessage::ToBytes() const
{
	std::vector<uint8_t> bytes;
	bytes.reserve(MIN_FRAME_SIZE + m_data.size());
	bytes.push_back(SYSEX_START);
	bytes.push_back(ROLAND_ID);
	bytes.push_back(DEVICE_ID);
	bytes.insert(bytes.end(), MODEL_ID.begin(), MODEL_ID.end());
	bytes.push_back(m_command);
	const auto addressBytes = m_address.ToBytes();
	bytes.insert(bytes.end(), addressBytes.begin(), addressBytes.end());
	bytes.insert(bytes.end(), m_data.begin(), m_data.end());
	bytes.push_back(m_checksum);
	bytes.push_back(SYSEX_END);
	return bytes;
}

std::string SysExMessage::ToHexString() const
{
	return JDXi::ToHexString(ToBytes());
}

SysExError ComposeDataSet(const Address &address, const std::vector<uint8_t> &data, SysExMessage &message)
{
	if (!address.IsSevenBitSafe())
		return SysExError::AddressResolution;

	SysExMessage composed{CMD_DT1, address, NibbleData(data)};
	const auto bytes = composed.ToBytes();
	if (!ValidateFrame(bytes) || !ValidateHeader(bytes))
		return SysExError::HeaderMismatch;

	message = std::move(composed);
	return SysExError::None;
}

SysExError ComposeRequest(const Address &address, uint32_t size, SysExMessage &message)
{
	if (!address.IsSevenBitSafe())
		return SysExError::AddressResolution;

	const auto sizeBytes = EncodeRoland7Bit(size);
	message = SysExMessage{CMD_RQ1, address, std::vector<uint8_t>(sizeBytes.begin(), sizeBytes.end())};
	return SysExError::None;
}

SysExError ResolveSectionAddress(const Address &baseAddress, Family family, std::optional<int> partial, Address &sectionAddress)
{
	const TemporaryArea area = GetPartBaseArea(baseAddress);
	const FamilyInfo &info = GetFamilyInfo(family);
	if (area == TemporaryArea::Unknown || !(info.areaMask & AreaBit(area)))
		return SysExError::UnknownParameter;

	AddressOffset partialOffset;
	if (info.numPartials > 0)
	{
		if (!partial)
			return SysExError::AddressResolution;
		const auto offset = info.partialOffset(*partial);
		if (!offset)
			return SysExError::AddressResolution;
		partialOffset = *offset;
	}

	const auto address = baseAddress.Offset(info.areaOffset + partialOffset);
	if (!address)
		return SysExError::AddressResolution;
	sectionAddress = *address;
	return SysExError::None;
}

SysExError Compose(const ParameterRegistries &registries, const Address &baseAddress, const ParameterDescriptor &descriptor, int32_t displayValue, std::optional<int> partial, SysExMessage &message)
{
	if (!registries.FindOwner(descriptor))
		return SysExError::UnknownParameter;

	Address sectionAddress;
	if (const auto error = ResolveSectionAddress(baseAddress, descriptor.family, partial, sectionAddress); error != SysExError::None)
		return error;
	const auto address = sectionAddress.Offset(descriptor.Offset());
	if (!address || !address->IsSevenBitSafe())
		return SysExError::AddressResolution;

	const int32_t rawValue = ConvertToMidi(descriptor, displayValue);
	if (rawValue < 0 || static_cast<uint32_t>(rawValue) > PayloadLimit(descriptor))
		return SysExError::ValueOutOfRange;
	const int32_t value = ValidateValue(descriptor, rawValue);
	if (value != rawValue)
		std::cerr << descriptor.name << ": " << displayValue << " is out of range, using " << ConvertFromMidi(descriptor, value) << std::endl;

	std::vector<uint8_t> data;
	if (descriptor.size <= 1)
		data.push_back(static_cast<uint8_t>(value));
	else
		data = EncodeNibbles(static_cast<uint32_t>(value), descriptor.size);

	return ComposeDataSet(*address, data, message);
}

SysExError Compose(const ParameterRegistries &registries, const Address &baseAddress, Family family, std::string_view name, int32_t displayValue, std::optional<int> partial, SysExMessage &message)
{
	const ParameterDescriptor *descriptor = registries.GetByName(family, name);
	if (!descriptor)
		return SysExError::UnknownParameter;
	return Compose(registries, baseAddress, *descriptor, displayValue, partial, message);
}

SysExError ComposeSectionRequest(const ParameterRegistries &registries, const Address &baseAddress, Family family, std::optional<int> partial, SysExMessage &message)
{
	Address sectionAddress;
	if (const auto error = ResolveSectionAddress(baseAddress, family, partial, sectionAddress); error != SysExError::None)
		return error;

	// 00 00 01 43 for a drum key: the size is sent as 7-bit groups
	return ComposeRequest(sectionAddress, registries.Get(family).DataSize(), message);
}

}
