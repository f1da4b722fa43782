// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include "Address.hpp"
#include "Parameter.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace JDXi
{

class ParameterRegistries;

inline constexpr uint8_t SYSEX_START = 0xF0;
inline constexpr uint8_t SYSEX_END = 0xF7;
inline constexpr uint8_t ROLAND_ID = 0x41;
inline constexpr uint8_t DEVICE_ID = 0x10;
inline constexpr std::array<uint8_t, 4> MODEL_ID = { 0x00, 0x00, 0x00, 0x0E };
inline constexpr uint8_t CMD_RQ1 = 0x11;
inline constexpr uint8_t CMD_DT1 = 0x12;

// F0 41 10 00 00 00 0E cmd a a a a [data] sum F7
inline constexpr size_t POS_COMMAND = 7;
inline constexpr size_t POS_ADDRESS = 8;
inline constexpr size_t POS_DATA = 12;
inline constexpr size_t MIN_FRAME_SIZE = 14;

enum class SysExError
{
	None,
	HeaderMismatch,
	TruncatedMessage,
	ChecksumMismatch,
	UnknownParameter,
	ValueOutOfRange,
	AddressResolution,
};

const char *ErrorName(SysExError error);

// Roland checksum: adding it to the sum of address and data bytes yields a multiple of 128
uint8_t Checksum(const uint8_t *data, size_t size);
uint8_t Checksum(const std::vector<uint8_t> &addressAndData);
bool ValidateChecksum(const std::vector<uint8_t> &addressAndData, uint8_t checksum);

// Start and end byte plus minimum length. Says nothing about the sender.
bool ValidateFrame(const std::vector<uint8_t> &message);
// Roland manufacturer, device and JD-Xi model id
bool ValidateHeader(const std::vector<uint8_t> &message);

class SysExMessage
{
public:
	SysExMessage() = default;
	SysExMessage(uint8_t command, const Address &address, std::vector<uint8_t> data);

	uint8_t GetCommand() const { return m_command; }
	const Address &GetAddress() const { return m_address; }
	const std::vector<uint8_t> &GetData() const { return m_data; }
	uint8_t GetChecksum() const { return m_checksum; }

	std::vector<uint8_t> ToBytes() const;
	std::string ToHexString() const;

private:
	uint8_t m_command = CMD_DT1;
	Address m_address;
	std::vector<uint8_t> m_data;
	uint8_t m_checksum = 0;
};

// Raw DT1 / RQ1 builders
SysExError ComposeDataSet(const Address &address, const std::vector<uint8_t> &data, SysExMessage &message);
SysExError ComposeRequest(const Address &address, uint32_t size, SysExMessage &message);

// Address of a family's section below a part base, e.g. Digital 2 partial 3
SysExError ResolveSectionAddress(const Address &baseAddress, Family family, std::optional<int> partial, Address &sectionAddress);

// Writes a display value to the parameter below the given part base address
SysExError Compose(const ParameterRegistries &registries, const Address &baseAddress, const ParameterDescriptor &descriptor, int32_t displayValue, std::optional<int> partial, SysExMessage &message);
SysExError Compose(const ParameterRegistries &registries, const Address &baseAddress, Family family, std::string_view name, int32_t displayValue, std::optional<int> partial, SysExMessage &message);

// Requests a complete section dump
SysExError ComposeSectionRequest(const ParameterRegistries &registries, const Address &baseAddress, Family family, std::optional<int> partial, SysExMessage &message);

}
