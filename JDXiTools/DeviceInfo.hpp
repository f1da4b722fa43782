// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace JDXi
{

inline constexpr uint8_t UNIVERSAL_NON_REALTIME = 0x7E;
inline constexpr uint8_t BROADCAST_DEVICE_ID = 0x7F;
inline constexpr uint8_t GENERAL_INFORMATION = 0x06;
inline constexpr uint8_t IDENTITY_REQUEST = 0x01;
inline constexpr uint8_t IDENTITY_REPLY = 0x02;

// Decoded MIDI identity reply
struct DeviceInfo
{
	uint8_t deviceId = 0;
	uint8_t manufacturerId = 0;
	std::vector<uint8_t> familyCode;  // Everything between manufacturer and revision
	std::array<uint8_t, 4> revision{};

	bool IsRoland() const;
	bool IsJDXi() const;
	// "v1.00"
	std::string VersionString() const;
	std::string ToString() const;
};

// F0 7E 7F 06 01 F7
std::vector<uint8_t> IdentityRequest(uint8_t deviceId = BROADCAST_DEVICE_ID);

bool ParseIdentityReply(const std::vector<uint8_t> &message, DeviceInfo &info);

}
