// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "DeviceInfo.hpp"
#include "SysEx.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace JDXi
{

// F0 7E dev 06 02 41 [family code] r r r r F7
static constexpr size_t IDENTITY_MIN_SIZE = 15;
static constexpr size_t POS_MANUFACTURER = 5;

bool DeviceInfo::IsRoland() const
{
	return manufacturerId == ROLAND_ID;
}

bool DeviceInfo::IsJDXi() const
{
	if (!IsRoland())
		return false;

	// Devices either report the DT1 header (10 00 00 00 0E) or the family code 0E 03
	static constexpr uint8_t ModelHeader[] = { DEVICE_ID, MODEL_ID[0], MODEL_ID[1], MODEL_ID[2], MODEL_ID[3] };
	static constexpr uint8_t FamilyCode[] = { 0x0E, 0x03 };
	const auto startsWith = [this](const auto &prefix)
	{
		return familyCode.size() >= std::size(prefix) && std::equal(std::begin(prefix), std::end(prefix), familyCode.begin());
	};
	return startsWith(ModelHeader) || startsWith(FamilyCode);
}

std::string DeviceInfo::VersionString() const
{
	std::ostringstream str;
	str << 'v' << static_cast<int>(revision[2]) << '.' << std::setw(2) << std::setfill('0') << static_cast<int>(revision[3]);
	return str.str();
}

std::string DeviceInfo::ToString() const
{
	if (IsJDXi())
		return "Roland JD-Xi, firmware " + VersionString();
	else if (IsRoland())
		return "Roland device, firmware " + VersionString();
	return "Unknown device";
}

std::vector<uint8_t> IdentityRequest(uint8_t deviceId)
{
	return { SYSEX_START, UNIVERSAL_NON_REALTIME, deviceId, GENERAL_INFORMATION, IDENTITY_REQUEST, SYSEX_END };
}

bool ParseIdentityReply(const std::vector<uint8_t> &message, DeviceInfo &info)
{
	if (message.size() < IDENTITY_MIN_SIZE
		|| message.front() != SYSEX_START
		|| message.back() != SYSEX_END
		|| message[1] != UNIVERSAL_NON_REALTIME
		|| message[3] != GENERAL_INFORMATION
		|| message[4] != IDENTITY_REPLY)
	{
		return false;
	}

	DeviceInfo parsed;
	parsed.deviceId = message[2];
	parsed.manufacturerId = message[POS_MANUFACTURER];
	const auto revisionStart = message.end() - 1 - parsed.revision.size();
	parsed.familyCode.assign(message.begin() + POS_MANUFACTURER + 1, revisionStart);
	std::copy(revisionStart, message.end() - 1, parsed.revision.begin());
	info = std::move(parsed);
	return true;
}

}
