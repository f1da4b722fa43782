// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "DeviceInfo.hpp"

#include <gtest/gtest.h>

using namespace JDXi;

namespace {

TEST(DeviceInfo, IdentityRequest)
{
	EXPECT_EQ(IdentityRequest(), (std::vector<uint8_t>{ 0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7 }));
	EXPECT_EQ(IdentityRequest(0x10), (std::vector<uint8_t>{ 0xF0, 0x7E, 0x10, 0x06, 0x01, 0xF7 }));
}

TEST(DeviceInfo, ReplyWithModelHeader)
{
	const std::vector<uint8_t> reply{ 0xF0, 0x7E, 0x7F, 0x06, 0x02, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x00, 0x00, 0x01, 0x00, 0xF7 };
	DeviceInfo info;
	ASSERT_TRUE(ParseIdentityReply(reply, info));
	EXPECT_EQ(info.deviceId, 0x7F);
	EXPECT_EQ(info.manufacturerId, 0x41);
	EXPECT_EQ(info.familyCode, (std::vector<uint8_t>{ 0x10, 0x00, 0x00, 0x00, 0x0E }));
	EXPECT_TRUE(info.IsRoland());
	EXPECT_TRUE(info.IsJDXi());
	EXPECT_EQ(info.VersionString(), "v1.00");
	EXPECT_EQ(info.ToString(), "Roland JD-Xi, firmware v1.00");
}

TEST(DeviceInfo, ReplyWithFamilyCode)
{
	const std::vector<uint8_t> reply{ 0xF0, 0x7E, 0x10, 0x06, 0x02, 0x41, 0x0E, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01, 0x05, 0xF7 };
	DeviceInfo info;
	ASSERT_TRUE(ParseIdentityReply(reply, info));
	EXPECT_EQ(info.deviceId, 0x10);
	EXPECT_TRUE(info.IsJDXi());
	EXPECT_EQ(info.VersionString(), "v1.05");
}

TEST(DeviceInfo, OtherDevices)
{
	const std::vector<uint8_t> otherRoland{ 0xF0, 0x7E, 0x10, 0x06, 0x02, 0x41, 0x3B, 0x02, 0x00, 0x00, 0x00, 0x00, 0x02, 0x10, 0xF7 };
	DeviceInfo info;
	ASSERT_TRUE(ParseIdentityReply(otherRoland, info));
	EXPECT_TRUE(info.IsRoland());
	EXPECT_FALSE(info.IsJDXi());
	EXPECT_EQ(info.ToString(), "Roland device, firmware v2.16");

	const std::vector<uint8_t> otherManufacturer{ 0xF0, 0x7E, 0x10, 0x06, 0x02, 0x43, 0x0E, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xF7 };
	ASSERT_TRUE(ParseIdentityReply(otherManufacturer, info));
	EXPECT_FALSE(info.IsRoland());
	EXPECT_FALSE(info.IsJDXi());
	EXPECT_EQ(info.ToString(), "Unknown device");
}

TEST(DeviceInfo, RejectsOtherMessages)
{
	DeviceInfo info;
	EXPECT_FALSE(ParseIdentityReply(IdentityRequest(), info));
	EXPECT_FALSE(ParseIdentityReply({ 0xF0, 0x7E, 0x10, 0x06, 0x02, 0x41, 0x0E, 0x03, 0x00, 0x00, 0x01, 0x00, 0xF7 }, info));

	const std::vector<uint8_t> dataSet{ 0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12, 0x19, 0x40, 0x00, 0x15, 0x64, 0x2E, 0xF7 };
	EXPECT_FALSE(ParseIdentityReply(dataSet, info));
}

}
