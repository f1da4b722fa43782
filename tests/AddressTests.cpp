// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "Address.hpp"

#include <gtest/gtest.h>

using namespace JDXi;

namespace {

TEST(Address, OffsetAddsComponentsWithoutCarry)
{
	const auto address = BASE_ADDR_ANALOG_TEMPORARY.Offset(0, 2, 0, 0x2A);
	ASSERT_TRUE(address.has_value());
	EXPECT_EQ(*address, Address(0x19, 0x42, 0x00, 0x2A));

	const auto noCarry = Address(0x19, 0x00, 0x00, 0x7F).Offset(0, 0, 0, 0x01);
	ASSERT_TRUE(noCarry.has_value());
	EXPECT_EQ(*noCarry, Address(0x19, 0x00, 0x00, 0x80));
	EXPECT_FALSE(noCarry->IsSevenBitSafe());
}

TEST(Address, ChainedOffsetsMatchSummedOffset)
{
	struct OffsetPair
	{
		Address base;
		AddressOffset first, second;
	};
	const OffsetPair pairs[] =
	{
		{ BASE_ADDR_DIGITAL2_TEMPORARY, { 0, 1, 0x20, 0 }, { 0, 0, 2, 0x05 } },
		{ BASE_ADDR_DRUM_TEMPORARY, { 0, 0x10, 0x2E, 0 }, { 0, 0, 0x49, 0x42 } },
		{ BASE_ADDR_PROGRAM_TEMPORARY, { 0, 0, 0x30, 0 }, { 0, 0, 3, 0x7F } },
		{ Address(0x19, 0x42, 0x10, 0x20), { 0, 0, -0x10, -0x20 }, { 0, 0, 0x05, 0x01 } },
	};
	for (const auto &pair : pairs)
	{
		const auto chained = pair.base.Offset(pair.first);
		ASSERT_TRUE(chained.has_value());
		EXPECT_EQ(chained->Offset(pair.second), pair.base.Offset(pair.first + pair.second));
	}

	// The chained form leaves the byte range on the way, the summed form does not
	const Address base{0x19, 0x00, 0x00, 0xF0};
	const AddressOffset up{ 0, 0, 0, 0x20 };
	const AddressOffset down{ 0, 0, 0, -0x20 };
	EXPECT_FALSE(base.Offset(up).has_value());
	const auto summed = base.Offset(up + down);
	ASSERT_TRUE(summed.has_value());
	EXPECT_EQ(*summed, base);
}

TEST(Address, OffsetRejectsOverflow)
{
	EXPECT_FALSE(Address(0x19, 0x00, 0xFF, 0x00).Offset(0, 0, 1, 0).has_value());
	EXPECT_FALSE(Address(0x00, 0x00, 0x00, 0x00).Offset(0, 0, 0, -1).has_value());
	EXPECT_TRUE(Address(0x00, 0x00, 0x00, 0x01).Offset(0, 0, 0, -1).has_value());
}

TEST(Address, Formatting)
{
	EXPECT_EQ(Address(0x19, 0x42, 0x00, 0x2A).ToHexString(), "1942002a");
	EXPECT_EQ(BASE_ADDR_PROGRAM_TEMPORARY.ToBytes(), (std::array<uint8_t, 4>{ 0x18, 0x00, 0x00, 0x00 }));

	const uint8_t bytes[] = { 0x19, 0x60, 0x10, 0x2E };
	const Address address = Address::FromBytes(bytes);
	EXPECT_EQ(address.MSB(), 0x19);
	EXPECT_EQ(address.UMB(), 0x60);
	EXPECT_EQ(address.LMB(), 0x10);
	EXPECT_EQ(address.LSB(), 0x2E);
	EXPECT_TRUE(address.IsSevenBitSafe());
}

}
