// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterRegistry.hpp"
#include "SysEx.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <numeric>

using namespace JDXi;

namespace {

// Address, data and checksum add up to a multiple of 128
void assert_checksum_invariant(const std::vector<uint8_t> &bytes)
{
	ASSERT_GE(bytes.size(), MIN_FRAME_SIZE);
	const uint32_t sum = std::accumulate(bytes.begin() + POS_ADDRESS, bytes.end() - 1, 0u);
	EXPECT_EQ(sum % 128, 0u);
}

class SysExComposerTest : public ::testing::Test {
protected:
	const ParameterRegistries registries{ProgramCommonLayout::EditorOffsets};
	SysExMessage message;
};

TEST(SysExChecksum, KnownValues)
{
	EXPECT_EQ(Checksum({ 0x19, 0x40, 0x00, 0x15, 0x64 }), 0x2E);
	EXPECT_EQ(Checksum({ 0x00, 0x00, 0x00, 0x00 }), 0x00);
	EXPECT_EQ(Checksum({ 0x7F }), 0x01);
	EXPECT_TRUE(ValidateChecksum({ 0x19, 0x40, 0x00, 0x15, 0x64 }, 0x2E));
	EXPECT_FALSE(ValidateChecksum({ 0x19, 0x40, 0x00, 0x15, 0x64 }, 0x2F));
}

TEST(SysExChecksum, FrameAndHeader)
{
	const std::vector<uint8_t> frame{ 0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12, 0x19, 0x40, 0x00, 0x15, 0x64, 0x2E, 0xF7 };
	EXPECT_TRUE(ValidateFrame(frame));
	EXPECT_TRUE(ValidateHeader(frame));

	std::vector<uint8_t> otherModel = frame;
	otherModel[6] = 0x0F;
	EXPECT_TRUE(ValidateFrame(otherModel));
	EXPECT_FALSE(ValidateHeader(otherModel));

	const std::vector<uint8_t> shortFrame(frame.begin(), frame.begin() + 10);
	EXPECT_FALSE(ValidateFrame(shortFrame));
}

TEST(SysExMessage, RawDataSet)
{
	// Raw builder only. The registry places Analog AMP_LEVEL at 19 42 00 2A (see AnalogAmpLevel).
	SysExMessage message;
	ASSERT_EQ(ComposeDataSet(Address(0x19, 0x40, 0x00, 0x15), { 0x64 }, message), SysExError::None);
	const std::vector<uint8_t> expected{ 0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12, 0x19, 0x40, 0x00, 0x15, 0x64, 0x2E, 0xF7 };
	EXPECT_EQ(message.ToBytes(), expected);
	EXPECT_EQ(message.GetChecksum(), 0x2E);
	EXPECT_EQ(message.GetCommand(), CMD_DT1);
	EXPECT_EQ(message.ToHexString(), "F0 41 10 00 00 00 0E 12 19 40 00 15 64 2E F7");
}

TEST(SysExMessage, RawDataSetRejectsEightBitAddress)
{
	SysExMessage message;
	EXPECT_EQ(ComposeDataSet(Address(0x19, 0x80, 0x00, 0x00), { 0x00 }, message), SysExError::AddressResolution);
}

TEST_F(SysExComposerTest, AnalogAmpLevel)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", 100, std::nullopt, message), SysExError::None);
	EXPECT_EQ(message.GetAddress(), Address(0x19, 0x42, 0x00, 0x2A));
	EXPECT_EQ(message.GetData(), std::vector<uint8_t>{ 0x64 });
	assert_checksum_invariant(message.ToBytes());
}

TEST_F(SysExComposerTest, BipolarValue)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_DIGITAL2_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", -12, 3, message), SysExError::None);
	EXPECT_EQ(message.GetAddress(), Address(0x19, 0x21, 0x22, 0x03));
	EXPECT_EQ(message.GetData(), std::vector<uint8_t>{ 52 });
	assert_checksum_invariant(message.ToBytes());
}

TEST_F(SysExComposerTest, NibbleValue)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_PROGRAM_TEMPORARY, Family::ProgramCommon, "PROGRAM_TEMPO", 12000, std::nullopt, message), SysExError::None);
	EXPECT_EQ(message.GetAddress(), Address(0x18, 0x00, 0x00, 0x11));
	EXPECT_EQ(message.GetData(), (std::vector<uint8_t>{ 0x02, 0x0E, 0x0E, 0x00 }));
	assert_checksum_invariant(message.ToBytes());
}

TEST_F(SysExComposerTest, DrumKeySecondPage)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_DRUM_TEMPORARY, Family::DrumPartial, "RELATIVE_LEVEL", 20, 2, message), SysExError::None);
	EXPECT_EQ(message.GetAddress(), Address(0x19, 0x70, 0x31, 0x42));
	assert_checksum_invariant(message.ToBytes());
}

TEST_F(SysExComposerTest, ClampsValuesInsidePayload)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", 30, 1, message), SysExError::None);
	EXPECT_EQ(message.GetData(), std::vector<uint8_t>{ 88 });
}

TEST_F(SysExComposerTest, RejectsValuesOutsidePayload)
{
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", 128, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", -1, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", -65, 1, message), SysExError::ValueOutOfRange);
}

TEST_F(SysExComposerTest, RejectsExtremeDisplayValues)
{
	constexpr int32_t maxInt = std::numeric_limits<int32_t>::max();
	constexpr int32_t minInt = std::numeric_limits<int32_t>::min();
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", maxInt, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", minInt, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", maxInt, 1, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", minInt, 1, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "FILTER_CUTOFF_KEYFOLLOW", maxInt, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "FILTER_CUTOFF_KEYFOLLOW", minInt, std::nullopt, message), SysExError::ValueOutOfRange);
	EXPECT_EQ(Compose(registries, BASE_ADDR_SYSTEM, Family::SystemCommon, "MASTER_TUNE", minInt, std::nullopt, message), SysExError::ValueOutOfRange);
}

TEST_F(SysExComposerTest, UnknownParameter)
{
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "NO_SUCH_PARAMETER", 0, std::nullopt, message), SysExError::UnknownParameter);

	// Descriptor that no registry holds
	const ParameterDescriptor stray{ "STRAY", Family::Analog, 0x10, 0, 127, 0, 127 };
	EXPECT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, stray, 0, std::nullopt, message), SysExError::UnknownParameter);

	// Family not available in that area
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::Analog, "AMP_LEVEL", 100, std::nullopt, message), SysExError::UnknownParameter);
	EXPECT_EQ(Compose(registries, Address(0x20, 0x00, 0x00, 0x00), Family::Analog, "AMP_LEVEL", 100, std::nullopt, message), SysExError::UnknownParameter);
}

TEST_F(SysExComposerTest, InvalidPartial)
{
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", 0, std::nullopt, message), SysExError::AddressResolution);
	EXPECT_EQ(Compose(registries, BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalPartial, "OSC_PITCH", 0, 4, message), SysExError::AddressResolution);
	EXPECT_EQ(Compose(registries, BASE_ADDR_DRUM_TEMPORARY, Family::DrumPartial, "RELATIVE_LEVEL", 0, 0, message), SysExError::AddressResolution);
}

TEST_F(SysExComposerTest, FailedComposeKeepsMessage)
{
	ASSERT_EQ(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", 100, std::nullopt, message), SysExError::None);
	const auto before = message.ToBytes();
	EXPECT_NE(Compose(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, "AMP_LEVEL", 500, std::nullopt, message), SysExError::None);
	EXPECT_EQ(message.ToBytes(), before);
}

TEST_F(SysExComposerTest, SectionRequest)
{
	ASSERT_EQ(ComposeSectionRequest(registries, BASE_ADDR_DRUM_TEMPORARY, Family::DrumPartial, 1, message), SysExError::None);
	EXPECT_EQ(message.GetCommand(), CMD_RQ1);
	EXPECT_EQ(message.GetAddress(), Address(0x19, 0x70, 0x2E, 0x00));
	EXPECT_EQ(message.GetData(), (std::vector<uint8_t>{ 0x00, 0x00, 0x01, 0x43 }));
	assert_checksum_invariant(message.ToBytes());

	ASSERT_EQ(ComposeSectionRequest(registries, BASE_ADDR_ANALOG_TEMPORARY, Family::Analog, std::nullopt, message), SysExError::None);
	EXPECT_EQ(message.GetAddress(), Address(0x19, 0x42, 0x00, 0x00));
	EXPECT_EQ(message.GetData(), (std::vector<uint8_t>{ 0x00, 0x00, 0x00, 0x3C }));

	EXPECT_EQ(ComposeSectionRequest(registries, BASE_ADDR_PROGRAM_TEMPORARY, Family::ProgramPart, 5, message), SysExError::AddressResolution);
}

TEST_F(SysExComposerTest, SectionAddresses)
{
	Address address;
	ASSERT_EQ(ResolveSectionAddress(BASE_ADDR_DIGITAL1_TEMPORARY, Family::DigitalModify, std::nullopt, address), SysExError::None);
	EXPECT_EQ(address, Address(0x19, 0x01, 0x50, 0x00));
	ASSERT_EQ(ResolveSectionAddress(BASE_ADDR_PROGRAM_TEMPORARY, Family::ProgramZone, 2, address), SysExError::None);
	EXPECT_EQ(address, Address(0x18, 0x00, 0x31, 0x00));
	ASSERT_EQ(ResolveSectionAddress(BASE_ADDR_SYSTEM, Family::SystemCommon, std::nullopt, address), SysExError::None);
	EXPECT_EQ(address, BASE_ADDR_SYSTEM);
	EXPECT_EQ(ResolveSectionAddress(BASE_ADDR_SETUP, Family::SystemCommon, std::nullopt, address), SysExError::UnknownParameter);
}

}
