// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterRegistry.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <string>

using namespace JDXi;

namespace {

class ParameterRegistryTest : public ::testing::Test {
protected:
	const ParameterRegistries registries{ProgramCommonLayout::EditorOffsets};
};

TEST_F(ParameterRegistryTest, DescriptorsDoNotOverlap)
{
	for (size_t i = 0; i < NUM_FAMILIES; i++)
	{
		const auto family = static_cast<Family>(i);
		const ParameterRegistry &registry = registries.Get(family);
		ASSERT_FALSE(registry.Descriptors().empty()) << FamilyName(family);

		uint32_t previousEnd = 0;
		std::set<std::string> names;
		for (const auto &descriptor : registry.Descriptors())
		{
			EXPECT_EQ(descriptor.family, family) << descriptor.name;
			EXPECT_GE(descriptor.DataIndex(), previousEnd) << FamilyName(family) << ": " << descriptor.name;
			EXPECT_TRUE(names.insert(descriptor.name).second) << descriptor.name;
			EXPECT_LE(descriptor.offset & 0xFF, 0x7F) << descriptor.name;
			EXPECT_LE(descriptor.minValue, descriptor.maxValue) << descriptor.name;
			EXPECT_LE(static_cast<uint32_t>(descriptor.maxValue), PayloadLimit(descriptor)) << descriptor.name;
			previousEnd = descriptor.DataIndex() + descriptor.size;
		}
		EXPECT_EQ(registry.DataSize(), previousEnd);
	}
}

TEST_F(ParameterRegistryTest, LookupByNameAndOffset)
{
	const ParameterDescriptor *level = registries.GetByName(Family::Analog, "AMP_LEVEL");
	ASSERT_NE(level, nullptr);
	EXPECT_EQ(level->offset, 0x2A);
	EXPECT_EQ(registries.GetByOffset(Family::Analog, 0x2A), level);
	EXPECT_EQ(registries.Get(Family::Analog).GetByDataIndex(0x2A), level);

	EXPECT_EQ(registries.GetByName(Family::Analog, "NO_SUCH_PARAMETER"), nullptr);
	EXPECT_EQ(registries.GetByName(Family::DigitalCommon, "AMP_LEVEL"), nullptr);
	EXPECT_EQ(registries.GetByOffset(Family::Analog, 0x7F), nullptr);
}

TEST_F(ParameterRegistryTest, LookupInsideMultiByteParameters)
{
	const ParameterRegistry &registry = registries.Get(Family::ProgramCommon);
	const ParameterDescriptor *tempo = registry.GetByName("PROGRAM_TEMPO");
	ASSERT_NE(tempo, nullptr);
	EXPECT_EQ(tempo->size, 4);
	for (uint32_t index = 0x11; index < 0x15; index++)
		EXPECT_EQ(registry.GetByDataIndex(index), tempo);
	EXPECT_EQ(registry.GetByOffset(0x12), nullptr);
	EXPECT_EQ(registry.GetByDataIndex(0x0C), nullptr);
}

TEST_F(ParameterRegistryTest, SecondPageOffsets)
{
	const ParameterRegistry &drum = registries.Get(Family::DrumPartial);
	const ParameterDescriptor *relativeLevel = drum.GetByName("RELATIVE_LEVEL");
	ASSERT_NE(relativeLevel, nullptr);
	EXPECT_EQ(relativeLevel->offset, 0x142);
	EXPECT_EQ(relativeLevel->DataIndex(), 0xC2u);
	EXPECT_EQ(drum.GetByOffset(0x142), relativeLevel);
	EXPECT_EQ(drum.DataSize(), 195u);
	EXPECT_EQ(drum.NumPages(), 2);

	EXPECT_EQ(registries.Get(Family::Analog).NumPages(), 1);
	EXPECT_EQ(registries.Get(Family::Effect1).NumPages(), 2);
}

TEST_F(ParameterRegistryTest, OwnershipOfDescriptors)
{
	const ParameterDescriptor *level = registries.GetByName(Family::Analog, "AMP_LEVEL");
	ASSERT_NE(level, nullptr);
	EXPECT_TRUE(registries.Get(Family::Analog).Owns(*level));
	EXPECT_FALSE(registries.Get(Family::DigitalCommon).Owns(*level));
	EXPECT_EQ(registries.FindOwner(*level), &registries.Get(Family::Analog));

	const ParameterDescriptor copy = *level;
	EXPECT_EQ(registries.FindOwner(copy), nullptr);
}

TEST_F(ParameterRegistryTest, RejectsForeignAndOverlappingDescriptors)
{
	const std::vector<ParameterDescriptor> descriptors =
	{
		{ "LEVEL", Family::Analog, 0x10, 0, 127, 0, 127 },
		{ "WIDE", Family::Analog, 0x11, 0, 255, 0, 255, std::nullopt, 1, false, 2 },
		{ "INSIDE_WIDE", Family::Analog, 0x12, 0, 127, 0, 127 },
		{ "LEVEL", Family::Analog, 0x20, 0, 127, 0, 127 },
		{ "FOREIGN", Family::DrumCommon, 0x30, 0, 127, 0, 127 },
	};
	const ParameterRegistry registry{Family::Analog, descriptors};
	ASSERT_EQ(registry.Descriptors().size(), 2u);
	EXPECT_STREQ(registry.Descriptors()[0].name, "LEVEL");
	EXPECT_STREQ(registry.Descriptors()[1].name, "WIDE");
	EXPECT_EQ(registry.GetByName("FOREIGN"), nullptr);
	EXPECT_EQ(registry.DataSize(), 0x13u);
}

TEST_F(ParameterRegistryTest, GuideLayoutRelocatesLevelAndTempo)
{
	const ParameterRegistries guide{ProgramCommonLayout::GuideOffsets};
	EXPECT_EQ(guide.GetLayout(), ProgramCommonLayout::GuideOffsets);

	const ParameterDescriptor *level = guide.GetByName(Family::ProgramCommon, "PROGRAM_LEVEL");
	const ParameterDescriptor *tempo = guide.GetByName(Family::ProgramCommon, "PROGRAM_TEMPO");
	ASSERT_NE(level, nullptr);
	ASSERT_NE(tempo, nullptr);
	EXPECT_EQ(level->offset, PROGRAM_LEVEL_OFFSET_GUIDE);
	EXPECT_EQ(tempo->offset, PROGRAM_TEMPO_OFFSET_GUIDE);
	EXPECT_EQ(guide.GetByName(Family::ProgramCommon, "VOCAL_EFFECT"), nullptr);
	EXPECT_NE(guide.GetByName(Family::ProgramCommon, "VOCAL_EFFECT_NUMBER"), nullptr);

	EXPECT_EQ(registries.GetByName(Family::ProgramCommon, "PROGRAM_LEVEL")->offset, PROGRAM_LEVEL_OFFSET_EDITOR);
	EXPECT_EQ(registries.GetByName(Family::ProgramCommon, "PROGRAM_TEMPO")->offset, PROGRAM_TEMPO_OFFSET_EDITOR);
	EXPECT_NE(registries.GetByName(Family::ProgramCommon, "VOCAL_EFFECT"), nullptr);
}

TEST_F(ParameterRegistryTest, BipolarConversion)
{
	const ParameterDescriptor *pitch = registries.GetByName(Family::DigitalPartial, "OSC_PITCH");
	ASSERT_NE(pitch, nullptr);
	EXPECT_TRUE(pitch->IsBipolar());
	EXPECT_EQ(pitch->displayMin, -24);
	EXPECT_EQ(pitch->displayMax, 24);
	EXPECT_EQ(ConvertToMidi(*pitch, 0), 64);
	EXPECT_EQ(ConvertToMidi(*pitch, -24), 40);
	EXPECT_EQ(ConvertFromMidi(*pitch, 88), 24);
	EXPECT_EQ(ValidateValue(*pitch, 100), 88);
	EXPECT_EQ(ValidateValue(*pitch, 0), 40);
}

TEST_F(ParameterRegistryTest, KeyfollowConversion)
{
	const ParameterDescriptor *keyfollow = registries.GetByName(Family::Analog, "FILTER_CUTOFF_KEYFOLLOW");
	ASSERT_NE(keyfollow, nullptr);
	EXPECT_EQ(keyfollow->displayMin, -100);
	EXPECT_EQ(keyfollow->displayMax, 100);
	EXPECT_EQ(ConvertToMidi(*keyfollow, -100), 54);
	EXPECT_EQ(ConvertToMidi(*keyfollow, 30), 67);
	EXPECT_EQ(ConvertToMidi(*keyfollow, 0), 64);
	EXPECT_EQ(ConvertFromMidi(*keyfollow, 74), 100);
}

TEST_F(ParameterRegistryTest, MasterTuneConversion)
{
	const ParameterDescriptor *tune = registries.GetByName(Family::SystemCommon, "MASTER_TUNE");
	ASSERT_NE(tune, nullptr);
	EXPECT_EQ(tune->size, 4);
	EXPECT_EQ(tune->displayMin, -1000);
	EXPECT_EQ(tune->displayMax, 1000);
	EXPECT_EQ(ConvertToMidi(*tune, 0), 1024);
	EXPECT_EQ(ConvertToMidi(*tune, -1000), 24);
	EXPECT_EQ(ConvertFromMidi(*tune, 2024), 1000);
}

TEST_F(ParameterRegistryTest, ConversionSaturatesExtremeValues)
{
	constexpr int32_t maxInt = std::numeric_limits<int32_t>::max();
	constexpr int32_t minInt = std::numeric_limits<int32_t>::min();
	const ParameterDescriptor *pitch = registries.GetByName(Family::DigitalPartial, "OSC_PITCH");
	const ParameterDescriptor *keyfollow = registries.GetByName(Family::Analog, "FILTER_CUTOFF_KEYFOLLOW");
	const ParameterDescriptor *level = registries.GetByName(Family::Analog, "AMP_LEVEL");
	ASSERT_NE(pitch, nullptr);
	ASSERT_NE(keyfollow, nullptr);
	ASSERT_NE(level, nullptr);
	EXPECT_EQ(ConvertToMidi(*pitch, maxInt), maxInt);
	EXPECT_EQ(ConvertToMidi(*pitch, minInt), minInt + 64);
	EXPECT_EQ(ConvertToMidi(*keyfollow, minInt), 64 - 214748365);
	EXPECT_EQ(ConvertToMidi(*level, minInt), minInt);
	EXPECT_EQ(ConvertFromMidi(*keyfollow, maxInt), maxInt);
}

TEST_F(ParameterRegistryTest, ShiftedConversion)
{
	const ParameterDescriptor *color = registries.GetByName(Family::DrumPartial, "WMT1_WAVE_FXM_COLOR");
	ASSERT_NE(color, nullptr);
	EXPECT_FALSE(color->IsBipolar());
	EXPECT_EQ(ConvertToMidi(*color, 1), 0);
	EXPECT_EQ(ConvertToMidi(*color, 4), 3);
	EXPECT_EQ(ConvertFromMidi(*color, 2), 3);
}

TEST(Parameter, PartialOffsets)
{
	EXPECT_EQ(GetOffsetForPartial(Family::DigitalPartial, 1), AddressOffset{});
	const AddressOffset digital3{ 0, 0, 2, 0 };
	EXPECT_EQ(GetOffsetForPartial(Family::DigitalPartial, 3), digital3);
	EXPECT_FALSE(GetOffsetForPartial(Family::DigitalPartial, 4).has_value());
	EXPECT_FALSE(GetOffsetForPartial(Family::DigitalPartial, 0).has_value());

	const AddressOffset drum37{ 0, 0, 72, 0 };
	EXPECT_EQ(GetOffsetForPartial(Family::DrumPartial, NUM_DRUM_KEYS), drum37);
	EXPECT_FALSE(GetOffsetForPartial(Family::DrumPartial, NUM_DRUM_KEYS + 1).has_value());

	const AddressOffset part4{ 0, 0, 3, 0 };
	EXPECT_EQ(GetOffsetForPartial(Family::ProgramPart, 4), part4);
	EXPECT_FALSE(GetOffsetForPartial(Family::ProgramZone, 5).has_value());
}

TEST(Parameter, Names)
{
	EXPECT_STREQ(DrumKeyName(1), "BD1");
	EXPECT_STREQ(DrumKeyName(NUM_DRUM_KEYS), "C5");
	EXPECT_STREQ(DrumKeyName(0), "???");
	EXPECT_STREQ(AreaName(TemporaryArea::Analog), "Analog Synth");
	EXPECT_STREQ(FamilyName(Family::Effect1), "Effect 1");
	EXPECT_EQ(GetPartBaseArea(Address(0x19, 0x20, 0x01, 0x05)), TemporaryArea::Digital2);
	EXPECT_EQ(GetPartBaseArea(Address(0x19, 0x10, 0x00, 0x00)), TemporaryArea::Unknown);
}

}
