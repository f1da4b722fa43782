// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include "Parameter.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace JDXi
{

// The program editor and the vendor parameter guide disagree on where the
// program level and tempo live. Both candidates are kept until verified on hardware.
inline constexpr uint16_t PROGRAM_LEVEL_OFFSET_EDITOR = 0x10;
inline constexpr uint16_t PROGRAM_LEVEL_OFFSET_GUIDE = 0x16;
inline constexpr uint16_t PROGRAM_TEMPO_OFFSET_EDITOR = 0x11;
inline constexpr uint16_t PROGRAM_TEMPO_OFFSET_GUIDE = 0x17;

enum class ProgramCommonLayout
{
	EditorOffsets,
	GuideOffsets,
};

// All descriptors of one family, indexed by name and by position in the section
class ParameterRegistry
{
public:
	ParameterRegistry(Family family, std::vector<ParameterDescriptor> descriptors);

	ParameterRegistry(const ParameterRegistry &) = delete;
	ParameterRegistry &operator=(const ParameterRegistry &) = delete;
	ParameterRegistry(ParameterRegistry &&) = default;
	ParameterRegistry &operator=(ParameterRegistry &&) = default;

	Family GetFamily() const { return m_family; }
	const FamilyInfo &GetInfo() const { return GetFamilyInfo(m_family); }
	const std::vector<ParameterDescriptor> &Descriptors() const { return m_descriptors; }

	const ParameterDescriptor *GetByName(std::string_view name) const;
	// Exact match on the 7-bit offset pair
	const ParameterDescriptor *GetByOffset(uint16_t offset) const;
	// Descriptor whose payload covers the given byte of a section dump
	const ParameterDescriptor *GetByDataIndex(uint32_t index) const;

	// Number of bytes from the start of the section to the end of the last parameter
	uint32_t DataSize() const;
	// Number of LMB pages the section spans
	int NumPages() const;

	bool Owns(const ParameterDescriptor &descriptor) const;

private:
	Family m_family;
	std::vector<ParameterDescriptor> m_descriptors;
	std::map<std::string, size_t, std::less<>> m_byName;
	std::map<uint32_t, size_t> m_byDataIndex;
};

// One registry per family. Built once by the caller and passed to the composer and parser.
class ParameterRegistries
{
public:
	explicit ParameterRegistries(ProgramCommonLayout layout);

	const ParameterRegistry &Get(Family family) const { return m_registries[static_cast<size_t>(family)]; }
	const ParameterDescriptor *GetByName(Family family, std::string_view name) const { return Get(family).GetByName(name); }
	const ParameterDescriptor *GetByOffset(Family family, uint16_t offset) const { return Get(family).GetByOffset(offset); }

	// Registry holding this exact descriptor object, nullptr for descriptors built elsewhere
	const ParameterRegistry *FindOwner(const ParameterDescriptor &descriptor) const;

	ProgramCommonLayout GetLayout() const { return m_layout; }

private:
	ProgramCommonLayout m_layout;
	std::vector<ParameterRegistry> m_registries;
};

}
