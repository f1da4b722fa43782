// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "ParameterRegistry.hpp"
#include "ParameterTables.hpp"

#include <algorithm>
#include <iostream>
#include <string_view>

namespace JDXi
{

ParameterRegistry::ParameterRegistry(Family family, std::vector<ParameterDescriptor> descriptors)
	: m_family{family}
{
	std::stable_sort(descriptors.begin(), descriptors.end(), [](const ParameterDescriptor &left, const ParameterDescriptor &right)
	{
		return left.DataIndex() < right.DataIndex();
	});

	m_descriptors.reserve(descriptors.size());
	uint32_t previousEnd = 0;
	for (const auto &descriptor : descriptors)
	{
		if (descriptor.family != family)
		{
			std::cerr << FamilyName(family) << ": " << descriptor.name << " belongs to " << FamilyName(descriptor.family) << ", ignored" << std::endl;
			continue;
		}
		if (!m_descriptors.empty() && descriptor.DataIndex() < previousEnd)
		{
			std::cerr << FamilyName(family) << ": " << descriptor.name << " overlaps " << m_descriptors.back().name << ", ignored" << std::endl;
			continue;
		}
		if (m_byName.find(std::string_view{descriptor.name}) != m_byName.end())
		{
			std::cerr << FamilyName(family) << ": duplicate parameter " << descriptor.name << ", ignored" << std::endl;
			continue;
		}

		m_byName.emplace(descriptor.name, m_descriptors.size());
		m_byDataIndex.emplace(descriptor.DataIndex(), m_descriptors.size());
		m_descriptors.push_back(descriptor);
		previousEnd = descriptor.DataIndex() + descriptor.size;
	}
}

const ParameterDescriptor *ParameterRegistry::GetByName(std::string_view name) const
{
	if (auto it = m_byName.find(name); it != m_byName.end())
		return &m_descriptors[it->second];
	return nullptr;
}

const ParameterDescriptor *ParameterRegistry::GetByOffset(uint16_t offset) const
{
	const uint32_t index = ((offset >> 8) << 7) | (offset & 0x7F);
	if (auto it = m_byDataIndex.find(index); it != m_byDataIndex.end() && m_descriptors[it->second].offset == offset)
		return &m_descriptors[it->second];
	return nullptr;
}

const ParameterDescriptor *ParameterRegistry::GetByDataIndex(uint32_t index) const
{
	auto it = m_byDataIndex.upper_bound(index);
	if (it == m_byDataIndex.begin())
		return nullptr;
	--it;
	const ParameterDescriptor &descriptor = m_descriptors[it->second];
	if (index < descriptor.DataIndex() + descriptor.size)
		return &descriptor;
	return nullptr;
}

uint32_t ParameterRegistry::DataSize() const
{
	if (m_descriptors.empty())
		return 0;
	const ParameterDescriptor &last = m_descriptors.back();
	return last.DataIndex() + last.size;
}

int ParameterRegistry::NumPages() const
{
	return std::max(1, static_cast<int>((DataSize() + 127) / 128));
}

bool ParameterRegistry::Owns(const ParameterDescriptor &descriptor) const
{
	if (m_descriptors.empty())
		return false;
	std::less<const ParameterDescriptor *> less;
	return !less(&descriptor, m_descriptors.data()) && less(&descriptor, m_descriptors.data() + m_descriptors.size());
}

// Moves level and tempo to the offsets from the parameter guide.
// Whatever the editor layout had at those positions has to go.
static void ApplyGuideOffsets(std::vector<ParameterDescriptor> &descriptors)
{
	static constexpr std::pair<std::string_view, uint16_t> Relocations[] =
	{
		{ "PROGRAM_LEVEL", PROGRAM_LEVEL_OFFSET_GUIDE },
		{ "PROGRAM_TEMPO", PROGRAM_TEMPO_OFFSET_GUIDE },
	};

	std::vector<std::pair<uint32_t, uint32_t>> relocatedRanges;
	for (auto &descriptor : descriptors)
	{
		for (const auto &[name, offset] : Relocations)
		{
			if (name == descriptor.name)
			{
				descriptor.offset = offset;
				relocatedRanges.emplace_back(descriptor.DataIndex(), descriptor.DataIndex() + descriptor.size);
			}
		}
	}

	std::erase_if(descriptors, [&relocatedRanges](const ParameterDescriptor &descriptor)
	{
		for (const auto &[name, offset] : Relocations)
		{
			if (name == descriptor.name)
				return false;
		}
		const uint32_t start = descriptor.DataIndex(), end = start + descriptor.size;
		for (const auto &[relocatedStart, relocatedEnd] : relocatedRanges)
		{
			if (start < relocatedEnd && relocatedStart < end)
			{
				std::cerr << "Program Common: " << descriptor.name << " is not available with the guide offsets" << std::endl;
				return true;
			}
		}
		return false;
	});
}

ParameterRegistries::ParameterRegistries(ProgramCommonLayout layout)
	: m_layout{layout}
{
	m_registries.reserve(NUM_FAMILIES);
	for (size_t i = 0; i < NUM_FAMILIES; i++)
	{
		const auto family = static_cast<Family>(i);
		const auto table = GetParameterTable(family);
		std::vector<ParameterDescriptor> descriptors(table.begin(), table.end());
		if (family == Family::ProgramCommon && layout == ProgramCommonLayout::GuideOffsets)
			ApplyGuideOffsets(descriptors);
		m_registries.emplace_back(family, std::move(descriptors));
	}
}

const ParameterRegistry *ParameterRegistries::FindOwner(const ParameterDescriptor &descriptor) const
{
	for (const auto &registry : m_registries)
	{
		if (registry.Owns(descriptor))
			return &registry;
	}
	return nullptr;
}

}
