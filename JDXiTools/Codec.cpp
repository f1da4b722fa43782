// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "Codec.hpp"

#include <iostream>

namespace JDXi
{

template<typename T>
static T Saturate(T value, T maxValue, const char *function)
{
	if (value <= maxValue)
		return value;
	std::cerr << function << ": value " << static_cast<uint64_t>(value) << " exceeds " << static_cast<uint64_t>(maxValue) << ", saturating!" << std::endl;
	return maxValue;
}

std::array<uint8_t, 2> Split8BitToNibbles(uint32_t value)
{
	value = Saturate<uint32_t>(value, 0xFF, "Split8BitToNibbles");
	return { static_cast<uint8_t>(value >> 4), static_cast<uint8_t>(value & 0x0F) };
}

uint8_t JoinNibblesTo8Bit(const std::array<uint8_t, 2> &nibbles)
{
	return static_cast<uint8_t>(DecodeNibbles(nibbles.data(), nibbles.size()));
}

std::array<uint8_t, 4> Split16BitToNibbles(uint32_t value)
{
	value = Saturate<uint32_t>(value, 0xFFFF, "Split16BitToNibbles");
	std::array<uint8_t, 4> nibbles{};
	for (size_t i = 0; i < nibbles.size(); i++)
	{
		nibbles[i] = static_cast<uint8_t>((value >> (12 - i * 4)) & 0x0F);
	}
	return nibbles;
}

uint16_t JoinNibblesTo16Bit(const std::array<uint8_t, 4> &nibbles)
{
	return static_cast<uint16_t>(DecodeNibbles(nibbles.data(), nibbles.size()));
}

std::array<uint8_t, 8> Split32BitToNibbles(uint64_t value)
{
	value = Saturate<uint64_t>(value, 0xFFFF'FFFF, "Split32BitToNibbles");
	std::array<uint8_t, 8> nibbles{};
	for (size_t i = 0; i < nibbles.size(); i++)
	{
		nibbles[i] = static_cast<uint8_t>((value >> (28 - i * 4)) & 0x0F);
	}
	return nibbles;
}

uint32_t JoinNibblesTo32Bit(const std::array<uint8_t, 8> &nibbles)
{
	return DecodeNibbles(nibbles.data(), nibbles.size());
}

std::vector<uint8_t> EncodeNibbles(uint32_t value, size_t numNibbles)
{
	if (numNibbles == 0 || numNibbles > 8)
	{
		std::cerr << "EncodeNibbles: invalid nibble count " << numNibbles << std::endl;
		return {};
	}
	if (numNibbles < 8)
		value = Saturate<uint32_t>(value, (1u << (numNibbles * 4)) - 1u, "EncodeNibbles");

	std::vector<uint8_t> nibbles(numNibbles);
	for (size_t i = 0; i < numNibbles; i++)
	{
		const size_t shift = (numNibbles - 1 - i) * 4;
		nibbles[i] = static_cast<uint8_t>((value >> shift) & 0x0F);
	}
	return nibbles;
}

uint32_t DecodeNibbles(const uint8_t *data, size_t numNibbles)
{
	uint32_t value = 0;
	for (size_t i = 0; i < numNibbles && i < 8; i++)
	{
		value = (value << 4) | Saturate<uint8_t>(data[i], 0x0F, "DecodeNibbles");
	}
	return value;
}

std::vector<uint8_t> NibbleData(const std::vector<uint8_t> &data)
{
	std::vector<uint8_t> result;
	result.reserve(data.size());
	for (const uint8_t b : data)
	{
		if (b > 0x7F)
		{
			const auto nibbles = Split8BitToNibbles(b);
			result.insert(result.end(), nibbles.begin(), nibbles.end());
		}
		else
		{
			result.push_back(b);
		}
	}
	return result;
}

std::array<uint8_t, 4> EncodeRoland7Bit(uint32_t value)
{
	value = Saturate<uint32_t>(value, 0x0FFF'FFFF, "EncodeRoland7Bit");
	return
	{
		static_cast<uint8_t>((value >> 21) & 0x7F),
		static_cast<uint8_t>((value >> 14) & 0x7F),
		static_cast<uint8_t>((value >> 7) & 0x7F),
		static_cast<uint8_t>(value & 0x7F),
	};
}

uint32_t DecodeRoland7Bit(const std::array<uint8_t, 4> &bytes)
{
	uint32_t value = 0;
	for (const uint8_t b : bytes)
	{
		value = (value << 7) | Saturate<uint8_t>(b, 0x7F, "DecodeRoland7Bit");
	}
	return value;
}

std::array<uint8_t, 2> Encode14BitTo7Bit(uint32_t value)
{
	value = Saturate<uint32_t>(value, 0x3FFF, "Encode14BitTo7Bit");
	return { static_cast<uint8_t>((value >> 7) & 0x7F), static_cast<uint8_t>(value & 0x7F) };
}

uint16_t Decode7BitTo14Bit(const std::array<uint8_t, 2> &bytes)
{
	return static_cast<uint16_t>((Saturate<uint8_t>(bytes[0], 0x7F, "Decode7BitTo14Bit") << 7) | Saturate<uint8_t>(bytes[1], 0x7F, "Decode7BitTo14Bit"));
}

}
