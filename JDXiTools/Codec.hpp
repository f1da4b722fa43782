// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace JDXi
{

// All splitting functions return the most significant nibble / group first.
// Values wider than the declared bit width are saturated and reported on std::cerr.

std::array<uint8_t, 2> Split8BitToNibbles(uint32_t value);
uint8_t JoinNibblesTo8Bit(const std::array<uint8_t, 2> &nibbles);

std::array<uint8_t, 4> Split16BitToNibbles(uint32_t value);
uint16_t JoinNibblesTo16Bit(const std::array<uint8_t, 4> &nibbles);

std::array<uint8_t, 8> Split32BitToNibbles(uint64_t value);
uint32_t JoinNibblesTo32Bit(const std::array<uint8_t, 8> &nibbles);

// Generic form for parameters stored as 1 to 8 nibbles
std::vector<uint8_t> EncodeNibbles(uint32_t value, size_t numNibbles);
uint32_t DecodeNibbles(const uint8_t *data, size_t numNibbles);

// Splits every byte above 0x7F into two nibbles, all other bytes are copied
std::vector<uint8_t> NibbleData(const std::vector<uint8_t> &data);

// 28-bit value as four 7-bit groups, e.g. for RQ1 sizes
std::array<uint8_t, 4> EncodeRoland7Bit(uint32_t value);
uint32_t DecodeRoland7Bit(const std::array<uint8_t, 4> &bytes);

// 14-bit value as two 7-bit groups (pitch bend style)
std::array<uint8_t, 2> Encode14BitTo7Bit(uint32_t value);
uint16_t Decode7BitTo14Bit(const std::array<uint8_t, 2> &bytes);

}
