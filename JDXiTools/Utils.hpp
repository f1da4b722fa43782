// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace JDXi
{

template<typename T>
static bool Read(std::istream &f, T &value)
{
	static_assert(alignof(T) == 1);
	return f.read(reinterpret_cast<char *>(&value), sizeof(value)).good();
}

template<typename T>
static bool ReadVector(std::istream &f, std::vector<T> &value, const size_t numElements)
{
	static_assert(alignof(T) == 1);
	value.resize(numElements);
	return f.read(reinterpret_cast<char *>(value.data()), value.size() * sizeof(T)).good();
}

template<typename T, size_t N>
static T SafeTable(const T (&table)[N], uint8_t offset)
{
	if (offset < N)
		return table[offset];
	else
		return table[N - 1];
}

template<size_t N>
static bool CompareMagic(const std::array<char, N> &left, const char(&right)[N + 1])
{
	return !std::memcmp(left.data(), right, N);
}

// "F0 41 10 ..."
inline std::string ToHexString(const uint8_t *data, size_t size)
{
	std::ostringstream str;
	str << std::hex << std::uppercase << std::setfill('0');
	for (size_t i = 0; i < size; i++)
	{
		if (i > 0)
			str << ' ';
		str << std::setw(2) << static_cast<int>(data[i]);
	}
	return str.str();
}

inline std::string ToHexString(const std::vector<uint8_t> &data)
{
	return ToHexString(data.data(), data.size());
}

}
