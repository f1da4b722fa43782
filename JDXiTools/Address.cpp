// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "Address.hpp"

namespace JDXi
{

Address Address::FromBytes(const uint8_t *bytes)
{
	return Address{bytes[0], bytes[1], bytes[2], bytes[3]};
}

std::optional<Address> Address::Offset(const AddressOffset &delta) const
{
	const int deltas[] = { delta.msb, delta.umb, delta.lmb, delta.lsb };
	Address result;
	for (size_t i = 0; i < m_bytes.size(); i++)
	{
		const int value = m_bytes[i] + deltas[i];
		if (value < 0 || value > 0xFF)
			return std::nullopt;
		result.m_bytes[i] = static_cast<uint8_t>(value);
	}
	return result;
}

std::string Address::ToHexString() const
{
	static constexpr char HexDigits[] = "0123456789abcdef";
	std::string str;
	str.reserve(m_bytes.size() * 2);
	for (const uint8_t b : m_bytes)
	{
		str += HexDigits[b >> 4];
		str += HexDigits[b & 0x0F];
	}
	return str;
}

bool Address::IsSevenBitSafe() const
{
	for (const uint8_t b : m_bytes)
	{
		if (b > 0x7F)
			return false;
	}
	return true;
}

}
