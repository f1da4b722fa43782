// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace JDXi
{

struct AddressOffset
{
	int msb = 0, umb = 0, lmb = 0, lsb = 0;

	constexpr AddressOffset operator+(const AddressOffset &other) const noexcept
	{
		return { msb + other.msb, umb + other.umb, lmb + other.lmb, lsb + other.lsb };
	}

	constexpr bool operator==(const AddressOffset &other) const noexcept = default;
};

// Four-byte hierarchical device memory address (MSB, UMB, LMB, LSB)
class Address
{
public:
	constexpr Address() noexcept = default;
	constexpr Address(uint8_t msb, uint8_t umb, uint8_t lmb, uint8_t lsb) noexcept
		: m_bytes{{msb, umb, lmb, lsb}}
	{
	}

	static Address FromBytes(const uint8_t *bytes);

	// Component-wise addition without carry. Returns nothing if any component leaves 0x00...0xFF.
	std::optional<Address> Offset(const AddressOffset &delta) const;
	std::optional<Address> Offset(int msb, int umb, int lmb, int lsb) const { return Offset(AddressOffset{msb, umb, lmb, lsb}); }

	constexpr uint8_t MSB() const noexcept { return m_bytes[0]; }
	constexpr uint8_t UMB() const noexcept { return m_bytes[1]; }
	constexpr uint8_t LMB() const noexcept { return m_bytes[2]; }
	constexpr uint8_t LSB() const noexcept { return m_bytes[3]; }

	constexpr std::array<uint8_t, 4> ToBytes() const noexcept { return m_bytes; }
	std::string ToHexString() const;

	// All components must be 7-bit before the address can be transmitted
	bool IsSevenBitSafe() const;

	constexpr bool operator==(const Address &other) const noexcept = default;

private:
	std::array<uint8_t, 4> m_bytes{};
};

// Part base addresses. Tone and program sections are reached by adding a family's area offset.
constexpr Address BASE_ADDR_SETUP{0x01, 0x00, 0x00, 0x00};
constexpr Address BASE_ADDR_SYSTEM{0x02, 0x00, 0x00, 0x00};
constexpr Address BASE_ADDR_PROGRAM_TEMPORARY{0x18, 0x00, 0x00, 0x00};
constexpr Address BASE_ADDR_DIGITAL1_TEMPORARY{0x19, 0x00, 0x00, 0x00};
constexpr Address BASE_ADDR_DIGITAL2_TEMPORARY{0x19, 0x20, 0x00, 0x00};
constexpr Address BASE_ADDR_ANALOG_TEMPORARY{0x19, 0x40, 0x00, 0x00};
constexpr Address BASE_ADDR_DRUM_TEMPORARY{0x19, 0x60, 0x00, 0x00};

}
