// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <cstdint>
#include <iostream>
#include <vector>

namespace JDXi
{

// Reads SysEx messages from raw .syx dumps or Standard MIDI Files
class InputFile
{
public:
	enum class Type
	{
		SYX,
		MID,
	};

	InputFile(std::istream &file);

	// Complete message including F0 and F7, empty at end of file
	std::vector<uint8_t> NextSysExMessage();

	Type GetType() const { return m_type; }

private:
	std::vector<uint8_t> NextSysExFromSYX();
	std::vector<uint8_t> NextSysExFromMID();

	uint32_t ReadVarInt();
	uint32_t ReadUint32BE();
	uint8_t ReadUint8();
	void Skip(uint32_t bytes);

	std::istream &m_file;
	Type m_type = Type::SYX;
	uint32_t m_trackBytesRemain = 0;
	uint8_t m_lastCommand = 0;
};

}
