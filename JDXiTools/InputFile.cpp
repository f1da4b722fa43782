// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "InputFile.hpp"
#include "SysEx.hpp"
#include "Utils.hpp"

namespace JDXi
{

InputFile::InputFile(std::istream &file)
	: m_file{file}
{
	std::array<char, 4> magic{};
	if (Read(m_file, magic) && CompareMagic(magic, "MThd"))
	{
		m_type = Type::MID;
		uint32_t headerLength = ReadUint32BE();
		m_file.seekg(headerLength, std::ios::cur);
		m_trackBytesRemain = 0;
	}
	else
	{
		m_file.clear();
		m_file.seekg(0);
	}
}

std::vector<uint8_t> InputFile::NextSysExMessage()
{
	if (m_type == Type::MID)
		return NextSysExFromMID();
	else
		return NextSysExFromSYX();
}

std::vector<uint8_t> InputFile::NextSysExFromSYX()
{
	const int eof = std::char_traits<char>::eof();
	int ch = 0;
	do
	{
		ch = m_file.get();
	} while (ch != eof && ch != SYSEX_START);
	if (ch != SYSEX_START)
		return {};

	std::vector<uint8_t> message{SYSEX_START};
	while ((ch = m_file.get()) != eof)
	{
		message.push_back(static_cast<uint8_t>(ch));
		if (ch == SYSEX_END)
			return message;
	}
	std::cerr << "Truncated SysEx message at end of file (" << message.size() << " bytes)" << std::endl;
	return message;
}

std::vector<uint8_t> InputFile::NextSysExFromMID()
{
	while (!m_file.eof())
	{
		if (!m_trackBytesRemain)
		{
			std::array<char, 4> magic{};
			if (!Read(m_file, magic))
				return {};
			if (!CompareMagic(magic, "MTrk"))
			{
				std::cerr << "Malformed MIDI file? Unexpected track header value" << std::endl;
				return {};
			}
			m_trackBytesRemain = ReadUint32BE();
		}

		// Skip delay value
		ReadVarInt();

		uint8_t data1 = ReadUint8();
		if (data1 == 0xFF)
		{
			Skip(1);
			Skip(ReadVarInt());
			continue;
		}
		uint8_t command = m_lastCommand;
		if (data1 & 0x80)
		{
			// Command byte (if not present, use running status for channel messages)
			command = data1;
			if (data1 < 0xF0)
			{
				m_lastCommand = data1;
				data1 = ReadUint8();
			}
		}

		switch (command & 0xF0)
		{
		case 0x80:
		case 0x90:
		case 0xA0:
		case 0xB0:
		case 0xE0:
			Skip(1);
			break;
		case 0xC0:
		case 0xD0:
			break;
		case 0xF0:
			switch (command & 0x0F)
			{
			case 0x00:
			case 0x07:
			{
				// F0 events store the message without the leading F0
				uint32_t sysExLength = ReadVarInt();
				std::vector<uint8_t> message;
				if (command == SYSEX_START)
					message.push_back(SYSEX_START);
				std::vector<uint8_t> body;
				if (!ReadVector(m_file, body, sysExLength))
				{
					std::cerr << "Truncated SysEx event at end of file" << std::endl;
					body.resize(static_cast<size_t>(m_file.gcount()));
				}
				m_trackBytesRemain -= sysExLength;
				message.insert(message.end(), body.begin(), body.end());
				if (!message.empty() && message.back() != SYSEX_END)
				{
					std::cerr << "NOT IMPLEMENTED: Continued SysEx message" << std::endl;
				}
				return message;
			}
			case 0x01:
			case 0x03:
				Skip(1);
				break;
			case 0x02:
				Skip(2);
				break;
			default:
				break;
			}
			break;
		}
	}
	return {};
}

uint32_t InputFile::ReadVarInt()
{
	uint8_t b = ReadUint8();
	uint32_t value = (b & 0x7F);

	while (!m_file.eof() && (b & 0x80) != 0)
	{
		b = ReadUint8();
		value <<= 7;
		value |= (b & 0x7F);
	}
	return value;
}

uint32_t InputFile::ReadUint32BE()
{
	std::array<uint8_t, 4> bytes{};
	Read(m_file, bytes);
	m_trackBytesRemain -= 4;
	return (bytes[0] << 24)
		| (bytes[1] << 16)
		| (bytes[2] << 8)
		| bytes[3];
}

uint8_t InputFile::ReadUint8()
{
	m_trackBytesRemain--;
	return static_cast<uint8_t>(m_file.get());
}

void InputFile::Skip(uint32_t bytes)
{
	m_file.ignore(bytes);
	m_trackBytesRemain -= bytes;
}

}
