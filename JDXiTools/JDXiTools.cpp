// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#include "JDXiTools.hpp"
#include "DeviceInfo.hpp"
#include "InputFile.hpp"
#include "ParameterRegistry.hpp"
#include "SysEx.hpp"
#include "SysExParser.hpp"
#include "Utils.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace JDXi;

namespace
{
	struct AreaArgument
	{
		const char *name;
		TemporaryArea area;
	};

	constexpr AreaArgument AreaArguments[] =
	{
		{ "setup", TemporaryArea::Setup },
		{ "system", TemporaryArea::System },
		{ "program", TemporaryArea::Program },
		{ "digital1", TemporaryArea::Digital1 },
		{ "digital2", TemporaryArea::Digital2 },
		{ "analog", TemporaryArea::Analog },
		{ "drum", TemporaryArea::Drum },
	};

	struct FamilyArgument
	{
		const char *name;
		Family family;
	};

	constexpr FamilyArgument FamilyArguments[] =
	{
		{ "digital-common", Family::DigitalCommon },
		{ "digital-partial", Family::DigitalPartial },
		{ "digital-modify", Family::DigitalModify },
		{ "analog", Family::Analog },
		{ "drum-common", Family::DrumCommon },
		{ "drum-partial", Family::DrumPartial },
		{ "program-common", Family::ProgramCommon },
		{ "vocal-fx", Family::VocalFx },
		{ "effect1", Family::Effect1 },
		{ "effect2", Family::Effect2 },
		{ "delay", Family::Delay },
		{ "reverb", Family::Reverb },
		{ "program-part", Family::ProgramPart },
		{ "program-zone", Family::ProgramZone },
		{ "arpeggio", Family::Arpeggio },
		{ "system-common", Family::SystemCommon },
	};
}

static void PrintUsage()
{
	std::cout <<
R"(JDXiTools - SysEx codec and parameter utility for Roland JD-Xi

Usage:

JDXiTools list <input.syx>
  Lists all JD-Xi SysEx messages in a SYX or MID file, one line per message.

JDXiTools dump <input.syx>
  Decodes all JD-Xi SysEx messages in a SYX or MID file and prints every
  parameter they contain.

JDXiTools compose <area> <family> <parameter> <value> [partial]
  Prints the Data Set (DT1) message that writes a single parameter.
  The value is given as shown on the device (e.g. -63 to +63 for pan).
  The partial is required for digital-partial (1-3), drum-partial (1-37),
  program-part (1-4) and program-zone (1-4).

JDXiTools request <area> <family> [partial]
  Prints the Data Request (RQ1) message that dumps a complete section.

JDXiTools identity [hex bytes]
  Without arguments, prints the MIDI identity request.
  With the bytes of an identity reply, decodes the reply.

Areas:
  setup, system, program, digital1, digital2, analog, drum

Families:
  digital-common, digital-partial, digital-modify, analog, drum-common,
  drum-partial, program-common, vocal-fx, effect1, effect2, delay, reverb,
  program-part, program-zone, arpeggio, system-common

Options:
  --guide-layout
    Use the parameter guide's program level and tempo offsets (0x16 / 0x17)
    instead of the program editor's (0x10 / 0x11).
)" << std::endl;
}

static std::optional<TemporaryArea> ParseArea(const std::string_view name)
{
	for (const auto &arg : AreaArguments)
	{
		if (name == arg.name)
			return arg.area;
	}
	return std::nullopt;
}

static std::optional<Family> ParseFamily(const std::string_view name)
{
	for (const auto &arg : FamilyArguments)
	{
		if (name == arg.name)
			return arg.family;
	}
	return std::nullopt;
}

static std::optional<int32_t> ParseInt(const std::string_view str)
{
	std::string_view digits = str;
	if (!digits.empty() && digits.front() == '+')
		digits.remove_prefix(1);
	int32_t value = 0;
	const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
	if (ec != std::errc{} || end != digits.data() + digits.size())
		return std::nullopt;
	return value;
}

// Accepts "F0 7E 10" as well as separate arguments per byte
static bool ParseHexBytes(const std::vector<std::string_view> &args, std::vector<uint8_t> &bytes)
{
	for (const auto arg : args)
	{
		std::istringstream str{std::string{arg}};
		std::string token;
		while (str >> token)
		{
			unsigned int value = 0;
			const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value, 16);
			if (ec != std::errc{} || end != token.data() + token.size() || value > 0xFF)
			{
				std::cerr << "Invalid hex byte: " << token << std::endl;
				return false;
			}
			bytes.push_back(static_cast<uint8_t>(value));
		}
	}
	return !bytes.empty();
}

static int ReadFile(const ParameterRegistries &registries, const std::string &inFilename, const bool verbose)
{
	std::ifstream inFile{inFilename, std::ios::binary};
	if (!inFile)
	{
		std::cout << "Could not open " << inFilename << " for reading!" << std::endl;
		return 2;
	}

	InputFile inputFile{inFile};
	int numMessages = 0;
	std::vector<uint8_t> message;
	do
	{
		message = inputFile.NextSysExMessage();
		if (message.empty())
			break;

		DeviceInfo info;
		if (ParseIdentityReply(message, info))
		{
			if (verbose)
				PrintDeviceInfo(info);
			else
				std::cout << "Identity reply: " << info.ToString() << std::endl;
			numMessages++;
			continue;
		}

		ParsedToneData data;
		const SysExError error = ParseToneData(registries, message, data);
		if (error == SysExError::ChecksumMismatch)
		{
			std::cerr << "Invalid SysEx checksum!" << std::endl;
			return 3;
		}
		else if (error != SysExError::None)
		{
			std::cout << "Ignoring SysEx message: " << ErrorName(error) << std::endl;
			continue;
		}

		numMessages++;
		if (verbose)
		{
			std::cout << "----------------------------------------" << std::endl;
			PrintToneData(registries, data);
		}
		else
		{
			std::cout << DescribeSection(data);
			if (!data.name.empty())
				std::cout << " \"" << data.name << "\"";
			std::cout << ", " << data.successes.size() << " parameters" << std::endl;
		}
	} while (!message.empty());

	if (!numMessages)
	{
		std::cout << "Input didn't contain any JD-Xi SysEx messages!" << std::endl;
		return 2;
	}
	return 0;
}

int main(const int argc, char *argv[])
{
	std::vector<std::string_view> args;
	ProgramCommonLayout layout = ProgramCommonLayout::EditorOffsets;
	for (int i = 1; i < argc; i++)
	{
		const std::string_view arg = argv[i];
		if (arg == "--guide-layout")
			layout = ProgramCommonLayout::GuideOffsets;
		else
			args.push_back(arg);
	}

	if (args.empty())
	{
		PrintUsage();
		return 1;
	}

	const std::string_view verb = args[0];
	if (verb != "list" && verb != "dump" && verb != "compose" && verb != "request" && verb != "identity")
	{
		PrintUsage();
		return 1;
	}
	if (((verb == "list" || verb == "dump") && args.size() != 2)
		|| (verb == "compose" && args.size() != 5 && args.size() != 6)
		|| (verb == "request" && args.size() != 3 && args.size() != 4))
	{
		PrintUsage();
		return 1;
	}

	if (verb == "identity")
	{
		if (args.size() == 1)
		{
			std::cout << ToHexString(IdentityRequest()) << std::endl;
			return 0;
		}
		const std::vector<std::string_view> hexArgs(args.begin() + 1, args.end());
		std::vector<uint8_t> message;
		if (!ParseHexBytes(hexArgs, message))
			return 2;
		DeviceInfo info;
		if (!ParseIdentityReply(message, info))
		{
			std::cerr << "Not a MIDI identity reply!" << std::endl;
			return 3;
		}
		PrintDeviceInfo(info);
		return 0;
	}

	const ParameterRegistries registries{layout};

	if (verb == "list" || verb == "dump")
		return ReadFile(registries, std::string{args[1]}, verb == "dump");

	const auto area = ParseArea(args[1]);
	const auto family = ParseFamily(args[2]);
	if (!area || !family)
	{
		std::cerr << "Unknown area or family: " << args[1] << " " << args[2] << std::endl;
		return 2;
	}
	const std::optional<Address> baseAddress = GetPartBase(*area);
	if (!baseAddress)
	{
		std::cerr << "Area has no base address: " << args[1] << std::endl;
		return 2;
	}

	const size_t partialArg = (verb == "compose") ? 5 : 3;
	std::optional<int> partial;
	if (args.size() > partialArg)
	{
		const auto value = ParseInt(args[partialArg]);
		if (!value)
		{
			std::cerr << "Invalid partial number: " << args[partialArg] << std::endl;
			return 2;
		}
		partial = *value;
	}

	SysExMessage message;
	SysExError error = SysExError::None;
	if (verb == "compose")
	{
		const auto value = ParseInt(args[4]);
		if (!value)
		{
			std::cerr << "Invalid value: " << args[4] << std::endl;
			return 2;
		}
		error = Compose(registries, *baseAddress, *family, args[3], *value, partial, message);
	}
	else
	{
		error = ComposeSectionRequest(registries, *baseAddress, *family, partial, message);
	}

	if (error != SysExError::None)
	{
		std::cerr << "Could not compose message: " << ErrorName(error) << std::endl;
		return 3;
	}
	std::cout << message.ToHexString() << std::endl;
	return 0;
}
