// JDXiTools - SysEx codec and parameter utility for Roland JD-Xi
// 2024 by the JDXiTools developers
// License: BSD 3-clause

#pragma once

#include <string>

namespace JDXi
{

class ParameterRegistries;
struct ParsedToneData;
struct DeviceInfo;

// Where the message landed: "19420000 Analog Synth / Common"
std::string DescribeSection(const ParsedToneData &data);

void PrintToneData(const ParameterRegistries &registries, const ParsedToneData &data);
void PrintDeviceInfo(const DeviceInfo &info);

}
