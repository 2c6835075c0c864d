/* Copyright (c) 2010-2011 Benjamin Dobell, Glass Echidna
   Copyright (c) 2012 Marsh Ray
 
 Permission is hereby granted, free of charge, to any person obtaining a copy
 of this software and associated documentation files (the "Software"), to deal
 in the Software without restriction, including without limitation the rights
 to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 copies of the Software, and to permit persons to whom the Software is
 furnished to do so, subject to the following conditions:
 
 The above copyright notice and this permission notice shall be included in
 all copies or substantial portions of the Software.
 
 THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 THE SOFTWARE.*/

// Ratatoskr
#include "ActionContext.h"
#include "InfoAction.h"
#include "Interface.h"
#include "JsonOutput.h"
#include "ProfileResolver.h"

using namespace Ratatoskr;

const char *InfoAction::usage = "Action: info\n\
Arguments: --serial <serial> [--catalog <file>] [--methods <file>]\n\
    [--verbose] [--stdout-errors] [--json] [--adb <path>] [--fastboot <path>]\n\
Description: Describes one device and the profile resolved for it.\n";

namespace
{
	void PrintNames(const char *label, const std::vector<std::string>& names)
	{
		std::string joined;

		for (size_t i = 0; i < names.size(); i++)
		{
			if (i)
				joined += ", ";
			joined += names[i];
		}

		Interface::PrintResult("%-18s %s\n", label, joined.empty() ? "-" : joined.c_str());
	}
}

int InfoAction::Execute(int argc, char **argv)
{
	std::map<std::string, ArgumentType> argumentTypes;
	std::map<std::string, std::string> shortArgumentAliases;
	ActionContext::AddCommonArguments(&argumentTypes, &shortArgumentAliases);
	argumentTypes["serial"] = kArgumentTypeString;

	Arguments arguments(argumentTypes, shortArgumentAliases);

	if (!arguments.ParseArguments(argc, argv, 2) || arguments.GetString("serial").empty())
	{
		Interface::Print("%s", InfoAction::usage);
		return (Interface::kExitFailure);
	}

	ActionContext context(arguments);

	if (!context.Initialise(false))
		return (Interface::kExitFailure);

	DeviceSnapshot device;

	if (!context.FindDevice(arguments.GetString("serial"), &device))
		return (Interface::kExitFailure);

	ProfileResolver resolver(context.GetCatalog(), &context.GetRegistry());

	DeviceProfile profile;
	bool catalogMatch = resolver.Resolve(device, &profile);

	if (context.IsJsonOutput())
	{
		Interface::PrintResult("%s\n", JsonOutput::SerializeDeviceInfo(device, profile, catalogMatch).c_str());
		return (Interface::kExitSuccess);
	}

	Interface::PrintResult("%-18s %s\n", "Serial:", device.GetSerial().c_str());
	Interface::PrintResult("%-18s %s\n", "Device id:", device.GetDeviceId().c_str());
	Interface::PrintResult("%-18s %04x:%04x\n", "USB id:", device.GetVendorId(), device.GetProductId());
	Interface::PrintResult("%-18s %s\n", "Manufacturer:", GetManufacturerName(device.GetManufacturer()));
	Interface::PrintResult("%-18s %s\n", "Mode:", GetModeName(device.GetMode()));
	Interface::PrintResult("%-18s %s\n", "Model:", device.GetModelName().empty() ? "-" : device.GetModelName().c_str());
	Interface::PrintResult("%-18s %s\n", "Android:", device.HasAndroidVersion() ? device.GetAndroidVersion().c_str() : "-");

	if (device.HasApiLevel())
		Interface::PrintResult("%-18s %d\n", "API level:", device.GetApiLevel());
	else
		Interface::PrintResult("%-18s -\n", "API level:");

	Interface::PrintResult("%-18s %s\n", "Lock state:", GetLockStateName(device.GetLockState()));

	Interface::PrintResult("\n%-18s %s%s\n", "Profile:", profile.modelName.c_str(), catalogMatch ? "" : " (generic)");
	Interface::PrintResult("%-18s %s\n", "Difficulty:", GetDifficultyTierName(profile.difficulty));
	PrintNames("Methods:", profile.supportedMethodNames);

	JsonProfileCatalog *catalog = context.GetCatalog();

	if (catalog)
	{
		Interface::PrintResult("\n%-18s %s\n", "Catalog version:", catalog->GetVersion().c_str());
		Interface::PrintResult("%-18s %u\n", "Catalog models:", catalog->GetModelCount());
		PrintNames("Manufacturers:", catalog->GetManufacturerNames());
		Interface::PrintResult("%-18s %.1f%%\n", "Average success:", catalog->GetAverageSuccessRate());
	}

	return (Interface::kExitSuccess);
}
