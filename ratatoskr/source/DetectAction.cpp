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
#include "DetectAction.h"
#include "Interface.h"
#include "JsonOutput.h"

using namespace Ratatoskr;

const char *DetectAction::usage = "Action: detect\n\
Arguments: [--verbose] [--stdout-errors] [--json] [--methods <file>]\n\
    [--adb <path>] [--fastboot <path>] [--scan-timeout <ms>] [--command-timeout <ms>]\n\
Description: Lists every attached device that can be classified, with its mode\n\
    and, where the current mode allows read-only queries, its lock state.\n";

int DetectAction::Execute(int argc, char **argv)
{
	std::map<std::string, ArgumentType> argumentTypes;
	std::map<std::string, std::string> shortArgumentAliases;
	ActionContext::AddCommonArguments(&argumentTypes, &shortArgumentAliases);

	Arguments arguments(argumentTypes, shortArgumentAliases);

	if (!arguments.ParseArguments(argc, argv, 2))
	{
		Interface::Print("%s", DetectAction::usage);
		return (Interface::kExitFailure);
	}

	ActionContext context(arguments);

	if (!context.Initialise(false))
		return (Interface::kExitFailure);

	std::vector<DeviceSnapshot> devices = context.ScanAndEnrich();

	if (context.IsJsonOutput())
		Interface::PrintResult("%s\n", JsonOutput::SerializeSnapshots(devices).c_str());

	if (devices.empty())
	{
		Interface::PrintDeviceDetectionFailed();
		return (Interface::kExitFailure);
	}

	if (!context.IsJsonOutput())
	{
		for (size_t i = 0; i < devices.size(); i++)
		{
			const DeviceSnapshot& device = devices[i];

			Interface::PrintResult("%-24s %04x:%04x  %-8s %-22s %-9s %s\n", device.GetSerial().c_str(),
				device.GetVendorId(), device.GetProductId(), GetManufacturerName(device.GetManufacturer()),
				GetModeName(device.GetMode()), GetLockStateName(device.GetLockState()),
				device.GetModelName().c_str());
		}
	}

	return (Interface::kExitSuccess);
}
