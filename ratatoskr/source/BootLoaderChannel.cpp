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
#include "BootLoaderChannel.h"
#include "Interface.h"

using namespace Ratatoskr;

BootLoaderChannel::BootLoaderChannel(const std::string& fastbootPath, const DeviceSnapshot& device,
	DeviceLocator *locator) :
	ToolChannel(fastbootPath, device, locator)
{
}

bool BootLoaderChannel::IsDisconnectMessage(const std::string& message) const
{
	std::string lowered = ToLowerCase(message);

	return (lowered.find("no such device") != std::string::npos
		|| lowered.find("device not found") != std::string::npos
		|| lowered.find("status read failed") != std::string::npos);
}

const char *BootLoaderChannel::GetSwitchCommand(DeviceMode targetMode)
{
	switch (targetMode)
	{
		case kModeDebugBridge:
			return ("reboot");

		case kModeRecovery:
			return ("reboot recovery");

		case kModeEmergencyDownload:
			return ("oem edl");

		default:
			return (nullptr);
	}
}

std::string BootLoaderChannel::ParseVariable(const std::string& output, const std::string& name)
{
	std::string prefix = name + ":";
	size_t position = 0;

	while (position < output.size())
	{
		size_t lineEnd = output.find('\n', position);
		if (lineEnd == std::string::npos)
			lineEnd = output.size();

		std::string line = output.substr(position, lineEnd - position);

		if (line.compare(0, prefix.size(), prefix) == 0)
		{
			std::string value = line.substr(prefix.size());

			size_t first = value.find_first_not_of(" \t\r");
			size_t last = value.find_last_not_of(" \t\r");

			if (first == std::string::npos)
				return ("");

			return (value.substr(first, last - first + 1));
		}

		position = lineEnd + 1;
	}

	return ("");
}

CommandStatus BootLoaderChannel::SwitchMode(DeviceMode targetMode, int timeoutMs)
{
	if (!IsModeSwitchSupported(device.GetManufacturer(), device.GetMode(), targetMode))
	{
		Interface::PrintWarning("%s cannot switch %s from %s to %s\n", GetKindName(GetKind()), device.GetSerial().c_str(),
			GetModeName(device.GetMode()), GetModeName(targetMode));
		return (kCommandFailed);
	}

	Interface::Print("Requesting %s to reboot into %s mode...\n", device.GetSerial().c_str(), GetModeName(targetMode));
	return (Execute(GetSwitchCommand(targetMode), timeoutMs).status);
}

CommandResult BootLoaderChannel::Probe(int timeoutMs)
{
	std::vector<std::string> arguments;
	arguments.push_back("getvar");
	arguments.push_back("product");

	CommandResult result = RunTool(arguments, timeoutMs);

	if (result.status == kCommandSucceeded && ParseVariable(result.standardError + "\n" + result.standardOutput, "product").empty())
	{
		result.status = kCommandFailed;
		result.success = false;
		result.standardError = "boot loader did not report a product";
	}

	return (result);
}
