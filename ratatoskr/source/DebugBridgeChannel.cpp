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
#include "DebugBridgeChannel.h"
#include "Interface.h"
#include "ProcessRunner.h"

using namespace Ratatoskr;

namespace
{
	const char *disconnectMessages[] = {
		"not found",
		"no devices/emulators found",
		"device offline",
		"error: closed",
		"device unauthorized"
	};
}

DebugBridgeChannel::DebugBridgeChannel(const std::string& adbPath, const DeviceSnapshot& device,
	DeviceLocator *locator) :
	ToolChannel(adbPath, device, locator)
{
}

bool DebugBridgeChannel::IsDisconnectMessage(const std::string& message) const
{
	return (IsDisconnectText(message));
}

bool DebugBridgeChannel::IsDisconnectText(const std::string& message)
{
	std::string lowered = ToLowerCase(message);

	for (size_t i = 0; i < sizeof(disconnectMessages) / sizeof(disconnectMessages[0]); i++)
	{
		if (lowered.find(disconnectMessages[i]) != std::string::npos)
			return (true);
	}

	return (false);
}

const char *DebugBridgeChannel::GetSwitchCommand(DeviceMode targetMode)
{
	switch (targetMode)
	{
		case kModeDebugBridge:
			return ("reboot");

		case kModeBootLoader:
			return ("reboot bootloader");

		case kModeRecovery:
			return ("reboot recovery");

		case kModeManufacturerDownload:
			return ("reboot download");

		case kModeEmergencyDownload:
			return ("reboot edl");

		default:
			return (nullptr);
	}
}

CommandStatus DebugBridgeChannel::SwitchMode(DeviceMode targetMode, int timeoutMs)
{
	if (!IsModeSwitchSupported(device.GetManufacturer(), device.GetMode(), targetMode))
	{
		Interface::PrintWarning("%s cannot switch %s from %s to %s\n", GetKindName(GetKind()), device.GetSerial().c_str(),
			GetModeName(device.GetMode()), GetModeName(targetMode));
		return (kCommandFailed);
	}

	const char *command = GetSwitchCommand(targetMode);

	Interface::Print("Requesting %s to reboot into %s mode...\n", device.GetSerial().c_str(), GetModeName(targetMode));
	return (Execute(command, timeoutMs).status);
}

CommandResult DebugBridgeChannel::Probe(int timeoutMs)
{
	std::vector<std::string> arguments;
	arguments.push_back("get-state");

	CommandResult result = RunTool(arguments, timeoutMs);

	if (result.status == kCommandSucceeded)
	{
		std::string state = ToLowerCase(result.standardOutput);

		if (state.find("device") == std::string::npos && state.find("recovery") == std::string::npos
			&& state.find("sideload") == std::string::npos)
		{
			result.status = kCommandFailed;
			result.success = false;
			result.standardError = "debug bridge reports state: " + result.standardOutput;
		}
	}

	return (result);
}
