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
#include "Interface.h"

using namespace Ratatoskr;

void ActionContext::AddCommonArguments(std::map<std::string, ArgumentType> *argumentTypes,
	std::map<std::string, std::string> *shortArgumentAliases)
{
	(*argumentTypes)["verbose"] = kArgumentTypeFlag;
	(*argumentTypes)["stdout-errors"] = kArgumentTypeFlag;
	(*argumentTypes)["json"] = kArgumentTypeFlag;
	(*argumentTypes)["adb"] = kArgumentTypeString;
	(*argumentTypes)["fastboot"] = kArgumentTypeString;
	(*argumentTypes)["methods"] = kArgumentTypeString;
	(*argumentTypes)["catalog"] = kArgumentTypeString;
	(*argumentTypes)["command-timeout"] = kArgumentTypeUnsignedInteger;
	(*argumentTypes)["acquire-timeout"] = kArgumentTypeUnsignedInteger;
	(*argumentTypes)["switch-timeout"] = kArgumentTypeUnsignedInteger;
	(*argumentTypes)["scan-timeout"] = kArgumentTypeUnsignedInteger;

	(*shortArgumentAliases)["v"] = "verbose";
}

ActionContext::ActionContext(const Arguments& arguments) :
	arguments(arguments)
{
}

bool ActionContext::Initialise(bool requireMethods)
{
	Interface::SetVerbose(arguments.HasFlag("verbose"));
	Interface::SetStdoutErrors(arguments.HasFlag("stdout-errors"));
	Interface::SetMachineOutput(arguments.HasFlag("json"));

	engineConfig.commandTimeoutMs = arguments.GetUnsignedInteger("command-timeout", engineConfig.commandTimeoutMs);
	engineConfig.acquireTimeoutMs = arguments.GetUnsignedInteger("acquire-timeout", engineConfig.acquireTimeoutMs);
	engineConfig.modeSwitchTimeoutMs = arguments.GetUnsignedInteger("switch-timeout", engineConfig.modeSwitchTimeoutMs);
	engineConfig.cacheTtlSeconds = arguments.GetUnsignedInteger("cache-ttl", engineConfig.cacheTtlSeconds);

	if (arguments.GetArgument("switch-penalty"))
	{
		unsigned int penalty = arguments.GetUnsignedInteger("switch-penalty", 75);

		if (penalty > 100)
		{
			Interface::PrintError("--switch-penalty expects a percentage between 0 and 100\n");
			return (false);
		}

		engineConfig.modeSwitchPenalty = penalty / 100.0;
	}

	std::string methodsPath = arguments.GetString("methods");

	if (!methodsPath.empty())
	{
		if (!registry.LoadFile(methodsPath))
			return (false);
	}
	else if (requireMethods)
	{
		Interface::PrintError("--methods <file> is required\n");
		return (false);
	}

	std::string catalogPath = arguments.GetString("catalog");

	if (!catalogPath.empty())
	{
		catalog.reset(new JsonProfileCatalog());

		if (!catalog->LoadFile(catalogPath))
			return (false);
	}

	if (!usbBus.Initialise())
		return (false);

	detector.reset(new DeviceDetector(&usbBus, arguments.GetUnsignedInteger("scan-timeout",
		DeviceDetector::kDefaultScanTimeoutMs)));
	channelFactory.reset(new HostChannelFactory(arguments.GetString("adb", "adb"),
		arguments.GetString("fastboot", "fastboot"), detector.get()));
	communicationManager.reset(new CommunicationManager(channelFactory.get(), detector.get()));

	return (true);
}

DeviceSnapshot ActionContext::Enrich(const DeviceSnapshot& device)
{
	return (DeviceDetector::Enrich(communicationManager.get(), device, registry.GetLockQuery(device.GetMode()),
		engineConfig.commandTimeoutMs));
}

std::vector<DeviceSnapshot> ActionContext::ScanAndEnrich(void)
{
	std::vector<DeviceSnapshot> devices = detector->Scan();

	for (size_t i = 0; i < devices.size(); i++)
		devices[i] = Enrich(devices[i]);

	return (devices);
}

bool ActionContext::FindDevice(const std::string& serial, DeviceSnapshot *device)
{
	DeviceSnapshot found;

	if (!detector->FindBySerial(serial, &found))
	{
		Interface::PrintError("No device with serial \"%s\" is attached\n", serial.c_str());
		return (false);
	}

	*device = Enrich(found);
	return (true);
}
