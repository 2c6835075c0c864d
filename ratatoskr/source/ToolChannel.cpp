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
#include "Interface.h"
#include "ProcessRunner.h"
#include "ToolChannel.h"

using namespace Ratatoskr;

ToolChannel::ToolChannel(const std::string& toolPath, const DeviceSnapshot& device, DeviceLocator *locator) :
	toolPath(toolPath),
	device(device),
	locator(locator)
{
}

CommandResult ToolChannel::RunTool(const std::vector<std::string>& toolArguments, int timeoutMs)
{
	std::vector<std::string> arguments;
	arguments.push_back(toolPath);
	arguments.push_back("-s");
	arguments.push_back(device.GetSerial());
	arguments.insert(arguments.end(), toolArguments.begin(), toolArguments.end());

	if (Interface::IsVerbose())
	{
		std::string commandLine;
		for (size_t i = 0; i < arguments.size(); i++)
		{
			if (i)
				commandLine += ' ';
			commandLine += arguments[i];
		}

		Interface::PrintVerbose("[%s] %s\n", GetKindName(GetKind()), commandLine.c_str());
	}

	ProcessRunner::Result run = ProcessRunner::Run(arguments, timeoutMs);

	CommandResult result;
	result.standardOutput = run.standardOutput;
	result.standardError = run.standardError;
	result.durationMs = run.durationMs;

	if (run.status == ProcessRunner::kRunFailedToStart)
	{
		result.status = kCommandChannelUnavailable;
	}
	else if (run.status == ProcessRunner::kRunTimedOut)
	{
		//	A tool waiting on a device that has gone away looks like a timeout from here.
		if (locator && !locator->IsPresent(device.GetSerial()))
			result.status = kCommandDeviceDisconnected;
		else
			result.status = kCommandTimedOut;
	}
	else if (run.exitCode == 0)
	{
		result.status = kCommandSucceeded;
	}
	else if (IsDisconnectMessage(run.standardError) || IsDisconnectMessage(run.standardOutput))
	{
		result.status = kCommandDeviceDisconnected;
	}
	else
	{
		result.status = kCommandFailed;
	}

	result.success = (result.status == kCommandSucceeded);

	if (!result.success)
	{
		Interface::PrintVerbose("[%s] %s after %u ms (exit code %d)\n", GetKindName(GetKind()),
			GetCommandStatusName(result.status), result.durationMs, run.exitCode);
	}

	return (result);
}

CommandResult ToolChannel::Execute(const std::string& command, int timeoutMs)
{
	std::vector<std::string> toolArguments = ProcessRunner::SplitCommandLine(command);

	if (toolArguments.empty())
		return (CommandResult(kCommandFailed, "empty command"));

	return (RunTool(toolArguments, timeoutMs));
}
