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

// C Standard Library
#include <signal.h>

// C++ Standard Library
#include <thread>

// Ratatoskr
#include "ActionContext.h"
#include "AuditSink.h"
#include "Authorizer.h"
#include "BypassAction.h"
#include "BypassEngine.h"
#include "Interface.h"
#include "JsonOutput.h"
#include "ProfileResolver.h"
#include "ResultCache.h"

using namespace Ratatoskr;

const char *BypassAction::usage = "Action: bypass\n\
Arguments: --methods <file> --authorized <file> [--serial <serial>]\n\
    [--method <name>] [--dry-run] [--catalog <file>] [--audit-log <file>]\n\
    [--cache-ttl <seconds>] [--switch-penalty <percent>] [--verbose]\n\
    [--stdout-errors] [--json] [--adb <path>] [--fastboot <path>]\n\
    [--command-timeout <ms>] [--acquire-timeout <ms>] [--switch-timeout <ms>]\n\
Description: Ranks the candidate methods for a device and runs them in order\n\
    until one clears the lock. Without --serial every locked device is\n\
    processed, each on its own thread. --dry-run reports the plan only.\n";

namespace
{
	CancelToken cancelToken;

	void HandleInterrupt(int signalNumber)
	{
		cancelToken.Cancel();
	}

	class ProgressObserver : public SessionObserver
	{
		public:

			void OnTransition(const TransitionEvent& event)
			{
				Interface::Print("%s: %s%s %s -> %s%s%s\n", event.deviceSerial.c_str(), event.methodName.c_str(),
					event.retry ? " (retry)" : "", GetAttemptStatusName(event.fromStatus),
					GetAttemptStatusName(event.toStatus), event.detail.empty() ? "" : ": ", event.detail.c_str());
			}
	};

	void PrintSession(const BypassSession& session)
	{
		Interface::PrintResult("%s [%s]\n", session.GetDeviceSerial().c_str(), session.GetSessionId().c_str());

		const std::vector<PlanEntry>& plan = session.GetPlan();
		for (size_t i = 0; i < plan.size(); i++)
		{
			const PlanEntry& entry = plan[i];

			Interface::PrintResult("  %u. %-28s %.3f  %-9s %-10s %s\n", static_cast<unsigned int>(i + 1),
				entry.methodName.c_str(), entry.weight, GetRiskTierName(entry.risk), GetAttemptStatusName(entry.status),
				session.IsDryRun() ? entry.verdict.c_str() : "");
		}

		Interface::PrintResult("  %s\n", session.GetSummary().c_str());
	}
}

int BypassAction::Execute(int argc, char **argv)
{
	std::map<std::string, ArgumentType> argumentTypes;
	std::map<std::string, std::string> shortArgumentAliases;
	ActionContext::AddCommonArguments(&argumentTypes, &shortArgumentAliases);
	argumentTypes["serial"] = kArgumentTypeString;
	argumentTypes["method"] = kArgumentTypeString;
	argumentTypes["dry-run"] = kArgumentTypeFlag;
	argumentTypes["authorized"] = kArgumentTypeString;
	argumentTypes["audit-log"] = kArgumentTypeString;
	argumentTypes["cache-ttl"] = kArgumentTypeUnsignedInteger;
	argumentTypes["switch-penalty"] = kArgumentTypeUnsignedInteger;

	Arguments arguments(argumentTypes, shortArgumentAliases);

	if (!arguments.ParseArguments(argc, argv, 2))
	{
		Interface::Print("%s", BypassAction::usage);
		return (Interface::kExitFailure);
	}

	if (arguments.GetString("authorized").empty())
	{
		Interface::PrintError("--authorized <file> is required\n");
		return (Interface::kExitAuthorizationDenied);
	}

	ActionContext context(arguments);

	if (!context.Initialise(true))
		return (Interface::kExitFailure);

	FileAuthorizer authorizer;

	if (!authorizer.LoadFile(arguments.GetString("authorized")))
		return (Interface::kExitAuthorizationDenied);

	std::unique_ptr<FileAuditSink> auditSink;

	if (!arguments.GetString("audit-log").empty())
		auditSink.reset(new FileAuditSink(arguments.GetString("audit-log")));

	std::vector<DeviceSnapshot> devices;
	std::string serial = arguments.GetString("serial");

	if (!serial.empty())
	{
		DeviceSnapshot device;

		if (!context.FindDevice(serial, &device))
			return (Interface::kExitFailure);

		if (device.GetLockState() == kLockStateUnlocked)
		{
			Interface::PrintError("%s is not locked\n", serial.c_str());
			return (Interface::kExitFailure);
		}

		devices.push_back(device);
	}
	else
	{
		devices = DeviceDetector::FilterLocked(context.ScanAndEnrich());

		if (devices.empty())
		{
			Interface::PrintError("No locked devices found\n");
			return (Interface::kExitFailure);
		}
	}

	const EngineConfig& config = context.GetEngineConfig();

	MemoryResultCache resultCache(config.cacheTtlSeconds);
	ProfileResolver resolver(context.GetCatalog(), &context.GetRegistry());
	BypassEngine engine(config, &context.GetCommunicationManager(), &context.GetRegistry(), &resolver, &authorizer,
		auditSink.get(), &resultCache);

	ProgressObserver observer;

	signal(SIGINT, HandleInterrupt);

	std::vector<BypassSession> sessions(devices.size());
	std::vector<int> results(devices.size(), BypassEngine::kRunCompleted);
	std::vector<BypassRequest> requests(devices.size());
	std::vector<std::thread> threads;

	for (size_t i = 0; i < devices.size(); i++)
	{
		requests[i].device = devices[i];
		requests[i].methodName = arguments.GetString("method");
		requests[i].dryRun = arguments.HasFlag("dry-run");
		requests[i].observer = &observer;
		requests[i].cancelToken = &cancelToken;
	}

	for (size_t i = 0; i < devices.size(); i++)
	{
		threads.push_back(std::thread([&engine, &requests, &sessions, &results, i]()
		{
			results[i] = engine.Run(requests[i], &sessions[i]);
		}));
	}

	for (size_t i = 0; i < threads.size(); i++)
		threads[i].join();

	signal(SIGINT, SIG_DFL);

	if (context.IsJsonOutput())
	{
		Interface::PrintResult("%s\n", JsonOutput::SerializeSessions(sessions).c_str());
	}
	else
	{
		for (size_t i = 0; i < sessions.size(); i++)
			PrintSession(sessions[i]);
	}

	EngineStatistics statistics = engine.GetStatistics();
	Interface::PrintVerbose("Sessions: %u succeeded, %u exhausted, %u aborted, %u planned, %u denied\n",
		statistics.succeeded, statistics.exhausted, statistics.aborted, statistics.planned, statistics.denied);

	bool success = true;

	for (size_t i = 0; i < sessions.size(); i++)
	{
		if (results[i] == BypassEngine::kRunAuthorizationDenied)
			return (Interface::kExitAuthorizationDenied);

		SessionStatus expected = sessions[i].IsDryRun() ? kSessionPlanned : kSessionSuccess;

		if (results[i] != BypassEngine::kRunCompleted || sessions[i].GetFinalStatus() != expected)
			success = false;
	}

	return (success ? Interface::kExitSuccess : Interface::kExitFailure);
}
