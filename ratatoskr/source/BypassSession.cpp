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
#include "BypassSession.h"
#include "Timing.h"

using namespace Ratatoskr;

namespace Ratatoskr
{
	const char *GetAttemptStatusName(AttemptStatus status)
	{
		switch (status)
		{
			case kAttemptPending:
				return ("pending");

			case kAttemptPreparing:
				return ("preparing");

			case kAttemptExecuting:
				return ("executing");

			case kAttemptVerifying:
				return ("verifying");

			case kAttemptSuccess:
				return ("success");

			case kAttemptFailed:
				return ("failed");

			case kAttemptError:
				return ("error");

			default:
				return ("invalid");
		}
	}

	bool IsTerminalStatus(AttemptStatus status)
	{
		return (status == kAttemptSuccess || status == kAttemptFailed || status == kAttemptError);
	}

	bool IsValidTransition(AttemptStatus from, AttemptStatus to)
	{
		switch (from)
		{
			case kAttemptPending:
				return (to == kAttemptPreparing);

			case kAttemptPreparing:
				return (to == kAttemptExecuting || to == kAttemptFailed || to == kAttemptError);

			case kAttemptExecuting:
				return (to == kAttemptVerifying || to == kAttemptFailed || to == kAttemptError);

			case kAttemptVerifying:
				return (to == kAttemptSuccess || to == kAttemptFailed || to == kAttemptError);

			default:
				return (false);
		}
	}

	const char *GetErrorClassName(ErrorClass errorClass)
	{
		switch (errorClass)
		{
			case kErrorNone:
				return ("none");

			case kErrorTimeout:
				return ("communication-timeout");

			case kErrorChannelUnavailable:
				return ("channel-unavailable");

			case kErrorDeviceDisconnected:
				return ("device-disconnected");

			case kErrorUnexpectedState:
				return ("unexpected-state");

			default:
				return ("invalid");
		}
	}

	ErrorClass GetErrorClass(CommandStatus status)
	{
		switch (status)
		{
			case kCommandTimedOut:
				return (kErrorTimeout);

			case kCommandChannelUnavailable:
				return (kErrorChannelUnavailable);

			case kCommandDeviceDisconnected:
				return (kErrorDeviceDisconnected);

			case kCommandUnexpectedState:
				return (kErrorUnexpectedState);

			default:
				return (kErrorNone);
		}
	}

	const char *GetSessionStatusName(SessionStatus status)
	{
		switch (status)
		{
			case kSessionRunning:
				return ("running");

			case kSessionSuccess:
				return ("success");

			case kSessionExhaustedAllMethods:
				return ("exhausted-all-methods");

			case kSessionAborted:
				return ("aborted");

			case kSessionPlanned:
				return ("planned");

			default:
				return ("invalid");
		}
	}
}

BypassAttempt::BypassAttempt(const std::string& methodName, bool retry) :
	methodName(methodName),
	status(kAttemptPending),
	errorClass(kErrorNone),
	executionDurationMs(0),
	retry(retry)
{
}

bool BypassAttempt::Transition(AttemptStatus newStatus)
{
	if (!IsValidTransition(status, newStatus))
		return (false);

	status = newStatus;
	return (true);
}

void BypassAttempt::Log(const std::string& message)
{
	LogEntry entry;
	entry.timestamp = Timing::GetWallClockMs();
	entry.message = message;

	logEntries.push_back(entry);
}

bool BypassAttempt::HasLogEntryContaining(const std::string& text) const
{
	for (size_t i = 0; i < logEntries.size(); i++)
	{
		if (logEntries[i].message.find(text) != std::string::npos)
			return (true);
	}

	return (false);
}

PlanEntry::PlanEntry() :
	weight(0.0),
	risk(kRiskMedium),
	requiredMode(kModeDebugBridge),
	requiresModeSwitch(false),
	status(kAttemptPending),
	applicable(false)
{
}

BypassSession::BypassSession() :
	startedAt(0),
	endedAt(0),
	dryRun(false),
	finalStatus(kSessionRunning)
{
}

BypassSession::BypassSession(const std::string& sessionId, const DeviceSnapshot& device, uint64_t startedAt,
	bool dryRun) :
	sessionId(sessionId),
	device(device),
	startedAt(startedAt),
	endedAt(0),
	dryRun(dryRun),
	finalStatus(kSessionRunning)
{
}
