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

#ifndef RATATOSKR_BYPASSSESSION_H
#define RATATOSKR_BYPASSSESSION_H

// Ratatoskr
#include "BypassMethodDescriptor.h"
#include "Channel.h"

namespace Ratatoskr
{
	class BypassEngine;

	enum AttemptStatus
	{
		kAttemptPending = 0,
		kAttemptPreparing,
		kAttemptExecuting,
		kAttemptVerifying,
		kAttemptSuccess,
		kAttemptFailed,
		kAttemptError
	};

	const char *GetAttemptStatusName(AttemptStatus status);
	bool IsTerminalStatus(AttemptStatus status);

	// Pending -> Preparing -> Executing -> Verifying -> Success, with Failed and Error reachable
	// from every non-terminal state after Pending.
	bool IsValidTransition(AttemptStatus from, AttemptStatus to);

	enum ErrorClass
	{
		kErrorNone = 0,
		kErrorTimeout,
		kErrorChannelUnavailable,
		kErrorDeviceDisconnected,
		kErrorUnexpectedState
	};

	const char *GetErrorClassName(ErrorClass errorClass);
	ErrorClass GetErrorClass(CommandStatus status);

	enum SessionStatus
	{
		kSessionRunning = 0,
		kSessionSuccess,
		kSessionExhaustedAllMethods,
		kSessionAborted,
		kSessionPlanned
	};

	const char *GetSessionStatusName(SessionStatus status);

	struct LogEntry
	{
		uint64_t timestamp;
		std::string message;
	};

	// One run of one method against one device. Only the engine thread driving it mutates it.
	class BypassAttempt
	{
		friend class BypassEngine;

		private:

			std::string methodName;
			AttemptStatus status;
			std::vector<LogEntry> logEntries;
			std::vector<std::string> completedSteps;
			std::string errorMessage;
			ErrorClass errorClass;
			unsigned int executionDurationMs;
			bool retry;

			bool Transition(AttemptStatus newStatus);
			void Log(const std::string& message);

		public:

			BypassAttempt(const std::string& methodName, bool retry);

			const std::string& GetMethodName(void) const
			{
				return (methodName);
			}

			AttemptStatus GetStatus(void) const
			{
				return (status);
			}

			const std::vector<LogEntry>& GetLogEntries(void) const
			{
				return (logEntries);
			}

			const std::vector<std::string>& GetCompletedSteps(void) const
			{
				return (completedSteps);
			}

			bool HasError(void) const
			{
				return (!errorMessage.empty());
			}

			const std::string& GetErrorMessage(void) const
			{
				return (errorMessage);
			}

			ErrorClass GetErrorClass(void) const
			{
				return (errorClass);
			}

			unsigned int GetExecutionDurationMs(void) const
			{
				return (executionDurationMs);
			}

			// True for the single retry that follows a timed out attempt.
			bool IsRetry(void) const
			{
				return (retry);
			}

			bool HasLogEntryContaining(const std::string& text) const;
	};

	// A ranked candidate as it stands in the session's plan.
	struct PlanEntry
	{
		std::string methodName;
		double weight;
		RiskTier risk;
		DeviceMode requiredMode;
		bool requiresModeSwitch;

		// Dry runs stop every entry at Preparing.
		AttemptStatus status;
		bool applicable;
		std::string verdict;

		PlanEntry();
	};

	class BypassSession
	{
		friend class BypassEngine;

		private:

			std::string sessionId;
			DeviceSnapshot device;
			uint64_t startedAt;
			uint64_t endedAt;
			bool dryRun;

			std::vector<PlanEntry> plan;
			std::vector<BypassAttempt> attempts;

			SessionStatus finalStatus;
			std::string lastError;
			std::string summary;

		public:

			BypassSession();
			BypassSession(const std::string& sessionId, const DeviceSnapshot& device, uint64_t startedAt, bool dryRun);

			const std::string& GetSessionId(void) const
			{
				return (sessionId);
			}

			const std::string& GetDeviceSerial(void) const
			{
				return (device.GetSerial());
			}

			const DeviceSnapshot& GetDevice(void) const
			{
				return (device);
			}

			uint64_t GetStartedAt(void) const
			{
				return (startedAt);
			}

			uint64_t GetEndedAt(void) const
			{
				return (endedAt);
			}

			bool IsDryRun(void) const
			{
				return (dryRun);
			}

			const std::vector<PlanEntry>& GetPlan(void) const
			{
				return (plan);
			}

			const std::vector<BypassAttempt>& GetAttempts(void) const
			{
				return (attempts);
			}

			SessionStatus GetFinalStatus(void) const
			{
				return (finalStatus);
			}

			const std::string& GetLastError(void) const
			{
				return (lastError);
			}

			// "success: ..." / "aborted: ..." and so on; set when the session closes.
			const std::string& GetSummary(void) const
			{
				return (summary);
			}

			bool IsClosed(void) const
			{
				return (finalStatus != kSessionRunning);
			}
	};
}

#endif
