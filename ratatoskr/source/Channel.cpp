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
#include "Channel.h"

namespace Ratatoskr
{
	const char *GetCommandStatusName(CommandStatus status)
	{
		switch (status)
		{
			case kCommandSucceeded:
				return ("succeeded");

			case kCommandFailed:
				return ("failed");

			case kCommandTimedOut:
				return ("communication-timeout");

			case kCommandChannelUnavailable:
				return ("channel-unavailable");

			case kCommandDeviceDisconnected:
				return ("device-disconnected");

			case kCommandUnexpectedState:
				return ("unexpected-state");

			default:
				return ("invalid");
		}
	}

	bool IsCommunicationFailure(CommandStatus status)
	{
		return (status != kCommandSucceeded && status != kCommandFailed);
	}

	CommandResult::CommandResult() :
		status(kCommandSucceeded),
		success(true),
		durationMs(0)
	{
	}

	CommandResult::CommandResult(CommandStatus status, const std::string& standardError) :
		status(status),
		success(status == kCommandSucceeded),
		standardError(standardError),
		durationMs(0)
	{
	}

	LockState EvaluateLockQuery(const LockQuery& query, const std::string& output)
	{
		std::string lowered = ToLowerCase(output);

		if (!query.lockedPattern.empty() && lowered.find(ToLowerCase(query.lockedPattern)) != std::string::npos)
			return (kLockStateLocked);

		if (!query.unlockedPattern.empty())
		{
			if (lowered.find(ToLowerCase(query.unlockedPattern)) != std::string::npos)
				return (kLockStateUnlocked);

			return (kLockStateUnknown);
		}

		//	Only a locked pattern was given: its absence in a successful answer means unlocked.
		return (query.lockedPattern.empty() ? kLockStateUnknown : kLockStateUnlocked);
	}

	bool IsModeSwitchSupported(Manufacturer manufacturer, DeviceMode from, DeviceMode to)
	{
		if (from == to)
			return (false);

		bool qualcommBased = (manufacturer == kManufacturerXiaomi || manufacturer == kManufacturerUnknown);

		switch (from)
		{
			case kModeDebugBridge:
			case kModeRecovery:

				switch (to)
				{
					case kModeDebugBridge:
					case kModeRecovery:
						return (true);

					case kModeBootLoader:
						return (manufacturer != kManufacturerSamsung);

					case kModeManufacturerDownload:
						return (manufacturer == kManufacturerSamsung || manufacturer == kManufacturerLG);

					case kModeEmergencyDownload:
						return (qualcommBased);

					default:
						return (false);
				}

			case kModeBootLoader:

				switch (to)
				{
					case kModeDebugBridge:
					case kModeRecovery:
						return (true);

					case kModeEmergencyDownload:
						return (qualcommBased);

					default:
						return (false);
				}

			default:
				// Download, emergency download and normal mode expose no switch request.
				return (false);
		}
	}

	LockStateResult Channel::QueryLockState(const LockQuery& query, int timeoutMs)
	{
		LockStateResult lockStateResult;
		lockStateResult.status = kCommandSucceeded;
		lockStateResult.lockState = kLockStateUnknown;

		if (!query.IsDefined())
		{
			lockStateResult.detail = "no lock query defined for this mode";
			return (lockStateResult);
		}

		CommandResult result = Execute(query.command, timeoutMs);
		lockStateResult.status = result.status;

		if (result.status != kCommandSucceeded)
		{
			lockStateResult.detail = result.standardError;
			return (lockStateResult);
		}

		//	Boot-loader tools print variables on stderr.
		lockStateResult.lockState = EvaluateLockQuery(query, result.standardOutput + "\n" + result.standardError);
		lockStateResult.detail = std::string("lock query reported ") + GetLockStateName(lockStateResult.lockState);
		return (lockStateResult);
	}

	const char *Channel::GetKindName(Kind kind)
	{
		switch (kind)
		{
			case kKindDebugBridge:
				return ("debug-bridge");

			case kKindBootLoader:
				return ("boot-loader");

			case kKindRawUsb:
				return ("raw-usb");

			default:
				return ("invalid");
		}
	}
}
