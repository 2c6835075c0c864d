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

#ifndef RATATOSKR_CHANNEL_H
#define RATATOSKR_CHANNEL_H

// C++ Standard Library
#include <memory>

// Ratatoskr
#include "DeviceSnapshot.h"

namespace Ratatoskr
{
	enum CommandStatus
	{
		kCommandSucceeded = 0,
		kCommandFailed,					// the device answered, the command did not do what was asked
		kCommandTimedOut,				// recoverable, may be retried once
		kCommandChannelUnavailable,		// no transport serves the current mode
		kCommandDeviceDisconnected,		// fatal to the session
		kCommandUnexpectedState			// fatal to the session
	};

	const char *GetCommandStatusName(CommandStatus status);

	// True for the statuses raised by the transport rather than by the device's answer.
	bool IsCommunicationFailure(CommandStatus status);

	struct CommandResult
	{
		CommandStatus status;
		bool success;
		std::string standardOutput;
		std::string standardError;
		unsigned int durationMs;

		CommandResult();
		CommandResult(CommandStatus status, const std::string& standardError);
	};

	// How to read the lock state in one mode: run the command, then look for either pattern
	// in its output. A locked match wins over an unlocked one.
	struct LockQuery
	{
		std::string command;
		std::string lockedPattern;
		std::string unlockedPattern;

		bool IsDefined(void) const
		{
			return (!command.empty());
		}
	};

	struct LockStateResult
	{
		CommandStatus status;
		LockState lockState;
		std::string detail;
	};

	LockState EvaluateLockQuery(const LockQuery& query, const std::string& output);

	// Whether a channel in mode 'from' can ask the device to reboot into 'to'.
	bool IsModeSwitchSupported(Manufacturer manufacturer, DeviceMode from, DeviceMode to);

	class Channel
	{
		public:

			enum Kind
			{
				kKindDebugBridge = 0,
				kKindBootLoader,
				kKindRawUsb
			};

			virtual ~Channel()
			{
			}

			virtual Kind GetKind(void) const = 0;

			virtual CommandResult Execute(const std::string& command, int timeoutMs) = 0;

			// Asks the device to re-enumerate in targetMode. Success only means the request was
			// accepted; the caller waits for the device to come back.
			virtual CommandStatus SwitchMode(DeviceMode targetMode, int timeoutMs) = 0;

			// Read-only liveness check used before a method is allowed to execute.
			virtual CommandResult Probe(int timeoutMs) = 0;

			virtual LockStateResult QueryLockState(const LockQuery& query, int timeoutMs);

			static const char *GetKindName(Kind kind);
	};

	class ChannelFactory
	{
		public:

			virtual ~ChannelFactory()
			{
			}

			// Returns an empty pointer when no transport serves the device's current mode.
			virtual std::unique_ptr<Channel> CreateChannel(const DeviceSnapshot& device) = 0;
	};
}

#endif
