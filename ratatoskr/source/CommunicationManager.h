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

#ifndef RATATOSKR_COMMUNICATIONMANAGER_H
#define RATATOSKR_COMMUNICATIONMANAGER_H

// C++ Standard Library
#include <condition_variable>
#include <mutex>
#include <set>

// Ratatoskr
#include "Channel.h"
#include "DeviceLocator.h"

namespace Ratatoskr
{
	class CommunicationManager;

	// Exclusive use of one device serial. The serial is released when the lease is destroyed
	// or Release() is called, on every path out of the holder's scope.
	class ChannelLease
	{
		friend class CommunicationManager;

		private:

			CommunicationManager *manager;

			// The serial exclusivity was granted for. A loader without a serial string comes back
			// under its port name, but the lease still holds the original entry.
			std::string heldSerial;

			DeviceSnapshot device;
			std::unique_ptr<Channel> channel;

			void Reselect(const DeviceSnapshot& seen);

		public:

			ChannelLease();
			ChannelLease(ChannelLease&& other);
			~ChannelLease();

			ChannelLease& operator=(ChannelLease&& other);

			ChannelLease(const ChannelLease&) = delete;
			ChannelLease& operator=(const ChannelLease&) = delete;

			void Release(void);

			bool IsHeld(void) const
			{
				return (manager != nullptr);
			}

			bool HasChannel(void) const
			{
				return (channel.get() != nullptr);
			}

			const std::string& GetHeldSerial(void) const
			{
				return (heldSerial);
			}

			// Snapshot as last seen by this lease; updated after every mode switch.
			const DeviceSnapshot& GetSnapshot(void) const
			{
				return (device);
			}

			DeviceMode GetMode(void) const
			{
				return (device.GetMode());
			}

			CommandResult Execute(const std::string& command, int timeoutMs);
			CommandResult Probe(int timeoutMs);
			LockStateResult QueryLockState(const LockQuery& query, int timeoutMs);

			// Requests the switch, waits up to settleTimeoutMs for the device to come back in
			// targetMode and then selects the channel that serves it.
			CommandStatus SwitchMode(DeviceMode targetMode, int commandTimeoutMs, int settleTimeoutMs);
	};

	class CommunicationManager
	{
		friend class ChannelLease;

		public:

			enum
			{
				kAcquireSucceeded = 0,
				kAcquireTimedOut
			};

		private:

			ChannelFactory *channelFactory;
			DeviceLocator *locator;

			std::mutex heldMutex;
			std::condition_variable releasedCondition;
			std::set<std::string> heldSerials;

			void Release(const std::string& serial);

		public:

			CommunicationManager(ChannelFactory *channelFactory, DeviceLocator *locator);

			// Blocks while another lease holds the serial. On success *lease owns the serial and,
			// when a transport serves the mode the device is in now, a channel. A previous holder
			// may have switched modes, so the device is located again once the serial is ours.
			int Acquire(const DeviceSnapshot& device, int timeoutMs, ChannelLease *lease);

			bool IsHeld(const std::string& serial);
	};
}

#endif
