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

// C++ Standard Library
#include <chrono>

// Ratatoskr
#include "CommunicationManager.h"
#include "Interface.h"

using namespace Ratatoskr;

ChannelLease::ChannelLease() :
	manager(nullptr)
{
}

ChannelLease::ChannelLease(ChannelLease&& other) :
	manager(other.manager),
	heldSerial(other.heldSerial),
	device(other.device),
	channel(std::move(other.channel))
{
	other.manager = nullptr;
}

ChannelLease::~ChannelLease()
{
	Release();
}

ChannelLease& ChannelLease::operator=(ChannelLease&& other)
{
	if (this != &other)
	{
		Release();

		manager = other.manager;
		heldSerial = other.heldSerial;
		device = other.device;
		channel = std::move(other.channel);

		other.manager = nullptr;
	}

	return (*this);
}

void ChannelLease::Release(void)
{
	// The transport goes first so that the next holder finds the device closed.
	channel.reset();

	if (manager)
	{
		manager->Release(heldSerial);
		manager = nullptr;
		heldSerial.clear();
	}
}

CommandResult ChannelLease::Execute(const std::string& command, int timeoutMs)
{
	if (!channel)
	{
		return (CommandResult(kCommandChannelUnavailable, std::string("no channel serves ")
			+ GetModeName(device.GetMode()) + " mode"));
	}

	return (channel->Execute(command, timeoutMs));
}

CommandResult ChannelLease::Probe(int timeoutMs)
{
	if (!channel)
	{
		return (CommandResult(kCommandChannelUnavailable, std::string("no channel serves ")
			+ GetModeName(device.GetMode()) + " mode"));
	}

	return (channel->Probe(timeoutMs));
}

LockStateResult ChannelLease::QueryLockState(const LockQuery& query, int timeoutMs)
{
	if (!channel)
	{
		LockStateResult result;
		result.status = kCommandChannelUnavailable;
		result.lockState = kLockStateUnknown;
		result.detail = std::string("no channel serves ") + GetModeName(device.GetMode()) + " mode";

		return (result);
	}

	return (channel->QueryLockState(query, timeoutMs));
}

void ChannelLease::Reselect(const DeviceSnapshot& seen)
{
	device = device.Reenumerated(seen);
	channel = manager->channelFactory->CreateChannel(device);
}

CommandStatus ChannelLease::SwitchMode(DeviceMode targetMode, int commandTimeoutMs, int settleTimeoutMs)
{
	if (!manager)
		return (kCommandChannelUnavailable);

	if (device.GetMode() == targetMode)
		return (kCommandSucceeded);

	if (!channel)
		return (kCommandChannelUnavailable);

	CommandStatus status = channel->SwitchMode(targetMode, commandTimeoutMs);

	if (status != kCommandSucceeded)
		return (status);

	// The old transport is meaningless once the device re-enumerates.
	channel.reset();

	DeviceSnapshot seen;
	if (manager->locator->WaitForMode(device, targetMode, settleTimeoutMs, &seen))
	{
		Reselect(seen);

		Interface::PrintVerbose("%s is now in %s mode as %s\n", heldSerial.c_str(), GetModeName(targetMode),
			device.GetSerial().c_str());
		return (channel ? kCommandSucceeded : kCommandChannelUnavailable);
	}

	if (!seen.IsValid())
	{
		Interface::PrintError("%s did not re-enumerate after switching to %s mode\n", device.GetSerial().c_str(),
			GetModeName(targetMode));
		return (kCommandDeviceDisconnected);
	}

	Interface::PrintError("%s came back in %s mode instead of %s mode\n", device.GetSerial().c_str(),
		GetModeName(seen.GetMode()), GetModeName(targetMode));

	Reselect(seen);
	return (kCommandUnexpectedState);
}

CommunicationManager::CommunicationManager(ChannelFactory *channelFactory, DeviceLocator *locator) :
	channelFactory(channelFactory),
	locator(locator)
{
}

int CommunicationManager::Acquire(const DeviceSnapshot& device, int timeoutMs, ChannelLease *lease)
{
	const std::string& serial = device.GetSerial();

	{
		std::unique_lock<std::mutex> lock(heldMutex);

		std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now()
			+ std::chrono::milliseconds(timeoutMs > 0 ? timeoutMs : 0);

		while (heldSerials.count(serial))
		{
			if (releasedCondition.wait_until(lock, deadline) == std::cv_status::timeout && heldSerials.count(serial))
			{
				Interface::PrintWarning("Timed out waiting for exclusive access to %s\n", serial.c_str());
				return (kAcquireTimedOut);
			}
		}

		heldSerials.insert(serial);
	}

	DeviceSnapshot current = device;
	DeviceSnapshot seen;

	if (locator && locator->Locate(device, &seen))
	{
		current = device.Reenumerated(seen);

		if (current.GetMode() != device.GetMode())
		{
			Interface::PrintVerbose("%s moved from %s to %s mode since it was detected\n", serial.c_str(),
				GetModeName(device.GetMode()), GetModeName(current.GetMode()));
		}
	}

	Interface::PrintVerbose("Acquired %s (%s mode)\n", serial.c_str(), GetModeName(current.GetMode()));

	ChannelLease acquired;
	acquired.manager = this;
	acquired.heldSerial = serial;
	acquired.device = current;
	acquired.channel = channelFactory->CreateChannel(current);

	*lease = std::move(acquired);

	return (kAcquireSucceeded);
}

void CommunicationManager::Release(const std::string& serial)
{
	{
		std::lock_guard<std::mutex> lock(heldMutex);
		heldSerials.erase(serial);
	}

	releasedCondition.notify_all();

	Interface::PrintVerbose("Released %s\n", serial.c_str());
}

bool CommunicationManager::IsHeld(const std::string& serial)
{
	std::lock_guard<std::mutex> lock(heldMutex);
	return (heldSerials.count(serial) != 0);
}
