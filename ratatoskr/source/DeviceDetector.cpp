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
#include <stdio.h>
#include <stdlib.h>

// Ratatoskr
#include "BootLoaderChannel.h"
#include "CommunicationManager.h"
#include "DeviceClassifier.h"
#include "DeviceDetector.h"
#include "Interface.h"
#include "Timing.h"

using namespace Ratatoskr;

namespace
{
	std::string Trim(const std::string& text)
	{
		size_t first = text.find_first_not_of(" \t\r\n");

		if (first == std::string::npos)
			return ("");

		size_t last = text.find_last_not_of(" \t\r\n");
		return (text.substr(first, last - first + 1));
	}

	std::string ReadProperty(ChannelLease *lease, const char *property, int timeoutMs)
	{
		CommandResult result = lease->Execute(std::string("shell getprop ") + property, timeoutMs);

		if (!result.success)
			return ("");

		return (Trim(result.standardOutput));
	}
}

DeviceDetector::DeviceDetector(UsbBus *usbBus, int scanTimeoutMs, int pollIntervalMs) :
	usbBus(usbBus),
	scanTimeoutMs(scanTimeoutMs),
	pollIntervalMs(pollIntervalMs)
{
}

std::vector<DeviceSnapshot> DeviceDetector::Scan(void)
{
	std::vector<DeviceSnapshot> snapshots;
	std::vector<UsbDeviceInfo> devices;

	if (!usbBus->Enumerate(scanTimeoutMs, &devices))
	{
		Interface::PrintDeviceDetectionFailed();
		return (snapshots);
	}

	uint64_t detectedAt = Timing::GetWallClockMs();

	for (size_t i = 0; i < devices.size(); i++)
	{
		const UsbDeviceInfo& info = devices[i];

		Manufacturer manufacturer;
		DeviceMode mode;

		if (!DeviceClassifier::Classify(info, &manufacturer, &mode))
			continue;

		if (info.serialUnreadable)
		{
			// Reporting it under a stand-in serial would give the device a second identity.
			Interface::PrintVerbose("Skipping %03d:%03d, its serial could not be read\n", info.busNumber,
				info.deviceAddress);
			continue;
		}

		std::string serial = info.serial;

		if (serial.empty())
		{
			// Loaders in download mode often expose no serial string; fall back to the port.
			if (!info.portPath.empty())
			{
				serial = "usb-" + info.portPath;
			}
			else
			{
				char position[32];
				snprintf(position, sizeof(position), "usb-%03d-%03d", info.busNumber, info.deviceAddress);
				serial = position;
			}
		}

		Interface::PrintVerbose("Found %s %04X:%04X (%s) in %s mode\n", serial.c_str(), info.vendorId, info.productId,
			GetManufacturerName(manufacturer), GetModeName(mode));

		snapshots.push_back(DeviceSnapshot(serial, info.vendorId, info.productId, manufacturer, mode, info.busNumber,
			info.deviceAddress, detectedAt, info.portPath));
	}

	return (snapshots);
}

bool DeviceDetector::FindBySerial(const std::string& serial, DeviceSnapshot *device)
{
	std::vector<DeviceSnapshot> snapshots = Scan();

	for (size_t i = 0; i < snapshots.size(); i++)
	{
		if (snapshots[i].GetSerial() == serial)
		{
			*device = snapshots[i];
			return (true);
		}
	}

	return (false);
}

bool DeviceDetector::IsPresent(const std::string& serial)
{
	DeviceSnapshot device;
	return (FindBySerial(serial, &device));
}

bool DeviceDetector::FindDevice(const std::vector<DeviceSnapshot>& snapshots, const DeviceSnapshot& device,
	DeviceSnapshot *found)
{
	const DeviceSnapshot *portMatch = nullptr;

	for (size_t i = 0; i < snapshots.size(); i++)
	{
		if (snapshots[i].GetSerial() == device.GetSerial())
		{
			*found = snapshots[i];
			return (true);
		}

		if (!portMatch && device.IsSameDevice(snapshots[i]))
			portMatch = &snapshots[i];
	}

	if (!portMatch)
		return (false);

	*found = *portMatch;
	return (true);
}

bool DeviceDetector::Locate(const DeviceSnapshot& device, DeviceSnapshot *current)
{
	return (FindDevice(Scan(), device, current));
}

bool DeviceDetector::WaitForMode(const DeviceSnapshot& device, DeviceMode targetMode, int timeoutMs,
	DeviceSnapshot *snapshot)
{
	*snapshot = DeviceSnapshot();

	uint64_t deadline = Timing::GetMonotonicMs() + (timeoutMs > 0 ? timeoutMs : 0);

	while (true)
	{
		DeviceSnapshot seen;

		if (Locate(device, &seen))
		{
			*snapshot = seen;

			if (seen.GetMode() == targetMode)
			{
				if (seen.GetSerial() != device.GetSerial())
				{
					Interface::PrintVerbose("%s re-enumerated at port %s as %s\n", device.GetSerial().c_str(),
						seen.GetPortPath().c_str(), seen.GetSerial().c_str());
				}

				return (true);
			}
		}

		if (Timing::GetMonotonicMs() + pollIntervalMs > deadline)
			return (false);

		Timing::Sleep(pollIntervalMs);
	}
}

DeviceSnapshot DeviceDetector::Enrich(CommunicationManager *manager, const DeviceSnapshot& device,
	const LockQuery& lockQuery, int timeoutMs)
{
	ChannelLease lease;

	if (manager->Acquire(device, timeoutMs, &lease) != CommunicationManager::kAcquireSucceeded)
		return (device);

	std::string modelName = device.GetModelName();
	std::string androidVersion = device.GetAndroidVersion();
	int apiLevel = device.GetApiLevel();
	LockState lockState = device.GetLockState();

	if (device.GetMode() == kModeDebugBridge || device.GetMode() == kModeRecovery)
	{
		std::string value = ReadProperty(&lease, "ro.product.model", timeoutMs);
		if (!value.empty())
			modelName = value;

		value = ReadProperty(&lease, "ro.build.version.release", timeoutMs);
		if (!value.empty())
			androidVersion = value;

		value = ReadProperty(&lease, "ro.build.version.sdk", timeoutMs);
		if (!value.empty())
		{
			char *end;
			long parsed = strtol(value.c_str(), &end, 10);

			if (*end == 0 && parsed > 0)
				apiLevel = static_cast<int>(parsed);
		}
	}
	else if (device.GetMode() == kModeBootLoader)
	{
		CommandResult result = lease.Execute("getvar product", timeoutMs);

		if (result.success)
		{
			std::string product = BootLoaderChannel::ParseVariable(result.standardError + "\n" + result.standardOutput,
				"product");

			if (!product.empty())
				modelName = product;
		}
	}

	if (lockQuery.IsDefined() && lease.HasChannel())
	{
		LockStateResult result = lease.QueryLockState(lockQuery, timeoutMs);

		if (result.status == kCommandSucceeded)
			lockState = result.lockState;
		else
			Interface::PrintVerbose("Lock state of %s unavailable: %s\n", device.GetSerial().c_str(), result.detail.c_str());
	}

	return (device.WithDetails(modelName, androidVersion, apiLevel, lockState));
}

std::vector<DeviceSnapshot> DeviceDetector::FilterLocked(const std::vector<DeviceSnapshot>& devices)
{
	std::vector<DeviceSnapshot> locked;

	for (size_t i = 0; i < devices.size(); i++)
	{
		if (devices[i].GetLockState() == kLockStateLocked)
			locked.push_back(devices[i]);
	}

	return (locked);
}
