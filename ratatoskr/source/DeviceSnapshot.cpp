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
#include "DeviceSnapshot.h"

using namespace Ratatoskr;

DeviceSnapshot::DeviceSnapshot() :
	vendorId(0),
	productId(0),
	manufacturer(kManufacturerUnknown),
	mode(kModeNormal),
	apiLevel(kApiLevelUnknown),
	lockState(kLockStateUnknown),
	busNumber(-1),
	deviceAddress(-1),
	detectedAt(0)
{
}

DeviceSnapshot::DeviceSnapshot(const std::string& serial, int vendorId, int productId, Manufacturer manufacturer,
	DeviceMode mode, int busNumber, int deviceAddress, uint64_t detectedAt, const std::string& portPath) :
	serial(serial),
	vendorId(vendorId),
	productId(productId),
	manufacturer(manufacturer),
	mode(mode),
	apiLevel(kApiLevelUnknown),
	lockState(kLockStateUnknown),
	busNumber(busNumber),
	deviceAddress(deviceAddress),
	portPath(portPath),
	detectedAt(detectedAt)
{
}

DeviceSnapshot DeviceSnapshot::WithDetails(const std::string& modelName, const std::string& androidVersion,
	int apiLevel, LockState lockState) const
{
	DeviceSnapshot enriched(*this);

	enriched.modelName = modelName;
	enriched.androidVersion = androidVersion;
	enriched.apiLevel = apiLevel;
	enriched.lockState = lockState;

	return (enriched);
}

DeviceSnapshot DeviceSnapshot::Reenumerated(const DeviceSnapshot& seen) const
{
	DeviceSnapshot current(seen.WithDetails(modelName, androidVersion, apiLevel, lockState));

	// Emergency loaders enumerate under the chipset vendor's id.
	if (current.manufacturer == kManufacturerUnknown)
		current.manufacturer = manufacturer;

	return (current);
}

bool DeviceSnapshot::IsSameDevice(const DeviceSnapshot& other) const
{
	if (!serial.empty() && serial == other.serial)
		return (true);

	return (!portPath.empty() && portPath == other.portPath);
}

std::string DeviceSnapshot::GetDeviceId(void) const
{
	std::string deviceId(GetManufacturerName(manufacturer));

	deviceId += '_';
	deviceId += modelName.empty() ? "unknown" : modelName;
	deviceId += '_';
	deviceId += serial;

	return (deviceId);
}
