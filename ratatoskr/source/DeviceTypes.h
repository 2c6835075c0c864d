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

#ifndef RATATOSKR_DEVICETYPES_H
#define RATATOSKR_DEVICETYPES_H

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	enum Manufacturer
	{
		kManufacturerSamsung = 0,
		kManufacturerLG,
		kManufacturerXiaomi,
		kManufacturerGoogle,
		kManufacturerUnknown,

		kManufacturerCount
	};

	enum DeviceMode
	{
		kModeNormal = 0,
		kModeDebugBridge,
		kModeBootLoader,
		kModeRecovery,
		kModeManufacturerDownload,
		kModeEmergencyDownload,

		kModeCount
	};

	enum LockState
	{
		kLockStateLocked = 0,
		kLockStateUnlocked,
		kLockStateUnknown
	};

	const char *GetManufacturerName(Manufacturer manufacturer);
	bool ParseManufacturer(const std::string& name, Manufacturer *manufacturer);

	const char *GetModeName(DeviceMode mode);

	// Accepts the canonical names plus the host tool aliases ("adb", "fastboot", "download", "edl").
	bool ParseMode(const std::string& name, DeviceMode *mode);

	const char *GetLockStateName(LockState lockState);

	std::string ToLowerCase(const std::string& text);
}

#endif
