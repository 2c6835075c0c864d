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
#include <ctype.h>

// Ratatoskr
#include "DeviceTypes.h"

namespace Ratatoskr
{
	namespace
	{
		const char *manufacturerNames[kManufacturerCount] = {
			"samsung", "lg", "xiaomi", "google", "unknown"
		};

		const char *modeNames[kModeCount] = {
			"normal", "debug-bridge", "boot-loader", "recovery", "manufacturer-download", "emergency-download"
		};

		struct ModeAlias
		{
			const char *alias;
			DeviceMode mode;
		};

		const ModeAlias modeAliases[] = {
			{ "adb", kModeDebugBridge },
			{ "fastboot", kModeBootLoader },
			{ "bootloader", kModeBootLoader },
			{ "download", kModeManufacturerDownload },
			{ "edl", kModeEmergencyDownload }
		};
	}

	const char *GetManufacturerName(Manufacturer manufacturer)
	{
		if (manufacturer < 0 || manufacturer >= kManufacturerCount)
			return ("unknown");

		return (manufacturerNames[manufacturer]);
	}

	bool ParseManufacturer(const std::string& name, Manufacturer *manufacturer)
	{
		std::string lowered = ToLowerCase(name);

		for (int i = 0; i < kManufacturerCount; i++)
		{
			if (lowered == manufacturerNames[i])
			{
				*manufacturer = static_cast<Manufacturer>(i);
				return (true);
			}
		}

		return (false);
	}

	const char *GetModeName(DeviceMode mode)
	{
		if (mode < 0 || mode >= kModeCount)
			return ("invalid");

		return (modeNames[mode]);
	}

	bool ParseMode(const std::string& name, DeviceMode *mode)
	{
		std::string lowered = ToLowerCase(name);

		for (int i = 0; i < kModeCount; i++)
		{
			if (lowered == modeNames[i])
			{
				*mode = static_cast<DeviceMode>(i);
				return (true);
			}
		}

		for (size_t i = 0; i < sizeof(modeAliases) / sizeof(modeAliases[0]); i++)
		{
			if (lowered == modeAliases[i].alias)
			{
				*mode = modeAliases[i].mode;
				return (true);
			}
		}

		return (false);
	}

	const char *GetLockStateName(LockState lockState)
	{
		switch (lockState)
		{
			case kLockStateLocked:
				return ("locked");

			case kLockStateUnlocked:
				return ("unlocked");

			default:
				return ("unknown");
		}
	}

	std::string ToLowerCase(const std::string& text)
	{
		std::string lowered(text);

		for (size_t i = 0; i < lowered.size(); i++)
			lowered[i] = static_cast<char>(tolower(static_cast<unsigned char>(lowered[i])));

		return (lowered);
	}
}
