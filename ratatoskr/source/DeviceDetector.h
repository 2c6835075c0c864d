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

#ifndef RATATOSKR_DEVICEDETECTOR_H
#define RATATOSKR_DEVICEDETECTOR_H

// Ratatoskr
#include "Channel.h"
#include "DeviceLocator.h"
#include "UsbBus.h"

namespace Ratatoskr
{
	class CommunicationManager;

	class DeviceDetector : public DeviceLocator
	{
		public:

			enum
			{
				kDefaultScanTimeoutMs = 5000,
				kDefaultPollIntervalMs = 500
			};

		private:

			UsbBus *usbBus;
			int scanTimeoutMs;
			int pollIntervalMs;

		public:

			DeviceDetector(UsbBus *usbBus, int scanTimeoutMs = kDefaultScanTimeoutMs,
				int pollIntervalMs = kDefaultPollIntervalMs);

			// Re-enumerates the bus on every call. Unclassifiable devices are left out.
			std::vector<DeviceSnapshot> Scan(void);

			bool FindBySerial(const std::string& serial, DeviceSnapshot *device);

			bool IsPresent(const std::string& serial);
			bool Locate(const DeviceSnapshot& device, DeviceSnapshot *current);
			bool WaitForMode(const DeviceSnapshot& device, DeviceMode targetMode, int timeoutMs, DeviceSnapshot *snapshot);

			// A serial match wins over a port match.
			static bool FindDevice(const std::vector<DeviceSnapshot>& snapshots, const DeviceSnapshot& device,
				DeviceSnapshot *found);

			// Fills model, Android version, API level and lock state through read-only queries.
			// Holds the device's lease for the duration. Returns the input unchanged if the
			// lease cannot be acquired.
			static DeviceSnapshot Enrich(CommunicationManager *manager, const DeviceSnapshot& device,
				const LockQuery& lockQuery, int timeoutMs);

			static std::vector<DeviceSnapshot> FilterLocked(const std::vector<DeviceSnapshot>& devices);
	};
}

#endif
