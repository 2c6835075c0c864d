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

#ifndef RATATOSKR_DEVICESNAPSHOT_H
#define RATATOSKR_DEVICESNAPSHOT_H

// Ratatoskr
#include "DeviceTypes.h"

namespace Ratatoskr
{
	// What one detection cycle saw of one device. Never modified after construction;
	// WithDetails() produces an enriched copy.
	class DeviceSnapshot
	{
		public:

			enum
			{
				kApiLevelUnknown = -1
			};

		private:

			std::string serial;
			int vendorId;
			int productId;
			Manufacturer manufacturer;
			DeviceMode mode;

			std::string modelName;
			std::string androidVersion;
			int apiLevel;
			LockState lockState;

			int busNumber;
			int deviceAddress;
			std::string portPath;
			uint64_t detectedAt;

		public:

			DeviceSnapshot();
			DeviceSnapshot(const std::string& serial, int vendorId, int productId, Manufacturer manufacturer,
				DeviceMode mode, int busNumber, int deviceAddress, uint64_t detectedAt,
				const std::string& portPath = std::string());

			DeviceSnapshot WithDetails(const std::string& modelName, const std::string& androidVersion, int apiLevel,
				LockState lockState) const;

			// This device as it appears in a later sighting: transport identity and mode from seen,
			// everything learned about the device itself from this snapshot.
			DeviceSnapshot Reenumerated(const DeviceSnapshot& seen) const;

			// Same serial, or both taken at the same physical port.
			bool IsSameDevice(const DeviceSnapshot& other) const;

			const std::string& GetSerial(void) const
			{
				return (serial);
			}

			int GetVendorId(void) const
			{
				return (vendorId);
			}

			int GetProductId(void) const
			{
				return (productId);
			}

			Manufacturer GetManufacturer(void) const
			{
				return (manufacturer);
			}

			DeviceMode GetMode(void) const
			{
				return (mode);
			}

			const std::string& GetModelName(void) const
			{
				return (modelName);
			}

			const std::string& GetAndroidVersion(void) const
			{
				return (androidVersion);
			}

			bool HasAndroidVersion(void) const
			{
				return (!androidVersion.empty());
			}

			int GetApiLevel(void) const
			{
				return (apiLevel);
			}

			bool HasApiLevel(void) const
			{
				return (apiLevel != kApiLevelUnknown);
			}

			LockState GetLockState(void) const
			{
				return (lockState);
			}

			int GetBusNumber(void) const
			{
				return (busNumber);
			}

			int GetDeviceAddress(void) const
			{
				return (deviceAddress);
			}

			// "1-4.2": bus then the hub port chain. Empty when the platform does not report it.
			const std::string& GetPortPath(void) const
			{
				return (portPath);
			}

			uint64_t GetDetectedAt(void) const
			{
				return (detectedAt);
			}

			bool IsValid(void) const
			{
				return (!serial.empty());
			}

			// "samsung_SM-G930F_ce0916094b9a2f1c03"
			std::string GetDeviceId(void) const;
	};
}

#endif
