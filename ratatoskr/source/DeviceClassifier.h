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

#ifndef RATATOSKR_DEVICECLASSIFIER_H
#define RATATOSKR_DEVICECLASSIFIER_H

// Ratatoskr
#include "DeviceTypes.h"
#include "UsbBus.h"

namespace Ratatoskr
{
	class DeviceIdentifier
	{
		public:

			const int vendorId;
			const int productId;

			DeviceIdentifier(int vid, int pid) :
				vendorId(vid),
				productId(pid)
			{
			}
	};

	// Maps descriptors to manufacturer and mode. A pure function of its input: the same
	// descriptors always classify the same way.
	class DeviceClassifier
	{
		public:

			enum
			{
				kVidSamsung		= 0x04E8,
				kVidLG			= 0x1004,
				kVidXiaomi		= 0x2717,
				kVidGoogle		= 0x18D1,
				kVidQualcomm	= 0x05C6
			};

			enum
			{
				kPidSamsungGalaxyS			= 0x6601,
				kPidSamsungGalaxyS2			= 0x685D,
				kPidSamsungDroidCharge		= 0x68C3,
				kPidSamsungRecovery			= 0x685C,
				kPidLGRecovery				= 0x6344,
				kPidGoogleRecovery			= 0xD001,
				kPidQualcommEmergencyDownload	= 0x9008
			};

			enum
			{
				kClassImage				= 0x06,
				kClassComm				= 0x02,
				kClassData				= 0x0A,
				kClassVendorSpecific	= 0xFF,

				kSubClassAndroid		= 0x42,
				kProtocolDebugBridge	= 0x01,
				kProtocolBootLoader		= 0x03,

				kSubClassAbstractControl	= 0x02,
				kSubClassStillImage			= 0x01,
				kProtocolPictureTransfer	= 0x01
			};

			enum
			{
				kManufacturerTableSize = 4,
				kDownloadDeviceCount = 3,
				kRecoveryDeviceCount = 3
			};

		private:

			struct ManufacturerEntry
			{
				int vendorId;
				Manufacturer manufacturer;
			};

			static const ManufacturerEntry manufacturerTable[kManufacturerTableSize];
			static const DeviceIdentifier downloadDevices[kDownloadDeviceCount];
			static const DeviceIdentifier recoveryDevices[kRecoveryDeviceCount];

			static bool HasInterface(const UsbDeviceInfo& device, int interfaceClass, int interfaceSubClass,
				int interfaceProtocol);
			static bool IsListed(const DeviceIdentifier *table, int count, int vendorId, int productId);

			static bool MatchesDebugBridge(const UsbDeviceInfo& device);
			static bool MatchesBootLoader(const UsbDeviceInfo& device);
			static bool MatchesEmergencyDownload(const UsbDeviceInfo& device);
			static bool MatchesManufacturerDownload(const UsbDeviceInfo& device, Manufacturer manufacturer);
			static bool MatchesMediaTransfer(const UsbDeviceInfo& device);

		public:

			static Manufacturer LookupManufacturer(int vendorId);

			// Returns false when the device should be left out of the snapshot list.
			static bool Classify(const UsbDeviceInfo& device, Manufacturer *manufacturer, DeviceMode *mode);
	};
}

#endif
