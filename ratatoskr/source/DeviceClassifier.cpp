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
#include "DeviceClassifier.h"

using namespace Ratatoskr;

const DeviceClassifier::ManufacturerEntry DeviceClassifier::manufacturerTable[DeviceClassifier::kManufacturerTableSize] = {
	{ DeviceClassifier::kVidSamsung, kManufacturerSamsung },
	{ DeviceClassifier::kVidLG, kManufacturerLG },
	{ DeviceClassifier::kVidXiaomi, kManufacturerXiaomi },
	{ DeviceClassifier::kVidGoogle, kManufacturerGoogle }
};

const DeviceIdentifier DeviceClassifier::downloadDevices[DeviceClassifier::kDownloadDeviceCount] = {
	DeviceIdentifier(DeviceClassifier::kVidSamsung, DeviceClassifier::kPidSamsungGalaxyS),
	DeviceIdentifier(DeviceClassifier::kVidSamsung, DeviceClassifier::kPidSamsungGalaxyS2),
	DeviceIdentifier(DeviceClassifier::kVidSamsung, DeviceClassifier::kPidSamsungDroidCharge)
};

// Recovery exposes the same debug bridge interface as a booted system; only the product id differs.
const DeviceIdentifier DeviceClassifier::recoveryDevices[DeviceClassifier::kRecoveryDeviceCount] = {
	DeviceIdentifier(DeviceClassifier::kVidSamsung, DeviceClassifier::kPidSamsungRecovery),
	DeviceIdentifier(DeviceClassifier::kVidLG, DeviceClassifier::kPidLGRecovery),
	DeviceIdentifier(DeviceClassifier::kVidGoogle, DeviceClassifier::kPidGoogleRecovery)
};

bool DeviceClassifier::HasInterface(const UsbDeviceInfo& device, int interfaceClass, int interfaceSubClass,
	int interfaceProtocol)
{
	for (size_t i = 0; i < device.interfaces.size(); i++)
	{
		const UsbInterfaceInfo& info = device.interfaces[i];

		if (info.interfaceClass == interfaceClass
			&& (interfaceSubClass < 0 || info.interfaceSubClass == interfaceSubClass)
			&& (interfaceProtocol < 0 || info.interfaceProtocol == interfaceProtocol))
		{
			return (true);
		}
	}

	return (false);
}

bool DeviceClassifier::IsListed(const DeviceIdentifier *table, int count, int vendorId, int productId)
{
	for (int i = 0; i < count; i++)
	{
		if (table[i].vendorId == vendorId && table[i].productId == productId)
			return (true);
	}

	return (false);
}

bool DeviceClassifier::MatchesDebugBridge(const UsbDeviceInfo& device)
{
	return (HasInterface(device, kClassVendorSpecific, kSubClassAndroid, kProtocolDebugBridge));
}

bool DeviceClassifier::MatchesBootLoader(const UsbDeviceInfo& device)
{
	return (HasInterface(device, kClassVendorSpecific, kSubClassAndroid, kProtocolBootLoader));
}

bool DeviceClassifier::MatchesEmergencyDownload(const UsbDeviceInfo& device)
{
	return (device.vendorId == kVidQualcomm && device.productId == kPidQualcommEmergencyDownload);
}

bool DeviceClassifier::MatchesManufacturerDownload(const UsbDeviceInfo& device, Manufacturer manufacturer)
{
	if (manufacturer == kManufacturerSamsung)
	{
		if (IsListed(downloadDevices, kDownloadDeviceCount, device.vendorId, device.productId))
			return (true);

		//	A CDC ACM comm interface paired with a CDC data interface is what the download
		//	mode loader presents on devices newer than the listed ones.
		return (HasInterface(device, kClassComm, kSubClassAbstractControl, -1)
			&& HasInterface(device, kClassData, -1, 0x00));
	}

	if (manufacturer == kManufacturerLG)
		return (HasInterface(device, kClassComm, kSubClassAbstractControl, -1));

	return (false);
}

bool DeviceClassifier::MatchesMediaTransfer(const UsbDeviceInfo& device)
{
	return (HasInterface(device, kClassImage, kSubClassStillImage, kProtocolPictureTransfer));
}

Manufacturer DeviceClassifier::LookupManufacturer(int vendorId)
{
	for (int i = 0; i < kManufacturerTableSize; i++)
	{
		if (manufacturerTable[i].vendorId == vendorId)
			return (manufacturerTable[i].manufacturer);
	}

	return (kManufacturerUnknown);
}

bool DeviceClassifier::Classify(const UsbDeviceInfo& device, Manufacturer *manufacturer, DeviceMode *mode)
{
	Manufacturer matchedManufacturer = LookupManufacturer(device.vendorId);
	bool recognised = (matchedManufacturer != kManufacturerUnknown);

	//	Fixed priority: debug bridge, boot loader, then the raw USB signatures. The
	//	interface triples are mutually exclusive so the first match is the only match.
	DeviceMode matchedMode;

	if (MatchesDebugBridge(device))
	{
		if (IsListed(recoveryDevices, kRecoveryDeviceCount, device.vendorId, device.productId))
			matchedMode = kModeRecovery;
		else
			matchedMode = kModeDebugBridge;
	}
	else if (MatchesBootLoader(device))
	{
		matchedMode = kModeBootLoader;
	}
	else if (MatchesEmergencyDownload(device))
	{
		matchedMode = kModeEmergencyDownload;
	}
	else if (recognised && MatchesManufacturerDownload(device, matchedManufacturer))
	{
		matchedMode = kModeManufacturerDownload;
	}
	else if (recognised && MatchesMediaTransfer(device))
	{
		matchedMode = kModeNormal;
	}
	else
	{
		return (false);
	}

	*manufacturer = matchedManufacturer;
	*mode = matchedMode;
	return (true);
}
