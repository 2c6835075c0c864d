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

// libusb
#include <libusb.h>

// Ratatoskr
#include "Interface.h"
#include "LibusbBus.h"
#include "Timing.h"

// Future versions of libusb will use usb_interface instead of interface.
#define usb_interface interface

using namespace Ratatoskr;

LibusbBus::LibusbBus()
{
	libusbContext = nullptr;
}

LibusbBus::~LibusbBus()
{
	if (libusbContext)
		libusb_exit(libusbContext);
}

bool LibusbBus::Initialise(void)
{
	if (libusbContext)
		return (true);

	int result = libusb_init(&libusbContext);
	if (result != LIBUSB_SUCCESS)
	{
		Interface::PrintError("Failed to initialise libusb. libusb error: %d (%s)\n", result, libusb_error_name(result));
		libusbContext = nullptr;
		return (false);
	}

	return (true);
}

bool LibusbBus::ReadInterfaces(libusb_device *device, UsbDeviceInfo *info)
{
	libusb_config_descriptor *configDescriptor = nullptr;

	int result = libusb_get_active_config_descriptor(device, &configDescriptor);
	if (result != LIBUSB_SUCCESS)
		result = libusb_get_config_descriptor(device, 0, &configDescriptor);

	if (result != LIBUSB_SUCCESS || !configDescriptor)
	{
		Interface::PrintVerbose("Failed to retrieve config descriptor for %03d:%03d\n", info->busNumber, info->deviceAddress);
		return (false);
	}

	for (int i = 0; i < configDescriptor->bNumInterfaces; i++)
	{
		if (configDescriptor->usb_interface[i].num_altsetting < 1)
			continue;

		const libusb_interface_descriptor& altsetting = configDescriptor->usb_interface[i].altsetting[0];

		UsbInterfaceInfo interfaceInfo;
		interfaceInfo.interfaceNumber = altsetting.bInterfaceNumber;
		interfaceInfo.interfaceClass = altsetting.bInterfaceClass;
		interfaceInfo.interfaceSubClass = altsetting.bInterfaceSubClass;
		interfaceInfo.interfaceProtocol = altsetting.bInterfaceProtocol;
		info->interfaces.push_back(interfaceInfo);

		Interface::PrintVerbose("    interface %d  Class.SubClass.Protocol: %02X.%02X.%02X\n", interfaceInfo.interfaceNumber,
			interfaceInfo.interfaceClass, interfaceInfo.interfaceSubClass, interfaceInfo.interfaceProtocol);
	}

	libusb_free_config_descriptor(configDescriptor);
	return (true);
}

std::string LibusbBus::ReadPortPath(libusb_device *device, int busNumber)
{
	uint8_t ports[kMaxPortDepth];

	int depth = libusb_get_port_numbers(device, ports, kMaxPortDepth);
	if (depth <= 0)
		return ("");

	char element[8];
	snprintf(element, sizeof(element), "%d", busNumber);
	std::string portPath(element);

	for (int i = 0; i < depth; i++)
	{
		snprintf(element, sizeof(element), "%c%d", i == 0 ? '-' : '.', ports[i]);
		portPath += element;
	}

	return (portPath);
}

// Returns false when the device declares a serial that could not be read before the deadline.
bool LibusbBus::ReadSerial(libusb_device *device, int serialIndex, uint64_t deadline, UsbDeviceInfo *info)
{
	if (serialIndex == 0)
		return (true);

	libusb_device_handle *deviceHandle = nullptr;

	int result = libusb_open(device, &deviceHandle);
	if (result != LIBUSB_SUCCESS)
	{
		Interface::PrintVerbose("Cannot open %03d:%03d to read its serial. libusb error: %s\n", info->busNumber,
			info->deviceAddress, libusb_error_name(result));

		// No permission is the same on every scan, so the port path stays a stable identity.
		return (result == LIBUSB_ERROR_ACCESS || result == LIBUSB_ERROR_NOT_SUPPORTED);
	}

	unsigned char stringBuffer[kStringBufferSize];
	int languageId = -1;
	bool read = false;

	//	GET_DESCRIPTOR by hand so that every request is bounded by what is left of the scan.
	for (int request = 0; request < 2; request++)
	{
		int64_t remaining = static_cast<int64_t>(deadline) - static_cast<int64_t>(Timing::GetMonotonicMs());
		if (remaining <= 0)
			break;

		uint16_t wValue = static_cast<uint16_t>((LIBUSB_DT_STRING << 8) | (request == 0 ? 0 : serialIndex));
		uint16_t wIndex = static_cast<uint16_t>(request == 0 ? 0 : languageId);

		result = libusb_control_transfer(deviceHandle, LIBUSB_ENDPOINT_IN, LIBUSB_REQUEST_GET_DESCRIPTOR, wValue, wIndex,
			stringBuffer, kStringBufferSize, static_cast<unsigned int>(remaining));

		if (result < 2 || stringBuffer[1] != LIBUSB_DT_STRING)
			break;

		int length = (stringBuffer[0] < result) ? stringBuffer[0] : result;

		if (request == 0)
		{
			if (length < 4)
				break;

			languageId = stringBuffer[2] | (stringBuffer[3] << 8);
			continue;
		}

		//	UTF-16LE; anything outside ASCII becomes '?', as libusb_get_string_descriptor_ascii does.
		info->serial.clear();

		for (int i = 2; i + 1 < length; i += 2)
		{
			if (stringBuffer[i + 1] == 0 && stringBuffer[i] < 0x80)
				info->serial += static_cast<char>(stringBuffer[i]);
			else
				info->serial += '?';
		}

		read = true;
	}

	libusb_close(deviceHandle);

	if (!read)
	{
		Interface::PrintVerbose("Serial of %03d:%03d unreadable. libusb result: %s\n", info->busNumber, info->deviceAddress,
			result < 0 ? libusb_error_name(result) : "malformed descriptor or scan deadline reached");
	}

	return (read);
}

bool LibusbBus::Enumerate(int timeoutMs, std::vector<UsbDeviceInfo> *devices)
{
	if (!Initialise())
		return (false);

	uint64_t deadline = Timing::GetMonotonicMs() + (timeoutMs > 0 ? timeoutMs : 0);

	libusb_device **deviceList;
	ssize_t deviceCount = libusb_get_device_list(libusbContext, &deviceList);

	if (deviceCount < 0)
	{
		Interface::PrintError("Failed to list USB devices. libusb error: %s\n",
			libusb_error_name(static_cast<int>(deviceCount)));
		return (false);
	}

	for (ssize_t deviceIndex = 0; deviceIndex < deviceCount; deviceIndex++)
	{
		libusb_device *device = deviceList[deviceIndex];

		libusb_device_descriptor descriptor;
		if (libusb_get_device_descriptor(device, &descriptor) != LIBUSB_SUCCESS)
			continue;

		UsbDeviceInfo info;
		info.busNumber = libusb_get_bus_number(device);
		info.deviceAddress = libusb_get_device_address(device);
		info.vendorId = descriptor.idVendor;
		info.productId = descriptor.idProduct;

		Interface::PrintVerbose("Device %03d:%03d  VID:PID: %04X:%04X\n", info.busNumber, info.deviceAddress,
			info.vendorId, info.productId);

		info.portPath = ReadPortPath(device, info.busNumber);

		ReadInterfaces(device, &info);

		// String descriptor reads are the only blocking part of a scan and each is bounded by the
		// time left. A serial that could not be read is flagged rather than replaced.
		if (!ReadSerial(device, descriptor.iSerialNumber, deadline, &info))
			info.serialUnreadable = true;

		devices->push_back(info);
	}

	libusb_free_device_list(deviceList, 1);
	return (true);
}
