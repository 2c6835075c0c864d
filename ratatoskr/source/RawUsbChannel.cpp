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
#include <stdlib.h>
#include <string.h>

// libusb
#include <libusb.h>

// Ratatoskr
#include "Interface.h"
#include "ProcessRunner.h"
#include "RawUsbChannel.h"
#include "Timing.h"

// Future versions of libusb will use usb_interface instead of interface.
#define usb_interface interface

using namespace Ratatoskr;

RawUsbChannel::RawUsbChannel(const DeviceSnapshot& device) :
	device(device)
{
	libusbContext = nullptr;
	deviceHandle = nullptr;

	bInterfaceNumber = -1;
	bEndpointAddress_in = -1;
	bEndpointAddress_out = -1;
	claimedInterface = false;

#ifdef OS_LINUX

	detachedDriver = false;

#endif
}

RawUsbChannel::~RawUsbChannel()
{
	Close();

	if (libusbContext)
		libusb_exit(libusbContext);
}

CommandStatus RawUsbChannel::MapLibusbResult(int result)
{
	switch (result)
	{
		case LIBUSB_SUCCESS:
			return (kCommandSucceeded);

		case LIBUSB_ERROR_TIMEOUT:
			return (kCommandTimedOut);

		case LIBUSB_ERROR_NO_DEVICE:
			return (kCommandDeviceDisconnected);

		case LIBUSB_ERROR_ACCESS:
		case LIBUSB_ERROR_BUSY:
		case LIBUSB_ERROR_NOT_SUPPORTED:
			return (kCommandChannelUnavailable);

		default:
			return (kCommandFailed);
	}
}

bool RawUsbChannel::FindEndpoints(libusb_device *usbDevice)
{
	libusb_config_descriptor *configDescriptor = nullptr;

	int result = libusb_get_active_config_descriptor(usbDevice, &configDescriptor);
	if (result != LIBUSB_SUCCESS || !configDescriptor)
	{
		Interface::PrintError("Failed to retrieve config descriptor\n");
		return (false);
	}

	//	Take the first interface carrying a bulk pair: the CDC data interface of a
	//	download mode loader, or the vendor-specific interface of an emergency loader.
	for (int i = 0; i < configDescriptor->bNumInterfaces && bInterfaceNumber < 0; i++)
	{
		for (int j = 0; j < configDescriptor->usb_interface[i].num_altsetting; j++)
		{
			const libusb_interface_descriptor& altsetting = configDescriptor->usb_interface[i].altsetting[j];

			if (altsetting.bInterfaceClass != LIBUSB_CLASS_DATA && altsetting.bInterfaceClass != LIBUSB_CLASS_VENDOR_SPEC)
				continue;

			int endpointIn = -1;
			int endpointOut = -1;

			for (int k = 0; k < altsetting.bNumEndpoints; k++)
			{
				const libusb_endpoint_descriptor *endpointDescriptor = &altsetting.endpoint[k];

				//	......10 Transfer type: bulk
				if ((endpointDescriptor->bmAttributes & 0x03) != LIBUSB_TRANSFER_TYPE_BULK)
					continue;

				if (endpointDescriptor->bEndpointAddress & LIBUSB_ENDPOINT_IN)
				{
					if (endpointIn < 0)
						endpointIn = endpointDescriptor->bEndpointAddress;
				}
				else if (endpointOut < 0)
				{
					endpointOut = endpointDescriptor->bEndpointAddress;
				}
			}

			if (0 <= endpointIn && 0 <= endpointOut)
			{
				bInterfaceNumber = altsetting.bInterfaceNumber;
				bEndpointAddress_in = endpointIn;
				bEndpointAddress_out = endpointOut;

				Interface::PrintVerbose("Using interface %d, endpoints in %02X out %02X\n", bInterfaceNumber,
					bEndpointAddress_in, bEndpointAddress_out);
				break;
			}
		}
	}

	libusb_free_config_descriptor(configDescriptor);
	return (bInterfaceNumber >= 0);
}

CommandStatus RawUsbChannel::Open(std::string *error)
{
	if (deviceHandle)
		return (kCommandSucceeded);

	int result;

	if (!libusbContext)
	{
		result = libusb_init(&libusbContext);
		if (result != LIBUSB_SUCCESS)
		{
			libusbContext = nullptr;
			*error = std::string("Failed to initialise libusb: ") + libusb_error_name(result);
			return (kCommandChannelUnavailable);
		}
	}

	libusb_device **devices;
	ssize_t deviceCount = libusb_get_device_list(libusbContext, &devices);
	libusb_device *usbDevice = nullptr;

	for (ssize_t deviceIndex = 0; deviceIndex < deviceCount; deviceIndex++)
	{
		libusb_device_descriptor descriptor;
		if (libusb_get_device_descriptor(devices[deviceIndex], &descriptor) != LIBUSB_SUCCESS)
			continue;

		if (descriptor.idVendor == device.GetVendorId() && descriptor.idProduct == device.GetProductId()
			&& libusb_get_bus_number(devices[deviceIndex]) == device.GetBusNumber()
			&& libusb_get_device_address(devices[deviceIndex]) == device.GetDeviceAddress())
		{
			usbDevice = devices[deviceIndex];
			libusb_ref_device(usbDevice);
			break;
		}
	}

	if (deviceCount >= 0)
		libusb_free_device_list(devices, 1);

	if (!usbDevice)
	{
		*error = "device is no longer on the bus";
		return (kCommandDeviceDisconnected);
	}

	result = libusb_open(usbDevice, &deviceHandle);
	if (result != LIBUSB_SUCCESS)
	{
		libusb_unref_device(usbDevice);
		deviceHandle = nullptr;
		*error = std::string("Failed to access device: ") + libusb_error_name(result);
		return (MapLibusbResult(result) == kCommandDeviceDisconnected ? kCommandDeviceDisconnected : kCommandChannelUnavailable);
	}

	bool found = FindEndpoints(usbDevice);
	libusb_unref_device(usbDevice);

	if (!found)
	{
		Close();
		*error = "no bulk interface on device";
		return (kCommandChannelUnavailable);
	}

	Interface::PrintVerbose("Claiming interface index %d . . . ", bInterfaceNumber);
	result = libusb_claim_interface(deviceHandle, bInterfaceNumber);

#ifdef OS_LINUX

	if (result != LIBUSB_SUCCESS) // LIBUSB_ERROR_BUSY seen in practice
	{
		Interface::PrintVerbose("%s\nDetaching kernel driver . . . ", libusb_error_name(result));
		libusb_detach_kernel_driver(deviceHandle, bInterfaceNumber);
		detachedDriver = true;

		Interface::PrintVerbose("OK\nClaiming interface again . . . ");
		result = libusb_claim_interface(deviceHandle, bInterfaceNumber);
	}

#endif

	if (result != LIBUSB_SUCCESS)
	{
		*error = std::string("Failed to claim interface: ") + libusb_error_name(result);
		CommandStatus status = MapLibusbResult(result);

		//	Close() still sees the interface number, so a driver detached above is re-attached.
		Close();
		return (status == kCommandDeviceDisconnected ? status : kCommandChannelUnavailable);
	}

	claimedInterface = true;

	Interface::PrintVerbose("OK\n");
	return (kCommandSucceeded);
}

void RawUsbChannel::Close(void)
{
	if (!deviceHandle)
		return;

	if (bInterfaceNumber >= 0)
	{
		if (claimedInterface)
			libusb_release_interface(deviceHandle, bInterfaceNumber);

#ifdef OS_LINUX

		if (detachedDriver)
		{
			Interface::PrintVerbose("Re-attaching kernel driver...\n");
			libusb_attach_kernel_driver(deviceHandle, bInterfaceNumber);
			detachedDriver = false;
		}

#endif
	}

	libusb_close(deviceHandle);
	deviceHandle = nullptr;

	claimedInterface = false;
	bInterfaceNumber = -1;
	bEndpointAddress_in = -1;
	bEndpointAddress_out = -1;
}

CommandResult RawUsbChannel::BulkWrite(const std::vector<uint8_t>& data, int timeoutMs)
{
	int dataTransferred = 0;
	int result = libusb_bulk_transfer(deviceHandle, static_cast<unsigned char>(bEndpointAddress_out),
		const_cast<unsigned char *>(data.empty() ? nullptr : &data[0]), static_cast<int>(data.size()), &dataTransferred,
		static_cast<unsigned int>(timeoutMs));

	CommandResult commandResult(MapLibusbResult(result), result == LIBUSB_SUCCESS ? "" : libusb_error_name(result));

	if (result == LIBUSB_SUCCESS && dataTransferred != static_cast<int>(data.size()))
	{
		commandResult.status = kCommandFailed;
		commandResult.success = false;
		commandResult.standardError = "Failed to complete sending of data";
	}

	return (commandResult);
}

CommandResult RawUsbChannel::BulkRead(int maxLength, int timeoutMs, std::vector<uint8_t> *data)
{
	data->assign(maxLength > 0 ? maxLength : 1, 0);

	int dataTransferred = 0;
	int result = libusb_bulk_transfer(deviceHandle, static_cast<unsigned char>(bEndpointAddress_in), &(*data)[0],
		static_cast<int>(data->size()), &dataTransferred, static_cast<unsigned int>(timeoutMs));

	data->resize(result == LIBUSB_SUCCESS ? dataTransferred : 0);

	CommandResult commandResult(MapLibusbResult(result), result == LIBUSB_SUCCESS ? "" : libusb_error_name(result));
	commandResult.standardOutput = EncodeHex(*data);
	return (commandResult);
}

CommandResult RawUsbChannel::ControlTransfer(const std::vector<std::string>& arguments, int timeoutMs)
{
	unsigned long bmRequestType, bRequest, wValue, wIndex;

	if (arguments.size() < 5 || !ParseNumber(arguments[1], &bmRequestType) || !ParseNumber(arguments[2], &bRequest)
		|| !ParseNumber(arguments[3], &wValue) || !ParseNumber(arguments[4], &wIndex))
	{
		return (CommandResult(kCommandFailed, "usage: control <bmRequestType> <bRequest> <wValue> <wIndex> [hex]"));
	}

	std::vector<uint8_t> data;
	if (arguments.size() > 5 && !DecodeHex(arguments[5], &data))
		return (CommandResult(kCommandFailed, "invalid hex payload"));

	int result = libusb_control_transfer(deviceHandle, static_cast<uint8_t>(bmRequestType), static_cast<uint8_t>(bRequest),
		static_cast<uint16_t>(wValue), static_cast<uint16_t>(wIndex), data.empty() ? nullptr : &data[0],
		static_cast<uint16_t>(data.size()), static_cast<unsigned int>(timeoutMs));

	//	EPIPE is how a device declines an optional class request.
	if (result == LIBUSB_ERROR_PIPE)
		return (CommandResult(kCommandFailed, "EPIPE"));

	CommandResult commandResult(result >= 0 ? kCommandSucceeded : MapLibusbResult(result),
		result >= 0 ? "" : libusb_error_name(result));

	if (result > 0 && (bmRequestType & LIBUSB_ENDPOINT_IN))
	{
		data.resize(result);
		commandResult.standardOutput = EncodeHex(data);
	}

	return (commandResult);
}

CommandResult RawUsbChannel::Handshake(const std::string& send, const std::string& expect, int timeoutMs)
{
	std::vector<uint8_t> request(send.begin(), send.end());

	CommandResult result = BulkWrite(request, timeoutMs);
	if (result.status != kCommandSucceeded)
		return (result);

	std::vector<uint8_t> response;
	result = BulkRead(static_cast<int>(expect.size()) + 3, timeoutMs, &response);
	if (result.status != kCommandSucceeded)
		return (result);

	std::string received(response.begin(), response.end());
	result.standardOutput = received;

	if (received.compare(0, expect.size(), expect) != 0)
	{
		result.status = kCommandFailed;
		result.success = false;
		result.standardError = "Unexpected communication! Expected: \"" + expect + "\" Received: \"" + received + "\"";
	}

	return (result);
}

CommandResult RawUsbChannel::Execute(const std::string& command, int timeoutMs)
{
	std::vector<std::string> arguments = ProcessRunner::SplitCommandLine(command);
	if (arguments.empty())
		return (CommandResult(kCommandFailed, "empty command"));

	uint64_t startTime = Timing::GetMonotonicMs();

	std::string error;
	CommandStatus openStatus = Open(&error);
	if (openStatus != kCommandSucceeded)
		return (CommandResult(openStatus, error));

	Interface::PrintVerbose("[%s] %s\n", GetKindName(GetKind()), command.c_str());

	CommandResult result;
	const std::string& verb = arguments[0];

	if (verb == "handshake" && arguments.size() == 3)
	{
		result = Handshake(arguments[1], arguments[2], timeoutMs);
	}
	else if (verb == "write" && arguments.size() == 2)
	{
		std::vector<uint8_t> data;
		if (!DecodeHex(arguments[1], &data))
			return (CommandResult(kCommandFailed, "invalid hex payload"));

		result = BulkWrite(data, timeoutMs);
	}
	else if (verb == "read" && (arguments.size() == 2 || arguments.size() == 3))
	{
		unsigned long maxLength;
		if (!ParseNumber(arguments[1], &maxLength) || maxLength == 0 || maxLength > kReadBufferSize)
			return (CommandResult(kCommandFailed, "invalid read length"));

		std::vector<uint8_t> data;
		result = BulkRead(static_cast<int>(maxLength), timeoutMs, &data);

		if (result.status == kCommandSucceeded && arguments.size() == 3
			&& ToLowerCase(result.standardOutput).compare(0, arguments[2].size(), ToLowerCase(arguments[2])) != 0)
		{
			result.status = kCommandFailed;
			result.success = false;
			result.standardError = "response did not match " + arguments[2];
		}
	}
	else if (verb == "control")
	{
		result = ControlTransfer(arguments, timeoutMs);
	}
	else
	{
		return (CommandResult(kCommandFailed, "unknown raw USB command: " + command));
	}

	if (result.status == kCommandDeviceDisconnected)
		Close();

	result.durationMs = static_cast<unsigned int>(Timing::GetMonotonicMs() - startTime);
	return (result);
}

CommandStatus RawUsbChannel::SwitchMode(DeviceMode targetMode, int timeoutMs)
{
	(void)timeoutMs;

	Interface::PrintWarning("%s mode exposes no switch request (wanted %s)\n", GetModeName(device.GetMode()),
		GetModeName(targetMode));
	return (kCommandFailed);
}

CommandResult RawUsbChannel::Probe(int timeoutMs)
{
	(void)timeoutMs;

	std::string error;
	CommandStatus status = Open(&error);

	return (CommandResult(status, error));
}

std::string RawUsbChannel::EncodeHex(const std::vector<uint8_t>& data)
{
	static const char digits[] = "0123456789abcdef";

	std::string text;
	text.reserve(data.size() * 2);

	for (size_t i = 0; i < data.size(); i++)
	{
		text += digits[data[i] >> 4];
		text += digits[data[i] & 0x0F];
	}

	return (text);
}

bool RawUsbChannel::DecodeHex(const std::string& text, std::vector<uint8_t> *data)
{
	std::string digits(text);
	if (digits.compare(0, 2, "0x") == 0 || digits.compare(0, 2, "0X") == 0)
		digits = digits.substr(2);

	if (digits.size() % 2 != 0)
		return (false);

	data->clear();

	for (size_t i = 0; i < digits.size(); i += 2)
	{
		if (!isxdigit(static_cast<unsigned char>(digits[i])) || !isxdigit(static_cast<unsigned char>(digits[i + 1])))
			return (false);

		char pair[3] = { digits[i], digits[i + 1], 0 };
		data->push_back(static_cast<uint8_t>(strtoul(pair, nullptr, 16)));
	}

	return (true);
}

bool RawUsbChannel::ParseNumber(const std::string& text, unsigned long *value)
{
	if (text.empty())
		return (false);

	char *end;
	*value = strtoul(text.c_str(), &end, 0);

	return (*end == 0);
}
