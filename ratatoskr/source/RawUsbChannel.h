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

#ifndef RATATOSKR_RAWUSBCHANNEL_H
#define RATATOSKR_RAWUSBCHANNEL_H

// Ratatoskr
#include "Channel.h"

struct libusb_context;
struct libusb_device;
struct libusb_device_handle;

namespace Ratatoskr
{
	// Bulk and control transfers straight to the loader a download mode exposes.
	//
	// Commands:
	//   handshake <send-ascii> <expect-ascii>
	//   write <hex>
	//   read <max-bytes> [expect-hex]
	//   control <bmRequestType> <bRequest> <wValue> <wIndex> [hex]
	// Numbers accept a 0x prefix. Bytes read are reported as hex on standard output.
	class RawUsbChannel : public Channel
	{
		public:

			enum
			{
				kReadBufferSize = 4096
			};

		private:

			DeviceSnapshot device;

			libusb_context *libusbContext;
			libusb_device_handle *deviceHandle;

			int bInterfaceNumber;
			int bEndpointAddress_in;
			int bEndpointAddress_out;
			bool claimedInterface;

#ifdef OS_LINUX

			bool detachedDriver;

#endif

			CommandStatus Open(std::string *error);
			void Close(void);

			bool FindEndpoints(libusb_device *usbDevice);

			static CommandStatus MapLibusbResult(int result);

			CommandResult BulkWrite(const std::vector<uint8_t>& data, int timeoutMs);
			CommandResult BulkRead(int maxLength, int timeoutMs, std::vector<uint8_t> *data);
			CommandResult ControlTransfer(const std::vector<std::string>& arguments, int timeoutMs);
			CommandResult Handshake(const std::string& send, const std::string& expect, int timeoutMs);

		public:

			explicit RawUsbChannel(const DeviceSnapshot& device);
			~RawUsbChannel();

			Kind GetKind(void) const
			{
				return (kKindRawUsb);
			}

			CommandResult Execute(const std::string& command, int timeoutMs);
			CommandStatus SwitchMode(DeviceMode targetMode, int timeoutMs);
			CommandResult Probe(int timeoutMs);

			static std::string EncodeHex(const std::vector<uint8_t>& data);
			static bool DecodeHex(const std::string& text, std::vector<uint8_t> *data);
			static bool ParseNumber(const std::string& text, unsigned long *value);
	};
}

#endif
