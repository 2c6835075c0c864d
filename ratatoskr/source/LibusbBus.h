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

#ifndef RATATOSKR_LIBUSBBUS_H
#define RATATOSKR_LIBUSBBUS_H

// Ratatoskr
#include "UsbBus.h"

struct libusb_context;
struct libusb_device;

namespace Ratatoskr
{
	class LibusbBus : public UsbBus
	{
		public:

			enum
			{
				kStringBufferSize = 128,
				kMaxPortDepth = 7
			};

		private:

			libusb_context *libusbContext;

			bool ReadInterfaces(libusb_device *device, UsbDeviceInfo *info);
			bool ReadSerial(libusb_device *device, int serialIndex, uint64_t deadline, UsbDeviceInfo *info);

			static std::string ReadPortPath(libusb_device *device, int busNumber);

		public:

			LibusbBus();
			~LibusbBus();

			bool Initialise(void);

			bool Enumerate(int timeoutMs, std::vector<UsbDeviceInfo> *devices);
	};
}

#endif
