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

#ifndef RATATOSKR_USBBUS_H
#define RATATOSKR_USBBUS_H

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	struct UsbInterfaceInfo
	{
		int interfaceNumber;
		int interfaceClass;
		int interfaceSubClass;
		int interfaceProtocol;
	};

	struct UsbDeviceInfo
	{
		int busNumber;
		int deviceAddress;
		int vendorId;
		int productId;

		// "1-4.2". Survives re-enumeration as long as the cable stays in the same port.
		std::string portPath;

		// Empty when the device exposes no serial string or could not be opened.
		std::string serial;

		// The device declares a serial string but reading it failed or ran out of time.
		bool serialUnreadable;

		// First alt setting of every interface in the active configuration.
		std::vector<UsbInterfaceInfo> interfaces;

		UsbDeviceInfo() :
			busNumber(0),
			deviceAddress(0),
			vendorId(0),
			productId(0),
			serialUnreadable(false)
		{
		}
	};

	// Read-only view of the bus. Implementations must not send writable requests.
	class UsbBus
	{
		public:

			virtual ~UsbBus()
			{
			}

			// Lists every attached device. Returns false only if the bus itself could not be read.
			virtual bool Enumerate(int timeoutMs, std::vector<UsbDeviceInfo> *devices) = 0;
	};
}

#endif
