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

#ifndef RATATOSKR_DEVICELOCATOR_H
#define RATATOSKR_DEVICELOCATOR_H

// Ratatoskr
#include "DeviceSnapshot.h"

namespace Ratatoskr
{
	// Answers "is this serial still on the bus, and in which mode" without touching the device.
	class DeviceLocator
	{
		public:

			virtual ~DeviceLocator()
			{
			}

			virtual bool IsPresent(const std::string& serial) = 0;

			// Finds the device as it is attached now, matched by serial or by physical port.
			virtual bool Locate(const DeviceSnapshot& device, DeviceSnapshot *current) = 0;

			// Polls until the device re-enumerates in targetMode or timeoutMs passes. Loaders that
			// drop the serial string are recognised by their port. On return *snapshot holds the last
			// sighting, or an invalid snapshot if the device was never seen.
			virtual bool WaitForMode(const DeviceSnapshot& device, DeviceMode targetMode, int timeoutMs,
				DeviceSnapshot *snapshot) = 0;
	};
}

#endif
