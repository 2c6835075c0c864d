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

#ifndef RATATOSKR_HOSTCHANNELFACTORY_H
#define RATATOSKR_HOSTCHANNELFACTORY_H

// Ratatoskr
#include "Channel.h"
#include "DeviceLocator.h"

namespace Ratatoskr
{
	// Picks the transport that serves a device's current mode: the debug-bridge tool for normal
	// debugging and recovery, the boot-loader tool for the boot loader, raw USB for the download modes.
	class HostChannelFactory : public ChannelFactory
	{
		private:

			std::string adbPath;
			std::string fastbootPath;
			DeviceLocator *locator;

		public:

			HostChannelFactory(const std::string& adbPath, const std::string& fastbootPath, DeviceLocator *locator);

			std::unique_ptr<Channel> CreateChannel(const DeviceSnapshot& device);
	};
}

#endif
