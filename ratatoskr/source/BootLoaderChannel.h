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

#ifndef RATATOSKR_BOOTLOADERCHANNEL_H
#define RATATOSKR_BOOTLOADERCHANNEL_H

// Ratatoskr
#include "ToolChannel.h"

namespace Ratatoskr
{
	class BootLoaderChannel : public ToolChannel
	{
		protected:

			bool IsDisconnectMessage(const std::string& message) const;

		public:

			BootLoaderChannel(const std::string& fastbootPath, const DeviceSnapshot& device, DeviceLocator *locator);

			Kind GetKind(void) const
			{
				return (kKindBootLoader);
			}

			CommandStatus SwitchMode(DeviceMode targetMode, int timeoutMs);
			CommandResult Probe(int timeoutMs);

			static const char *GetSwitchCommand(DeviceMode targetMode);

			// "unlocked: yes" -> "yes". Boot-loader tools print variables on stderr.
			static std::string ParseVariable(const std::string& output, const std::string& name);
	};
}

#endif
