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

#ifndef RATATOSKR_ACTIONCONTEXT_H
#define RATATOSKR_ACTIONCONTEXT_H

// Ratatoskr
#include "Arguments.h"
#include "BypassEngine.h"
#include "CommunicationManager.h"
#include "DeviceDetector.h"
#include "HostChannelFactory.h"
#include "JsonProfileCatalog.h"
#include "LibusbBus.h"
#include "MethodRegistry.h"

namespace Ratatoskr
{
	// The objects every action wires together, built from the command line.
	class ActionContext
	{
		private:

			const Arguments& arguments;

			LibusbBus usbBus;
			std::unique_ptr<DeviceDetector> detector;
			std::unique_ptr<HostChannelFactory> channelFactory;
			std::unique_ptr<CommunicationManager> communicationManager;

			MethodRegistry registry;
			std::unique_ptr<JsonProfileCatalog> catalog;

			EngineConfig engineConfig;

		public:

			static void AddCommonArguments(std::map<std::string, ArgumentType> *argumentTypes,
				std::map<std::string, std::string> *shortArgumentAliases);

			explicit ActionContext(const Arguments& arguments);

			// Applies the output options, opens the USB bus and loads --methods and --catalog.
			bool Initialise(bool requireMethods);

			DeviceDetector& GetDetector(void)
			{
				return (*detector);
			}

			CommunicationManager& GetCommunicationManager(void)
			{
				return (*communicationManager);
			}

			const MethodRegistry& GetRegistry(void) const
			{
				return (registry);
			}

			// Null without --catalog.
			JsonProfileCatalog *GetCatalog(void)
			{
				return (catalog.get());
			}

			const EngineConfig& GetEngineConfig(void) const
			{
				return (engineConfig);
			}

			bool IsJsonOutput(void) const
			{
				return (arguments.HasFlag("json"));
			}

			DeviceSnapshot Enrich(const DeviceSnapshot& device);

			std::vector<DeviceSnapshot> ScanAndEnrich(void);
			bool FindDevice(const std::string& serial, DeviceSnapshot *device);
	};
}

#endif
