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

#ifndef RATATOSKR_FAKEDEVICES_H
#define RATATOSKR_FAKEDEVICES_H

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <set>

#include "AuditSink.h"
#include "Authorizer.h"
#include "Channel.h"
#include "DeviceLocator.h"
#include "ProfileCatalog.h"
#include "Timing.h"
#include "UsbBus.h"

namespace Ratatoskr
{
	inline UsbInterfaceInfo MakeInterface(int number, int interfaceClass, int interfaceSubClass, int interfaceProtocol)
	{
		UsbInterfaceInfo info;
		info.interfaceNumber = number;
		info.interfaceClass = interfaceClass;
		info.interfaceSubClass = interfaceSubClass;
		info.interfaceProtocol = interfaceProtocol;

		return (info);
	}

	inline UsbDeviceInfo MakeUsbDevice(int vendorId, int productId, const std::string& serial, int bus = 1,
		int address = 2)
	{
		UsbDeviceInfo info;
		info.busNumber = bus;
		info.deviceAddress = address;
		info.vendorId = vendorId;
		info.productId = productId;
		info.serial = serial;

		return (info);
	}

	inline DeviceSnapshot MakeSnapshot(const std::string& serial, Manufacturer manufacturer, DeviceMode mode,
		int vendorId = 0x04E8, int productId = 0x6860)
	{
		return (DeviceSnapshot(serial, vendorId, productId, manufacturer, mode, 1, 2, 0));
	}

	inline CommandResult MakeResult(CommandStatus status, const std::string& standardOutput = "",
		const std::string& standardError = "")
	{
		CommandResult result(status, standardError);
		result.standardOutput = standardOutput;

		return (result);
	}

	// Each Enumerate() takes the next scripted listing; the last one repeats.
	class FakeUsbBus : public UsbBus
	{
		public:

			std::deque<std::vector<UsbDeviceInfo> > listings;
			bool failing;
			unsigned int enumerations;

			FakeUsbBus() :
				failing(false),
				enumerations(0)
			{
			}

			void SetDevices(const std::vector<UsbDeviceInfo>& devices)
			{
				listings.clear();
				listings.push_back(devices);
			}

			bool Enumerate(int timeoutMs, std::vector<UsbDeviceInfo> *devices)
			{
				enumerations++;

				if (failing)
					return (false);

				devices->clear();

				if (listings.empty())
					return (true);

				*devices = listings.front();

				if (listings.size() > 1)
					listings.pop_front();

				return (true);
			}
	};

	// What one fake device answers. Shared by every channel created for its serial.
	struct FakeDeviceScript
	{
		std::mutex scriptMutex;

		std::map<std::string, std::deque<CommandResult> > responses;
		CommandResult defaultResult;
		CommandResult probeResult;
		CommandStatus switchStatus;
		int executeDelayMs;

		std::vector<std::string> executed;
		std::vector<DeviceMode> switchRequests;
		unsigned int probes;

		std::atomic<int> activeChannels;
		std::atomic<int> maxActiveChannels;
		std::atomic<int> activeCommands;
		std::atomic<int> maxActiveCommands;

		FakeDeviceScript() :
			switchStatus(kCommandSucceeded),
			executeDelayMs(0),
			probes(0),
			activeChannels(0),
			maxActiveChannels(0),
			activeCommands(0),
			maxActiveCommands(0)
		{
		}

		void Push(const std::string& command, const CommandResult& result)
		{
			std::lock_guard<std::mutex> lock(scriptMutex);
			responses[command].push_back(result);
		}

		unsigned int CountExecuted(const std::string& command)
		{
			std::lock_guard<std::mutex> lock(scriptMutex);

			unsigned int count = 0;

			for (size_t i = 0; i < executed.size(); i++)
			{
				if (executed[i] == command)
					count++;
			}

			return (count);
		}

		static void RaiseMaximum(std::atomic<int>& maximum, int value)
		{
			int current = maximum.load();

			while (value > current && !maximum.compare_exchange_weak(current, value))
			{
			}
		}
	};

	class FakeChannel : public Channel
	{
		private:

			Kind kind;
			FakeDeviceScript *script;

		public:

			FakeChannel(Kind kind, FakeDeviceScript *script) :
				kind(kind),
				script(script)
			{
				FakeDeviceScript::RaiseMaximum(script->maxActiveChannels, ++script->activeChannels);
			}

			~FakeChannel()
			{
				--script->activeChannels;
			}

			Kind GetKind(void) const
			{
				return (kind);
			}

			CommandResult Execute(const std::string& command, int timeoutMs)
			{
				FakeDeviceScript::RaiseMaximum(script->maxActiveCommands, ++script->activeCommands);

				if (script->executeDelayMs > 0)
					Timing::Sleep(script->executeDelayMs);

				CommandResult result;

				{
					std::lock_guard<std::mutex> lock(script->scriptMutex);

					script->executed.push_back(command);

					std::map<std::string, std::deque<CommandResult> >::iterator queued = script->responses.find(command);

					if (queued != script->responses.end() && !queued->second.empty())
					{
						result = queued->second.front();
						queued->second.pop_front();
					}
					else
					{
						result = script->defaultResult;
					}
				}

				--script->activeCommands;

				return (result);
			}

			CommandStatus SwitchMode(DeviceMode targetMode, int timeoutMs)
			{
				std::lock_guard<std::mutex> lock(script->scriptMutex);

				script->switchRequests.push_back(targetMode);
				return (script->switchStatus);
			}

			CommandResult Probe(int timeoutMs)
			{
				std::lock_guard<std::mutex> lock(script->scriptMutex);

				script->probes++;
				return (script->probeResult);
			}
	};

	// Serves every mode but normal, like the host factory, from the script registered for the serial.
	class FakeChannelFactory : public ChannelFactory
	{
		public:

			std::map<std::string, FakeDeviceScript *> scripts;
			std::set<DeviceMode> unavailableModes;
			std::atomic<int> created;

			FakeChannelFactory() :
				created(0)
			{
				unavailableModes.insert(kModeNormal);
			}

			std::unique_ptr<Channel> CreateChannel(const DeviceSnapshot& device)
			{
				std::map<std::string, FakeDeviceScript *>::iterator script = scripts.find(device.GetSerial());

				if (script == scripts.end() || unavailableModes.count(device.GetMode()))
					return (std::unique_ptr<Channel>());

				created++;

				Channel::Kind kind = Channel::kKindDebugBridge;

				if (device.GetMode() == kModeBootLoader)
					kind = Channel::kKindBootLoader;
				else if (device.GetMode() == kModeManufacturerDownload || device.GetMode() == kModeEmergencyDownload)
					kind = Channel::kKindRawUsb;

				return (std::unique_ptr<Channel>(new FakeChannel(kind, script->second)));
			}
	};

	// Reports the device back in whatever mode it was asked for, unless told otherwise.
	class FakeLocator : public DeviceLocator
	{
		public:

			std::set<std::string> absentSerials;

			// When set, WaitForMode reports the device in this mode instead of the requested one.
			bool overrideMode;
			DeviceMode reportedMode;

			std::map<std::string, DeviceSnapshot> known;
			unsigned int waits;

			FakeLocator() :
				overrideMode(false),
				reportedMode(kModeNormal),
				waits(0)
			{
			}

			void Add(const DeviceSnapshot& device)
			{
				known[device.GetSerial()] = device;
			}

			bool IsPresent(const std::string& serial)
			{
				return (!absentSerials.count(serial));
			}

			bool Locate(const DeviceSnapshot& device, DeviceSnapshot *current)
			{
				std::map<std::string, DeviceSnapshot>::const_iterator found = known.find(device.GetSerial());

				if (found == known.end() || absentSerials.count(device.GetSerial()))
					return (false);

				*current = found->second;
				return (true);
			}

			// A successful sighting is remembered, so later lookups find the device in its new mode.
			bool WaitForMode(const DeviceSnapshot& device, DeviceMode targetMode, int timeoutMs, DeviceSnapshot *snapshot)
			{
				waits++;

				*snapshot = DeviceSnapshot();

				const std::string& serial = device.GetSerial();
				std::map<std::string, DeviceSnapshot>::iterator found = known.find(serial);

				if (found == known.end() || absentSerials.count(serial))
					return (false);

				DeviceMode mode = overrideMode ? reportedMode : targetMode;
				const DeviceSnapshot& last = found->second;

				*snapshot = DeviceSnapshot(serial, last.GetVendorId(), last.GetProductId(), last.GetManufacturer(), mode,
					last.GetBusNumber(), last.GetDeviceAddress(), last.GetDetectedAt(), last.GetPortPath());
				found->second = *snapshot;

				return (mode == targetMode);
			}
	};

	class RecordingAuditSink : public AuditSink
	{
		public:

			std::mutex recordsMutex;
			std::vector<AuditRecord> records;
			bool failing;

			RecordingAuditSink() :
				failing(false)
			{
			}

			bool Append(const AuditRecord& record)
			{
				std::lock_guard<std::mutex> lock(recordsMutex);

				records.push_back(record);
				return (!failing);
			}

			unsigned int CountTransitionsTo(const std::string& toState)
			{
				std::lock_guard<std::mutex> lock(recordsMutex);

				unsigned int count = 0;

				for (size_t i = 0; i < records.size(); i++)
				{
					if (records[i].toState == toState)
						count++;
				}

				return (count);
			}
	};

	class StaticAuthorizer : public Authorizer
	{
		public:

			bool allowAll;
			std::set<std::string> serials;
			unsigned int checks;

			explicit StaticAuthorizer(bool allowAll = true) :
				allowAll(allowAll),
				checks(0)
			{
			}

			bool CheckAuthorized(const std::string& serial)
			{
				checks++;
				return (allowAll || serials.count(serial));
			}
	};

	class FakeProfileCatalog : public ProfileCatalog
	{
		public:

			std::vector<DeviceProfile> profiles;
			unsigned int lookups;

			FakeProfileCatalog() :
				lookups(0)
			{
			}

			int FindProfile(int vendorId, int productId, const std::string& modelHint, DeviceProfile *profile)
			{
				lookups++;

				for (size_t i = 0; i < profiles.size(); i++)
				{
					const std::vector<int>& productIds = profiles[i].productIds;

					for (size_t j = 0; j < productIds.size(); j++)
					{
						if (profiles[i].vendorId == vendorId && productIds[j] == productId)
						{
							*profile = profiles[i];
							return (kProfileFound);
						}
					}
				}

				return (kProfileNotFound);
			}
	};

	// Programmable clock for the result cache.
	inline uint64_t& FakeClockValue(void)
	{
		static uint64_t value = 1000000;
		return (value);
	}

	inline uint64_t FakeClockNow(void)
	{
		return (FakeClockValue());
	}
}

#endif
