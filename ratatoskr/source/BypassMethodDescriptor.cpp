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

// Ratatoskr
#include "BypassMethodDescriptor.h"

using namespace Ratatoskr;

namespace
{
	struct KindEntry
	{
		const char *name;
		MethodKind kind;
		DeviceMode mode;
	};

	const KindEntry kindTable[] = {
		{ "debug_bridge_exploit", kMethodDebugBridgeExploit, kModeDebugBridge },
		{ "boot_loader_manipulation", kMethodBootLoaderManipulation, kModeBootLoader },
		{ "manufacturer_download", kMethodManufacturerDownload, kModeManufacturerDownload },
		{ "emergency_download", kMethodEmergencyDownload, kModeEmergencyDownload },
		{ "chained", kMethodChained, kModeDebugBridge }
	};

	const int kindTableSize = sizeof(kindTable) / sizeof(kindTable[0]);
}

namespace Ratatoskr
{
	const char *GetMethodKindName(MethodKind kind)
	{
		for (int i = 0; i < kindTableSize; i++)
		{
			if (kindTable[i].kind == kind)
				return (kindTable[i].name);
		}

		return ("unknown");
	}

	bool ParseMethodKind(const std::string& name, MethodKind *kind)
	{
		std::string lowered = ToLowerCase(name);

		for (int i = 0; i < kindTableSize; i++)
		{
			if (lowered == kindTable[i].name)
			{
				*kind = kindTable[i].kind;
				return (true);
			}
		}

		return (false);
	}

	DeviceMode GetMethodKindMode(MethodKind kind)
	{
		for (int i = 0; i < kindTableSize; i++)
		{
			if (kindTable[i].kind == kind)
				return (kindTable[i].mode);
		}

		return (kModeDebugBridge);
	}
}

MethodStep::MethodStep() :
	timeoutMs(0),
	mode(kModeDebugBridge)
{
}

MethodStep::MethodStep(const std::string& id, const std::string& command, DeviceMode mode) :
	id(id),
	command(command),
	timeoutMs(0),
	mode(mode)
{
}

BypassMethodDescriptor::BypassMethodDescriptor() :
	kind(kMethodDebugBridgeExploit),
	requiredMode(kModeDebugBridge),
	risk(kRiskMedium),
	baseWeight(0.5),
	declarationIndex(0)
{
}

bool BypassMethodDescriptor::SupportsManufacturer(Manufacturer manufacturer) const
{
	if (manufacturers.empty())
		return (true);

	for (size_t i = 0; i < manufacturers.size(); i++)
	{
		if (manufacturers[i] == manufacturer)
			return (true);
	}

	return (false);
}
