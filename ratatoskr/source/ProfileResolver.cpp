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
#include "Interface.h"
#include "ProfileResolver.h"

using namespace Ratatoskr;

ProfileResolver::ProfileResolver(ProfileCatalog *catalog, const MethodRegistry *registry) :
	catalog(catalog),
	registry(registry)
{
}

bool ProfileResolver::Resolve(const DeviceSnapshot& device, DeviceProfile *profile)
{
	if (catalog && catalog->FindProfile(device.GetVendorId(), device.GetProductId(), device.GetModelName(), profile)
		== ProfileCatalog::kProfileFound)
	{
		Interface::PrintVerbose("%s matches catalog model \"%s\"\n", device.GetSerial().c_str(),
			profile->modelName.c_str());

		if (device.HasApiLevel() && !profile->IsApiLevelCompatible(device.GetApiLevel()))
		{
			Interface::PrintWarning("%s runs API level %d, outside the %d - %d range listed for %s\n",
				device.GetSerial().c_str(), device.GetApiLevel(), profile->minApiLevel, profile->maxApiLevel,
				profile->modelName.c_str());
		}

		return (true);
	}

	Interface::PrintWarning("No catalog profile for %s (%04X:%04X), using the generic profile\n",
		device.GetSerial().c_str(), device.GetVendorId(), device.GetProductId());

	*profile = BuildGenericProfile(device, *registry);
	return (false);
}

DeviceProfile ProfileResolver::BuildGenericProfile(const DeviceSnapshot& device, const MethodRegistry& registry)
{
	DeviceProfile profile;
	profile.manufacturer = device.GetManufacturer();
	profile.modelName = device.GetModelName().empty() ? "generic" : device.GetModelName();
	profile.vendorId = device.GetVendorId();
	profile.productIds.push_back(device.GetProductId());
	profile.generic = true;

	const std::vector<BypassMethodDescriptor>& descriptors = registry.GetDescriptors();

	bool found = false;
	RiskTier lowestRisk = kRiskVeryHigh;

	for (size_t i = 0; i < descriptors.size(); i++)
	{
		const BypassMethodDescriptor& descriptor = descriptors[i];

		if (descriptor.requiredMode == device.GetMode() && descriptor.SupportsManufacturer(device.GetManufacturer())
			&& (!found || descriptor.risk < lowestRisk))
		{
			lowestRisk = descriptor.risk;
			found = true;
		}
	}

	for (size_t i = 0; found && i < descriptors.size(); i++)
	{
		const BypassMethodDescriptor& descriptor = descriptors[i];

		if (descriptor.requiredMode == device.GetMode() && descriptor.SupportsManufacturer(device.GetManufacturer())
			&& descriptor.risk == lowestRisk)
		{
			profile.supportedMethodNames.push_back(descriptor.name);
		}
	}

	return (profile);
}
