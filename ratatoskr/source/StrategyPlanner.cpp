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

// C++ Standard Library
#include <algorithm>

// Ratatoskr
#include "Interface.h"
#include "StrategyPlanner.h"

using namespace Ratatoskr;

namespace
{
	bool RanksBefore(const RankedCandidate& left, const RankedCandidate& right)
	{
		if (left.weight != right.weight)
			return (left.weight > right.weight);

		if (left.descriptor->risk != right.descriptor->risk)
			return (left.descriptor->risk < right.descriptor->risk);

		return (left.descriptor->declarationIndex < right.descriptor->declarationIndex);
	}
}

StrategyPlanner::StrategyPlanner(double modeSwitchPenalty, double cacheSuccessBoost, ResultCache *resultCache) :
	modeSwitchPenalty(modeSwitchPenalty),
	cacheSuccessBoost(cacheSuccessBoost),
	resultCache(resultCache)
{
}

bool StrategyPlanner::IsReachable(Manufacturer manufacturer, DeviceMode currentMode, DeviceMode requiredMode)
{
	return (currentMode == requiredMode || IsModeSwitchSupported(manufacturer, currentMode, requiredMode));
}

std::vector<RankedCandidate> StrategyPlanner::Rank(const DeviceSnapshot& device, const DeviceProfile& profile,
	const MethodRegistry& registry) const
{
	std::vector<RankedCandidate> candidates;

	for (size_t i = 0; i < profile.supportedMethodNames.size(); i++)
	{
		const std::string& name = profile.supportedMethodNames[i];
		const BypassMethodDescriptor *descriptor = registry.Find(name);

		if (!descriptor)
		{
			Interface::PrintVerbose("Profile method \"%s\" is not registered\n", name.c_str());
			continue;
		}

		if (!IsReachable(device.GetManufacturer(), device.GetMode(), descriptor->requiredMode))
		{
			Interface::PrintVerbose("%s cannot reach %s mode from %s mode\n", name.c_str(),
				GetModeName(descriptor->requiredMode), GetModeName(device.GetMode()));
			continue;
		}

		RankedCandidate candidate;
		candidate.descriptor = descriptor;
		candidate.requiresModeSwitch = (descriptor->requiredMode != device.GetMode());

		int declaredRate = profile.GetDeclaredSuccessRate(name);
		candidate.weight = (declaredRate >= 0) ? declaredRate / 100.0 : descriptor->baseWeight;

		if (candidate.requiresModeSwitch)
			candidate.weight *= modeSwitchPenalty;

		AttemptStatus cachedStatus;
		if (resultCache && resultCache->Lookup(device.GetSerial(), name, &cachedStatus) && cachedStatus == kAttemptSuccess)
			candidate.weight = std::min(1.0, candidate.weight + cacheSuccessBoost);

		candidates.push_back(candidate);
	}

	std::stable_sort(candidates.begin(), candidates.end(), RanksBefore);

	return (candidates);
}
