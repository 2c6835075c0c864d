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
#include "DeviceProfile.h"

using namespace Ratatoskr;

namespace
{
	const char *riskTierNames[] = {
		"very_low",
		"low",
		"medium",
		"high",
		"very_high"
	};

	const char *difficultyTierNames[] = {
		"very_easy",
		"easy",
		"medium",
		"hard",
		"very_hard",
		"extremely_hard"
	};
}

namespace Ratatoskr
{
	const char *GetRiskTierName(RiskTier risk)
	{
		if (risk < kRiskVeryLow || risk > kRiskVeryHigh)
			return ("unknown");

		return (riskTierNames[risk]);
	}

	bool ParseRiskTier(const std::string& name, RiskTier *risk)
	{
		std::string lowered = ToLowerCase(name);

		for (int i = kRiskVeryLow; i <= kRiskVeryHigh; i++)
		{
			if (lowered == riskTierNames[i])
			{
				*risk = static_cast<RiskTier>(i);
				return (true);
			}
		}

		return (false);
	}

	const char *GetDifficultyTierName(DifficultyTier difficulty)
	{
		if (difficulty < kDifficultyVeryEasy || difficulty > kDifficultyExtremelyHard)
			return ("unknown");

		return (difficultyTierNames[difficulty]);
	}

	bool ParseDifficultyTier(const std::string& name, DifficultyTier *difficulty)
	{
		std::string lowered = ToLowerCase(name);

		for (int i = kDifficultyVeryEasy; i <= kDifficultyExtremelyHard; i++)
		{
			if (lowered == difficultyTierNames[i])
			{
				*difficulty = static_cast<DifficultyTier>(i);
				return (true);
			}
		}

		return (false);
	}
}

DeviceProfile::DeviceProfile() :
	manufacturer(kManufacturerUnknown),
	vendorId(0),
	overallSuccessRate(0),
	difficulty(kDifficultyMedium),
	minApiLevel(kApiLevelUnbounded),
	maxApiLevel(kApiLevelUnbounded),
	generic(false)
{
}

bool DeviceProfile::SupportsMethod(const std::string& name) const
{
	for (size_t i = 0; i < supportedMethodNames.size(); i++)
	{
		if (supportedMethodNames[i] == name)
			return (true);
	}

	return (false);
}

bool DeviceProfile::HasDeclaredSuccessRate(const std::string& name) const
{
	return (declaredSuccessRates.find(name) != declaredSuccessRates.end());
}

int DeviceProfile::GetDeclaredSuccessRate(const std::string& name) const
{
	std::map<std::string, int>::const_iterator rate = declaredSuccessRates.find(name);

	if (rate == declaredSuccessRates.end())
		return (-1);

	return (rate->second);
}

bool DeviceProfile::IsApiLevelCompatible(int apiLevel) const
{
	if (apiLevel <= 0)
		return (true);

	if (minApiLevel != kApiLevelUnbounded && apiLevel < minApiLevel)
		return (false);

	if (maxApiLevel != kApiLevelUnbounded && apiLevel > maxApiLevel)
		return (false);

	return (true);
}

bool DeviceProfile::IsAndroidVersionCompatible(const std::string& androidVersion) const
{
	if (androidVersion.empty() || androidVersions.empty())
		return (true);

	for (size_t i = 0; i < androidVersions.size(); i++)
	{
		// "11" covers "11.0.1"
		const std::string& version = androidVersions[i];

		if (androidVersion == version || (androidVersion.compare(0, version.size(), version) == 0
			&& androidVersion.size() > version.size() && androidVersion[version.size()] == '.'))
		{
			return (true);
		}
	}

	return (false);
}
