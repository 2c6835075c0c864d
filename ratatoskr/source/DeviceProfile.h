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

#ifndef RATATOSKR_DEVICEPROFILE_H
#define RATATOSKR_DEVICEPROFILE_H

// C++ Standard Library
#include <map>

// Ratatoskr
#include "DeviceTypes.h"

namespace Ratatoskr
{
	enum RiskTier
	{
		kRiskVeryLow = 0,
		kRiskLow,
		kRiskMedium,
		kRiskHigh,
		kRiskVeryHigh
	};

	enum DifficultyTier
	{
		kDifficultyVeryEasy = 0,
		kDifficultyEasy,
		kDifficultyMedium,
		kDifficultyHard,
		kDifficultyVeryHard,
		kDifficultyExtremelyHard
	};

	const char *GetRiskTierName(RiskTier risk);
	bool ParseRiskTier(const std::string& name, RiskTier *risk);

	const char *GetDifficultyTierName(DifficultyTier difficulty);
	bool ParseDifficultyTier(const std::string& name, DifficultyTier *difficulty);

	// What the catalog knows about one device model. Copied into the engine at session start
	// and never refreshed while the session runs.
	struct DeviceProfile
	{
		enum
		{
			kApiLevelUnbounded = 0
		};

		Manufacturer manufacturer;
		std::string modelName;
		std::string codename;
		std::string series;

		int vendorId;
		std::vector<int> productIds;

		// Catalog order. Membership is what matters to ranking.
		std::vector<std::string> supportedMethodNames;

		// Declared success rate per method, 0 - 100.
		std::map<std::string, int> declaredSuccessRates;

		// Overall rate the catalog quotes for the model, shown by "info" only.
		int overallSuccessRate;

		DifficultyTier difficulty;

		std::vector<std::string> androidVersions;
		int minApiLevel;
		int maxApiLevel;

		bool generic;

		DeviceProfile();

		bool SupportsMethod(const std::string& name) const;
		bool HasDeclaredSuccessRate(const std::string& name) const;

		// 0 - 100, or -1 when the profile declares nothing for the method.
		int GetDeclaredSuccessRate(const std::string& name) const;

		// An unknown API level or an unbounded range is always compatible.
		bool IsApiLevelCompatible(int apiLevel) const;
		bool IsAndroidVersionCompatible(const std::string& androidVersion) const;
	};
}

#endif
