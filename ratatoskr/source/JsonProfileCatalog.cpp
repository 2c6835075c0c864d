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

// C Standard Library
#include <stdlib.h>

// C++ Standard Library
#include <algorithm>

// Ratatoskr
#include "Interface.h"
#include "JsonProfileCatalog.h"
#include "TextFile.h"

using namespace Ratatoskr;

bool JsonProfileCatalog::ParseId(JsonVariantConst value, int *id)
{
	if (value.is<int>())
	{
		*id = value.as<int>();
		return (true);
	}

	if (!value.is<const char *>())
		return (false);

	// USB ids are written in hex, with or without a 0x prefix.
	const char *text = value.as<const char *>();
	char *end;
	long parsed = strtol(text, &end, 16);

	if (*text == 0 || *end != 0 || parsed < 0 || parsed > 0xFFFF)
		return (false);

	*id = static_cast<int>(parsed);
	return (true);
}

bool JsonProfileCatalog::LoadModel(JsonObjectConst model, Manufacturer manufacturer, int vendorId,
	const std::string& series)
{
	DeviceProfile profile;
	profile.manufacturer = manufacturer;
	profile.vendorId = vendorId;
	profile.series = series;
	profile.modelName = model["name"] | "";
	profile.codename = model["codename"] | "";
	profile.overallSuccessRate = model["success_rate"] | 0;

	if (profile.modelName.empty())
	{
		Interface::PrintError("Catalog model in series \"%s\" has no name\n", series.c_str());
		return (false);
	}

	JsonArrayConst productIds = model["product_ids"];
	for (JsonVariantConst productId : productIds)
	{
		int id;

		if (!ParseId(productId, &id))
		{
			Interface::PrintError("Catalog model \"%s\" has an invalid product id\n", profile.modelName.c_str());
			return (false);
		}

		profile.productIds.push_back(id);
	}

	JsonArrayConst androidVersions = model["android_versions"];
	for (JsonVariantConst androidVersion : androidVersions)
		profile.androidVersions.push_back(androidVersion.as<std::string>());

	JsonArrayConst apiLevels = model["api_levels"];
	for (JsonVariantConst apiLevel : apiLevels)
	{
		int level = apiLevel | 0;

		if (level <= 0)
			continue;

		if (profile.minApiLevel == DeviceProfile::kApiLevelUnbounded || level < profile.minApiLevel)
			profile.minApiLevel = level;

		if (level > profile.maxApiLevel)
			profile.maxApiLevel = level;
	}

	JsonArrayConst supportedMethods = model["supported_methods"];
	for (JsonVariantConst method : supportedMethods)
	{
		std::string name = method.as<std::string>();

		if (!name.empty() && !profile.SupportsMethod(name))
			profile.supportedMethodNames.push_back(name);
	}

	JsonObjectConst successRates = model["method_success_rates"];
	for (JsonPairConst rate : successRates)
	{
		int value = rate.value() | -1;

		if (value < 0 || value > 100)
		{
			Interface::PrintError("Catalog model \"%s\" declares an invalid success rate for \"%s\"\n",
				profile.modelName.c_str(), rate.key().c_str());
			return (false);
		}

		profile.declaredSuccessRates[rate.key().c_str()] = value;
	}

	const char *difficulty = model["frp_bypass_difficulty"] | "medium";

	if (!ParseDifficultyTier(difficulty, &profile.difficulty))
	{
		Interface::PrintWarning("Catalog model \"%s\" has unknown difficulty \"%s\", assuming medium\n",
			profile.modelName.c_str(), difficulty);
		profile.difficulty = kDifficultyMedium;
	}

	profiles.push_back(profile);
	return (true);
}

bool JsonProfileCatalog::Load(const std::string& text)
{
	JsonDocument document;
	DeserializationError error = deserializeJson(document, text);

	if (error)
	{
		Interface::PrintError("Failed to parse profile catalog: %s\n", error.c_str());
		return (false);
	}

	profiles.clear();
	version = document["version"] | "unknown";

	JsonObjectConst manufacturers = document["manufacturers"];

	if (manufacturers.isNull())
	{
		Interface::PrintError("Profile catalog has no \"manufacturers\" object\n");
		return (false);
	}

	for (JsonPairConst entry : manufacturers)
	{
		Manufacturer manufacturer;

		if (!ParseManufacturer(entry.key().c_str(), &manufacturer))
		{
			Interface::PrintWarning("Unknown catalog manufacturer \"%s\"\n", entry.key().c_str());
			manufacturer = kManufacturerUnknown;
		}

		JsonObjectConst manufacturerObject = entry.value();

		int vendorId = 0;
		if (!manufacturerObject["vendor_id"].isNull() && !ParseId(manufacturerObject["vendor_id"], &vendorId))
		{
			Interface::PrintError("Catalog manufacturer \"%s\" has an invalid vendor id\n", entry.key().c_str());
			return (false);
		}

		JsonObjectConst seriesObject = manufacturerObject["series"];
		for (JsonPairConst series : seriesObject)
		{
			JsonArrayConst models = series.value()["models"];
			for (JsonVariantConst model : models)
			{
				if (!LoadModel(model, manufacturer, vendorId, series.key().c_str()))
					return (false);
			}
		}
	}

	Interface::PrintVerbose("Loaded %u catalog models (version %s)\n", GetModelCount(), version.c_str());
	return (true);
}

bool JsonProfileCatalog::LoadFile(const std::string& path)
{
	std::string text;

	if (!TextFile::Read(path, &text))
	{
		Interface::PrintError("Failed to read profile catalog \"%s\"\n", path.c_str());
		return (false);
	}

	return (Load(text));
}

int JsonProfileCatalog::FindProfile(int vendorId, int productId, const std::string& modelHint, DeviceProfile *profile)
{
	for (size_t i = 0; i < profiles.size(); i++)
	{
		const DeviceProfile& candidate = profiles[i];

		if (candidate.vendorId == vendorId && std::find(candidate.productIds.begin(), candidate.productIds.end(),
			productId) != candidate.productIds.end())
		{
			*profile = candidate;
			return (kProfileFound);
		}
	}

	if (!modelHint.empty())
	{
		std::string hint = ToLowerCase(modelHint);

		for (size_t i = 0; i < profiles.size(); i++)
		{
			if (ToLowerCase(profiles[i].modelName) == hint || ToLowerCase(profiles[i].codename) == hint)
			{
				*profile = profiles[i];
				return (kProfileFound);
			}
		}
	}

	return (kProfileNotFound);
}

std::vector<std::string> JsonProfileCatalog::GetManufacturerNames(void) const
{
	std::vector<std::string> names;

	for (size_t i = 0; i < profiles.size(); i++)
	{
		std::string name = GetManufacturerName(profiles[i].manufacturer);

		if (std::find(names.begin(), names.end(), name) == names.end())
			names.push_back(name);
	}

	return (names);
}

std::vector<std::string> JsonProfileCatalog::GetMethodNames(void) const
{
	std::vector<std::string> names;

	for (size_t i = 0; i < profiles.size(); i++)
	{
		const std::vector<std::string>& methods = profiles[i].supportedMethodNames;

		for (size_t j = 0; j < methods.size(); j++)
		{
			if (std::find(names.begin(), names.end(), methods[j]) == names.end())
				names.push_back(methods[j]);
		}
	}

	return (names);
}

double JsonProfileCatalog::GetAverageSuccessRate(void) const
{
	if (profiles.empty())
		return (0.0);

	int total = 0;

	for (size_t i = 0; i < profiles.size(); i++)
		total += profiles[i].overallSuccessRate;

	return (static_cast<double>(total) / profiles.size());
}
