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
#include <stdio.h>

// Ratatoskr
#include "Interface.h"
#include "MethodRegistry.h"
#include "TextFile.h"

using namespace Ratatoskr;

MethodRegistry::MethodRegistry()
{
	// An account registered on the device is what keeps it locked after a reset.
	LockQuery accountQuery;
	accountQuery.command = "shell dumpsys account";
	accountQuery.lockedPattern = "com.google";

	lockQueries[kModeDebugBridge] = accountQuery;
}

bool MethodRegistry::Register(const BypassMethodDescriptor& descriptor)
{
	if (descriptor.name.empty())
	{
		Interface::PrintError("Method without a name\n");
		return (false);
	}

	if (Find(descriptor.name))
	{
		Interface::PrintError("Method \"%s\" is declared twice\n", descriptor.name.c_str());
		return (false);
	}

	if (descriptor.steps.empty())
	{
		Interface::PrintError("Method \"%s\" has no steps\n", descriptor.name.c_str());
		return (false);
	}

	if (descriptor.baseWeight < 0.0 || descriptor.baseWeight > 1.0)
	{
		Interface::PrintError("Method \"%s\" has a base weight outside 0 - 1\n", descriptor.name.c_str());
		return (false);
	}

	for (size_t i = 0; i < descriptor.steps.size(); i++)
	{
		if (descriptor.steps[i].command.empty())
		{
			Interface::PrintError("Step %u of method \"%s\" has no command\n", static_cast<unsigned int>(i),
				descriptor.name.c_str());
			return (false);
		}
	}

	descriptors.push_back(descriptor);
	descriptors.back().declarationIndex = descriptors.size() - 1;

	return (true);
}

bool MethodRegistry::RegisterChain(const std::string& name, const std::vector<std::string>& links, double baseWeight,
	const std::vector<Manufacturer>& manufacturers)
{
	if (links.empty())
	{
		Interface::PrintError("Chained method \"%s\" has no links\n", name.c_str());
		return (false);
	}

	BypassMethodDescriptor chain;
	chain.name = name;
	chain.kind = kMethodChained;
	chain.risk = kRiskVeryLow;
	chain.baseWeight = baseWeight;
	chain.manufacturers = manufacturers;

	for (size_t i = 0; i < links.size(); i++)
	{
		const BypassMethodDescriptor *link = Find(links[i]);

		if (!link)
		{
			Interface::PrintError("Chained method \"%s\" refers to undeclared method \"%s\"\n", name.c_str(),
				links[i].c_str());
			return (false);
		}

		if (i == 0)
			chain.requiredMode = link->requiredMode;

		if (link->risk > chain.risk)
			chain.risk = link->risk;

		for (size_t j = 0; j < link->steps.size(); j++)
		{
			MethodStep step = link->steps[j];
			step.id = link->name + "/" + step.id;
			chain.steps.push_back(step);
		}
	}

	return (Register(chain));
}

bool MethodRegistry::LoadMethod(JsonObjectConst method)
{
	std::string name = method["name"] | "";
	const char *kindName = method["kind"] | "";

	MethodKind kind;
	if (!ParseMethodKind(kindName, &kind))
	{
		Interface::PrintError("Method \"%s\" has unknown kind \"%s\"\n", name.c_str(), kindName);
		return (false);
	}

	std::vector<Manufacturer> manufacturers;

	JsonArrayConst manufacturerNames = method["manufacturers"];
	for (JsonVariantConst manufacturerName : manufacturerNames)
	{
		Manufacturer manufacturer;

		if (!ParseManufacturer(manufacturerName.as<std::string>(), &manufacturer))
		{
			Interface::PrintError("Method \"%s\" names unknown manufacturer \"%s\"\n", name.c_str(),
				manufacturerName.as<std::string>().c_str());
			return (false);
		}

		manufacturers.push_back(manufacturer);
	}

	double baseWeight = method["base_weight"] | 0.5;

	if (kind == kMethodChained)
	{
		std::vector<std::string> links;

		JsonArrayConst chain = method["chain"];
		for (JsonVariantConst link : chain)
			links.push_back(link.as<std::string>());

		return (RegisterChain(name, links, baseWeight, manufacturers));
	}

	BypassMethodDescriptor descriptor;
	descriptor.name = name;
	descriptor.kind = kind;
	descriptor.requiredMode = GetMethodKindMode(kind);
	descriptor.baseWeight = baseWeight;
	descriptor.manufacturers = manufacturers;

	const char *modeName = method["required_mode"] | "";
	if (*modeName && !ParseMode(modeName, &descriptor.requiredMode))
	{
		Interface::PrintError("Method \"%s\" has unknown mode \"%s\"\n", name.c_str(), modeName);
		return (false);
	}

	const char *riskName = method["risk"] | "medium";
	if (!ParseRiskTier(riskName, &descriptor.risk))
	{
		Interface::PrintError("Method \"%s\" has unknown risk \"%s\"\n", name.c_str(), riskName);
		return (false);
	}

	JsonArrayConst steps = method["steps"];
	for (JsonObjectConst stepObject : steps)
	{
		MethodStep step;
		step.id = stepObject["id"] | "";
		step.command = stepObject["command"] | "";
		step.timeoutMs = stepObject["timeout_ms"] | 0;
		step.expect = stepObject["expect"] | "";
		step.mode = descriptor.requiredMode;

		if (step.id.empty())
		{
			char id[16];
			snprintf(id, sizeof(id), "step%u", static_cast<unsigned int>(descriptor.steps.size() + 1));
			step.id = id;
		}

		const char *stepMode = stepObject["mode"] | "";
		if (*stepMode && !ParseMode(stepMode, &step.mode))
		{
			Interface::PrintError("Step \"%s\" of method \"%s\" has unknown mode \"%s\"\n", step.id.c_str(),
				name.c_str(), stepMode);
			return (false);
		}

		descriptor.steps.push_back(step);
	}

	return (Register(descriptor));
}

bool MethodRegistry::LoadLockQueries(JsonObjectConst queries)
{
	for (JsonPairConst entry : queries)
	{
		DeviceMode mode;

		if (!ParseMode(entry.key().c_str(), &mode))
		{
			Interface::PrintError("Lock query for unknown mode \"%s\"\n", entry.key().c_str());
			return (false);
		}

		LockQuery query;
		query.command = entry.value()["command"] | "";
		query.lockedPattern = entry.value()["locked_pattern"] | "";
		query.unlockedPattern = entry.value()["unlocked_pattern"] | "";

		if (!query.IsDefined())
		{
			Interface::PrintError("Lock query for %s mode has no command\n", GetModeName(mode));
			return (false);
		}

		lockQueries[mode] = query;
	}

	return (true);
}

bool MethodRegistry::Load(const std::string& text)
{
	JsonDocument document;
	DeserializationError error = deserializeJson(document, text);

	if (error)
	{
		Interface::PrintError("Failed to parse method descriptors: %s\n", error.c_str());
		return (false);
	}

	JsonArrayConst methods = document["methods"];
	for (JsonObjectConst method : methods)
	{
		if (!LoadMethod(method))
			return (false);
	}

	if (!LoadLockQueries(document["lock_queries"]))
		return (false);

	Interface::PrintVerbose("Registered %u bypass methods\n", static_cast<unsigned int>(descriptors.size()));
	return (true);
}

bool MethodRegistry::LoadFile(const std::string& path)
{
	std::string text;

	if (!TextFile::Read(path, &text))
	{
		Interface::PrintError("Failed to read method descriptors \"%s\"\n", path.c_str());
		return (false);
	}

	return (Load(text));
}

const BypassMethodDescriptor *MethodRegistry::Find(const std::string& name) const
{
	for (size_t i = 0; i < descriptors.size(); i++)
	{
		if (descriptors[i].name == name)
			return (&descriptors[i]);
	}

	return (nullptr);
}

const LockQuery& MethodRegistry::GetLockQuery(DeviceMode mode) const
{
	return (lockQueries[mode]);
}

void MethodRegistry::SetLockQuery(DeviceMode mode, const LockQuery& query)
{
	lockQueries[mode] = query;
}
