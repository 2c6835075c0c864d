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
#include <map>

// Ratatoskr
#include "BypassAction.h"
#include "DetectAction.h"
#include "InfoAction.h"
#include "Interface.h"

using namespace Ratatoskr;

namespace
{
	typedef int (*ExecuteFunction)(int argc, char **argv);

	struct ActionInfo
	{
		ExecuteFunction executeFunction;
		const char *usage;
	};

	int HelpAction(int argc, char **argv)
	{
		Interface::PrintUsage();
		return (Interface::kExitSuccess);
	}

	int VersionAction(int argc, char **argv)
	{
		Interface::PrintVersion();
		return (Interface::kExitSuccess);
	}
}

int main(int argc, char **argv)
{
	std::map<std::string, ActionInfo> actionMap;

	ActionInfo detect = { DetectAction::Execute, DetectAction::usage };
	ActionInfo info = { InfoAction::Execute, InfoAction::usage };
	ActionInfo bypass = { BypassAction::Execute, BypassAction::usage };
	ActionInfo help = { HelpAction, nullptr };
	ActionInfo version = { VersionAction, nullptr };

	actionMap["detect"] = detect;
	actionMap["info"] = info;
	actionMap["bypass"] = bypass;
	actionMap["help"] = help;
	actionMap["version"] = version;

	if (argc < 2)
	{
		Interface::PrintReleaseInfo();
		Interface::PrintUsage();
		return (Interface::kExitFailure);
	}

	std::string actionName = argv[1];

	// "ratatoskr bypass --help" prints the action's own usage.
	if (argc == 3 && (std::string(argv[2]) == "--help" || std::string(argv[2]) == "-h"))
	{
		std::map<std::string, ActionInfo>::const_iterator action = actionMap.find(actionName);

		if (action != actionMap.end() && action->second.usage)
		{
			Interface::Print("%s", action->second.usage);
			return (Interface::kExitSuccess);
		}
	}

	std::map<std::string, ActionInfo>::const_iterator action = actionMap.find(actionName);

	if (action == actionMap.end())
	{
		Interface::PrintError("Unknown action \"%s\"\n\n", actionName.c_str());
		Interface::PrintUsage();
		return (Interface::kExitFailure);
	}

	return (action->second.executeFunction(argc, argv));
}
