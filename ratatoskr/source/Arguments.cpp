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

// Ratatoskr
#include "Arguments.h"
#include "Interface.h"

using namespace Ratatoskr;

FlagArgument *FlagArgument::ParseArgument(const std::string& name, int argc, char **argv, int& argi)
{
	return (new FlagArgument(name));
}

StringArgument *StringArgument::ParseArgument(const std::string& name, int argc, char **argv, int& argi)
{
	if (++argi < argc)
	{
		return (new StringArgument(name, argv[argi]));
	}
	else
	{
		Interface::PrintError("%s expects a value\n", name.c_str());
		return (nullptr);
	}
}

UnsignedIntegerArgument *UnsignedIntegerArgument::ParseArgument(const std::string& name, int argc, char **argv,
	int& argi)
{
	if (++argi >= argc)
	{
		Interface::PrintError("%s expects a value\n", name.c_str());
		return (nullptr);
	}

	const char *text = argv[argi];
	char *end;
	unsigned long value = strtoul(text, &end, 0);

	if (*text == 0 || *text == '-' || *end != 0 || value > 0xFFFFFFFFul)
	{
		Interface::PrintError("%s expects an unsigned integer, got \"%s\"\n", name.c_str(), text);
		return (nullptr);
	}

	return (new UnsignedIntegerArgument(name, static_cast<unsigned int>(value)));
}

Arguments::Arguments(const std::map<std::string, ArgumentType>& argumentTypes,
	const std::map<std::string, std::string>& shortArgumentAliases) :
	argumentTypes(argumentTypes),
	shortArgumentAliases(shortArgumentAliases)
{
}

Arguments::~Arguments()
{
	for (std::vector<const Argument *>::const_iterator it = argumentVector.begin(); it != argumentVector.end(); it++)
		delete *it;
}

bool Arguments::ParseArguments(int argc, char **argv, int argi)
{
	for (; argi < argc; ++argi)
	{
		std::string argumentName = argv[argi];
		std::string nonwildcardArgumentName;

		if (argumentName.compare(0, 2, "--") == 0)
		{
			argumentName = argumentName.substr(2);
		}
		else if (argumentName.compare(0, 1, "-") == 0 && argumentName.size() > 1)
		{
			std::map<std::string, std::string>::const_iterator alias = shortArgumentAliases.find(argumentName.substr(1));

			if (alias == shortArgumentAliases.end())
			{
				Interface::PrintError("Unknown argument: %s\n", argv[argi]);
				return (false);
			}

			argumentName = alias->second;
		}
		else
		{
			Interface::PrintError("Invalid argument: %s\n", argv[argi]);
			return (false);
		}

		std::map<std::string, ArgumentType>::const_iterator argumentType = argumentTypes.find(argumentName);

		if (argumentType == argumentTypes.end())
		{
			Interface::PrintError("Unknown argument: %s\n", argv[argi]);
			return (false);
		}

		if (argumentMap.find(argumentName) != argumentMap.end())
		{
			Interface::PrintError("Duplicate argument: %s\n", argv[argi]);
			return (false);
		}

		Argument *argument = nullptr;

		switch (argumentType->second)
		{
			case kArgumentTypeFlag:
				argument = FlagArgument::ParseArgument(argumentName, argc, argv, argi);
				break;

			case kArgumentTypeString:
				argument = StringArgument::ParseArgument(argumentName, argc, argv, argi);
				break;

			case kArgumentTypeUnsignedInteger:
				argument = UnsignedIntegerArgument::ParseArgument(argumentName, argc, argv, argi);
				break;

			default:
				Interface::PrintError("Unknown argument type for %s\n", argumentName.c_str());
				break;
		}

		if (!argument)
			return (false);

		argumentVector.push_back(argument);
		argumentMap[argument->GetName()] = argument;
	}

	return (true);
}

const Argument *Arguments::GetArgument(const std::string& argumentName) const
{
	std::map<std::string, const Argument *>::const_iterator it = argumentMap.find(argumentName);
	return (it != argumentMap.end() ? it->second : nullptr);
}

bool Arguments::HasFlag(const std::string& argumentName) const
{
	const Argument *argument = GetArgument(argumentName);
	return (argument && argument->GetArgumentType() == kArgumentTypeFlag);
}

std::string Arguments::GetString(const std::string& argumentName, const std::string& defaultValue) const
{
	const Argument *argument = GetArgument(argumentName);

	if (!argument || argument->GetArgumentType() != kArgumentTypeString)
		return (defaultValue);

	return (static_cast<const StringArgument *>(argument)->GetValue());
}

unsigned int Arguments::GetUnsignedInteger(const std::string& argumentName, unsigned int defaultValue) const
{
	const Argument *argument = GetArgument(argumentName);

	if (!argument || argument->GetArgumentType() != kArgumentTypeUnsignedInteger)
		return (defaultValue);

	return (static_cast<const UnsignedIntegerArgument *>(argument)->GetValue());
}
