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

#ifndef RATATOSKR_ARGUMENTS_H
#define RATATOSKR_ARGUMENTS_H

// C++ Standard Library
#include <map>

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	typedef enum
	{
		kArgumentTypeFlag = 0,
		kArgumentTypeString,
		kArgumentTypeUnsignedInteger
	} ArgumentType;

	class Argument
	{
		private:

			std::string name;
			ArgumentType argumentType;

		protected:

			Argument(const std::string& name, ArgumentType argumentType) :
				name(name),
				argumentType(argumentType)
			{
			}

		public:

			virtual ~Argument()
			{
			}

			const std::string& GetName(void) const
			{
				return (name);
			}

			ArgumentType GetArgumentType(void) const
			{
				return (argumentType);
			}
	};

	class FlagArgument : public Argument
	{
		private:

			explicit FlagArgument(const std::string& name) :
				Argument(name, kArgumentTypeFlag)
			{
			}

		public:

			static FlagArgument *ParseArgument(const std::string& name, int argc, char **argv, int& argi);
	};

	class StringArgument : public Argument
	{
		private:

			std::string value;

			StringArgument(const std::string& name, const std::string& value) :
				Argument(name, kArgumentTypeString),
				value(value)
			{
			}

		public:

			static StringArgument *ParseArgument(const std::string& name, int argc, char **argv, int& argi);

			const std::string& GetValue(void) const
			{
				return (value);
			}
	};

	class UnsignedIntegerArgument : public Argument
	{
		private:

			unsigned int value;

			UnsignedIntegerArgument(const std::string& name, unsigned int value) :
				Argument(name, kArgumentTypeUnsignedInteger),
				value(value)
			{
			}

		public:

			static UnsignedIntegerArgument *ParseArgument(const std::string& name, int argc, char **argv, int& argi);

			unsigned int GetValue(void) const
			{
				return (value);
			}
	};

	class Arguments
	{
		private:

			std::map<std::string, ArgumentType> argumentTypes;
			std::map<std::string, std::string> shortArgumentAliases;

			std::vector<const Argument *> argumentVector;
			std::map<std::string, const Argument *> argumentMap;

		public:

			Arguments(const std::map<std::string, ArgumentType>& argumentTypes,
				const std::map<std::string, std::string>& shortArgumentAliases = std::map<std::string, std::string>());
			~Arguments();

			Arguments(const Arguments&) = delete;
			Arguments& operator=(const Arguments&) = delete;

			// argi is the index of the first argument after the action name.
			bool ParseArguments(int argc, char **argv, int argi);

			const Argument *GetArgument(const std::string& argumentName) const;

			bool HasFlag(const std::string& argumentName) const;

			std::string GetString(const std::string& argumentName, const std::string& defaultValue = "") const;
			unsigned int GetUnsignedInteger(const std::string& argumentName, unsigned int defaultValue) const;

			const std::vector<const Argument *>& GetArguments(void) const
			{
				return (argumentVector);
			}
	};
}

#endif
