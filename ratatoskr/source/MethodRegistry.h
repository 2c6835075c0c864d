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

#ifndef RATATOSKR_METHODREGISTRY_H
#define RATATOSKR_METHODREGISTRY_H

// ArduinoJson
#include <ArduinoJson.h>

// Ratatoskr
#include "BypassMethodDescriptor.h"
#include "Channel.h"

namespace Ratatoskr
{
	// Every descriptor the engine may rank, in declaration order, plus the read-only query
	// used to read the lock state in each mode.
	class MethodRegistry
	{
		private:

			std::vector<BypassMethodDescriptor> descriptors;
			LockQuery lockQueries[kModeCount];

			bool LoadMethod(JsonObjectConst method);
			bool LoadLockQueries(JsonObjectConst queries);

		public:

			MethodRegistry();

			// Fails on a duplicate name or a descriptor without steps.
			bool Register(const BypassMethodDescriptor& descriptor);

			// Concatenates the steps of already registered methods. The chain starts in the mode
			// of its first link and carries the highest risk of its links.
			bool RegisterChain(const std::string& name, const std::vector<std::string>& links, double baseWeight,
				const std::vector<Manufacturer>& manufacturers);

			bool Load(const std::string& text);
			bool LoadFile(const std::string& path);

			const BypassMethodDescriptor *Find(const std::string& name) const;

			const std::vector<BypassMethodDescriptor>& GetDescriptors(void) const
			{
				return (descriptors);
			}

			const LockQuery& GetLockQuery(DeviceMode mode) const;
			void SetLockQuery(DeviceMode mode, const LockQuery& query);
	};
}

#endif
