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

#ifndef RATATOSKR_RESULTCACHE_H
#define RATATOSKR_RESULTCACHE_H

// C++ Standard Library
#include <map>
#include <mutex>

// Ratatoskr
#include "BypassSession.h"

namespace Ratatoskr
{
	// Last terminal outcome per device serial and method. A hint for ranking only.
	class ResultCache
	{
		public:

			virtual ~ResultCache()
			{
			}

			virtual bool Lookup(const std::string& serial, const std::string& methodName, AttemptStatus *status) = 0;
			virtual void Store(const std::string& serial, const std::string& methodName, AttemptStatus status) = 0;
	};

	class MemoryResultCache : public ResultCache
	{
		public:

			typedef uint64_t (*Clock)(void);

			enum
			{
				kDefaultMaxEntries = 1024
			};

		private:

			struct Entry
			{
				AttemptStatus status;
				uint64_t storedAt;
			};

			uint64_t ttlMs;
			unsigned int maxEntries;
			Clock clock;

			std::mutex entriesMutex;
			std::map<std::string, Entry> entries;

			static std::string MakeKey(const std::string& serial, const std::string& methodName);

			bool IsExpired(const Entry& entry, uint64_t now) const;
			void EvictOldest(void);

		public:

			MemoryResultCache(unsigned int ttlSeconds, unsigned int maxEntries = kDefaultMaxEntries,
				Clock clock = nullptr);

			bool Lookup(const std::string& serial, const std::string& methodName, AttemptStatus *status);
			void Store(const std::string& serial, const std::string& methodName, AttemptStatus status);

			// Returns the number of entries dropped.
			unsigned int RemoveExpired(void);

			unsigned int GetSize(void);
	};
}

#endif
