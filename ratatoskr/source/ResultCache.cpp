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
#include "ResultCache.h"
#include "Timing.h"

using namespace Ratatoskr;

MemoryResultCache::MemoryResultCache(unsigned int ttlSeconds, unsigned int maxEntries, Clock clock) :
	ttlMs(static_cast<uint64_t>(ttlSeconds) * 1000),
	maxEntries(maxEntries > 0 ? maxEntries : 1),
	clock(clock ? clock : Timing::GetMonotonicMs)
{
}

std::string MemoryResultCache::MakeKey(const std::string& serial, const std::string& methodName)
{
	return (serial + "/" + methodName);
}

bool MemoryResultCache::IsExpired(const Entry& entry, uint64_t now) const
{
	return (now - entry.storedAt >= ttlMs);
}

void MemoryResultCache::EvictOldest(void)
{
	std::map<std::string, Entry>::iterator oldest = entries.begin();

	for (std::map<std::string, Entry>::iterator entry = entries.begin(); entry != entries.end(); ++entry)
	{
		if (entry->second.storedAt < oldest->second.storedAt)
			oldest = entry;
	}

	if (oldest != entries.end())
		entries.erase(oldest);
}

bool MemoryResultCache::Lookup(const std::string& serial, const std::string& methodName, AttemptStatus *status)
{
	std::lock_guard<std::mutex> lock(entriesMutex);

	std::map<std::string, Entry>::iterator entry = entries.find(MakeKey(serial, methodName));

	if (entry == entries.end())
		return (false);

	if (IsExpired(entry->second, clock()))
	{
		entries.erase(entry);
		return (false);
	}

	*status = entry->second.status;
	return (true);
}

void MemoryResultCache::Store(const std::string& serial, const std::string& methodName, AttemptStatus status)
{
	std::lock_guard<std::mutex> lock(entriesMutex);

	std::string key = MakeKey(serial, methodName);

	if (entries.find(key) == entries.end())
	{
		while (entries.size() >= maxEntries)
			EvictOldest();
	}

	Entry entry;
	entry.status = status;
	entry.storedAt = clock();

	entries[key] = entry;
}

unsigned int MemoryResultCache::RemoveExpired(void)
{
	std::lock_guard<std::mutex> lock(entriesMutex);

	uint64_t now = clock();
	unsigned int removed = 0;

	std::map<std::string, Entry>::iterator entry = entries.begin();

	while (entry != entries.end())
	{
		if (IsExpired(entry->second, now))
		{
			entries.erase(entry++);
			removed++;
		}
		else
		{
			++entry;
		}
	}

	return (removed);
}

unsigned int MemoryResultCache::GetSize(void)
{
	std::lock_guard<std::mutex> lock(entriesMutex);
	return (entries.size());
}
