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

#ifndef RATATOSKR_STRATEGYPLANNER_H
#define RATATOSKR_STRATEGYPLANNER_H

// Ratatoskr
#include "MethodRegistry.h"
#include "ResultCache.h"

namespace Ratatoskr
{
	struct RankedCandidate
	{
		const BypassMethodDescriptor *descriptor;
		double weight;
		bool requiresModeSwitch;
	};

	// Orders the registered methods a profile supports into an execution plan.
	class StrategyPlanner
	{
		private:

			double modeSwitchPenalty;
			double cacheSuccessBoost;
			ResultCache *resultCache;

		public:

			// resultCache may be null.
			StrategyPlanner(double modeSwitchPenalty, double cacheSuccessBoost, ResultCache *resultCache);

			// Candidates are the supported methods whose mode is current or one switch away.
			// weight = declared rate / 100 (or base weight), times the penalty when a switch is
			// needed, plus the boost when the cache remembers a success. Sorted by weight
			// descending, then risk ascending, then declaration order.
			std::vector<RankedCandidate> Rank(const DeviceSnapshot& device, const DeviceProfile& profile,
				const MethodRegistry& registry) const;

			static bool IsReachable(Manufacturer manufacturer, DeviceMode currentMode, DeviceMode requiredMode);
	};
}

#endif
