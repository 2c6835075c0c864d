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

#ifndef RATATOSKR_BYPASSMETHODDESCRIPTOR_H
#define RATATOSKR_BYPASSMETHODDESCRIPTOR_H

// Ratatoskr
#include "DeviceProfile.h"

namespace Ratatoskr
{
	enum MethodKind
	{
		kMethodDebugBridgeExploit = 0,
		kMethodBootLoaderManipulation,
		kMethodManufacturerDownload,
		kMethodEmergencyDownload,
		kMethodChained
	};

	const char *GetMethodKindName(MethodKind kind);
	bool ParseMethodKind(const std::string& name, MethodKind *kind);

	// Mode a method of this kind is native to. Chained methods take the mode of their first link.
	DeviceMode GetMethodKindMode(MethodKind kind);

	struct MethodStep
	{
		std::string id;
		std::string command;

		// 0 means the engine's command timeout.
		int timeoutMs;

		// Text the command's output must contain for the step to count as done. Empty means
		// the command's own status decides.
		std::string expect;

		// Mode the step runs in. Steps of a chain may run in different modes.
		DeviceMode mode;

		MethodStep();
		MethodStep(const std::string& id, const std::string& command, DeviceMode mode);
	};

	// One bypass procedure described as data: an ordered list of channel commands plus what
	// ranking needs to know about it.
	struct BypassMethodDescriptor
	{
		std::string name;
		MethodKind kind;
		DeviceMode requiredMode;
		RiskTier risk;

		// 0.0 - 1.0, used when the profile declares no success rate for the method.
		double baseWeight;

		// Empty means every manufacturer.
		std::vector<Manufacturer> manufacturers;

		std::vector<MethodStep> steps;

		// Registration order; the last ranking tie-break.
		unsigned int declarationIndex;

		BypassMethodDescriptor();

		bool SupportsManufacturer(Manufacturer manufacturer) const;
	};
}

#endif
