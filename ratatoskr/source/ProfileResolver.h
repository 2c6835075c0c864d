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

#ifndef RATATOSKR_PROFILERESOLVER_H
#define RATATOSKR_PROFILERESOLVER_H

// Ratatoskr
#include "DeviceSnapshot.h"
#include "MethodRegistry.h"
#include "ProfileCatalog.h"

namespace Ratatoskr
{
	class ProfileResolver
	{
		private:

			ProfileCatalog *catalog;
			const MethodRegistry *registry;

		public:

			// catalog may be null, in which case every device gets the generic profile.
			ProfileResolver(ProfileCatalog *catalog, const MethodRegistry *registry);

			// Returns false when the catalog does not know the device and *profile is the generic one.
			bool Resolve(const DeviceSnapshot& device, DeviceProfile *profile);

			// Only the registered methods native to the device's current mode, and of those only
			// the ones in the lowest risk tier present.
			static DeviceProfile BuildGenericProfile(const DeviceSnapshot& device, const MethodRegistry& registry);
	};
}

#endif
