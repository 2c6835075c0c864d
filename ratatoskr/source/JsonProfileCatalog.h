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

#ifndef RATATOSKR_JSONPROFILECATALOG_H
#define RATATOSKR_JSONPROFILECATALOG_H

// ArduinoJson
#include <ArduinoJson.h>

// Ratatoskr
#include "ProfileCatalog.h"

namespace Ratatoskr
{
	// Profile catalog loaded once from a JSON document:
	//
	// { "version": "...",
	//   "manufacturers": { "samsung": { "vendor_id": "04e8", "series": { "galaxy_s": { "models": [
	//     { "name", "codename", "product_ids", "android_versions", "api_levels", "supported_methods",
	//       "method_success_rates", "success_rate", "frp_bypass_difficulty" } ] } } } } }
	class JsonProfileCatalog : public ProfileCatalog
	{
		private:

			std::string version;
			std::vector<DeviceProfile> profiles;

			bool LoadModel(JsonObjectConst model, Manufacturer manufacturer, int vendorId, const std::string& series);

			static bool ParseId(JsonVariantConst value, int *id);

		public:

			bool Load(const std::string& text);
			bool LoadFile(const std::string& path);

			int FindProfile(int vendorId, int productId, const std::string& modelHint, DeviceProfile *profile);

			const std::string& GetVersion(void) const
			{
				return (version);
			}

			unsigned int GetModelCount(void) const
			{
				return (profiles.size());
			}

			std::vector<std::string> GetManufacturerNames(void) const;
			std::vector<std::string> GetMethodNames(void) const;
			double GetAverageSuccessRate(void) const;
	};
}

#endif
