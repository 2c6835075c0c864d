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

#ifndef RATATOSKR_AUTHORIZER_H
#define RATATOSKR_AUTHORIZER_H

// C++ Standard Library
#include <set>

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	class Authorizer
	{
		public:

			virtual ~Authorizer()
			{
			}

			virtual bool CheckAuthorized(const std::string& serial) = 0;
	};

	// Serials the operator has listed as authorized, one per line. Lines starting with '#' are comments.
	class FileAuthorizer : public Authorizer
	{
		private:

			std::set<std::string> authorizedSerials;

		public:

			bool LoadFile(const std::string& path);

			void Add(const std::string& serial);

			bool CheckAuthorized(const std::string& serial);
	};
}

#endif
