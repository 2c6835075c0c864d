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
#include "Authorizer.h"
#include "Interface.h"
#include "TextFile.h"

using namespace Ratatoskr;

bool FileAuthorizer::LoadFile(const std::string& path)
{
	std::vector<std::string> serials;

	if (!TextFile::ReadLines(path, &serials))
	{
		Interface::PrintError("Failed to read authorization file \"%s\"\n", path.c_str());
		return (false);
	}

	for (size_t i = 0; i < serials.size(); i++)
		authorizedSerials.insert(serials[i]);

	Interface::PrintVerbose("%u serials authorized\n", static_cast<unsigned int>(authorizedSerials.size()));
	return (true);
}

void FileAuthorizer::Add(const std::string& serial)
{
	authorizedSerials.insert(serial);
}

bool FileAuthorizer::CheckAuthorized(const std::string& serial)
{
	return (authorizedSerials.count(serial) != 0);
}
