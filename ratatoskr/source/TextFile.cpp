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

// C Standard Library
#include <stdio.h>

// Ratatoskr
#include "TextFile.h"

using namespace Ratatoskr;

namespace Ratatoskr
{
	namespace TextFile
	{
		bool Read(const std::string& path, std::string *contents)
		{
			FILE *file = fopen(path.c_str(), "rb");

			if (!file)
				return (false);

			contents->clear();

			char buffer[4096];
			size_t count;

			while ((count = fread(buffer, 1, sizeof(buffer), file)) > 0)
				contents->append(buffer, count);

			bool failed = (ferror(file) != 0);
			fclose(file);

			return (!failed);
		}

		bool AppendLine(const std::string& path, const std::string& line)
		{
			FILE *file = fopen(path.c_str(), "ab");

			if (!file)
				return (false);

			bool written = (fwrite(line.data(), 1, line.size(), file) == line.size() && fputc('\n', file) != EOF
				&& fflush(file) == 0);

			if (fclose(file) != 0)
				written = false;

			return (written);
		}

		bool ReadLines(const std::string& path, std::vector<std::string> *lines)
		{
			std::string contents;

			if (!Read(path, &contents))
				return (false);

			lines->clear();

			size_t position = 0;

			while (position < contents.size())
			{
				size_t lineEnd = contents.find('\n', position);
				if (lineEnd == std::string::npos)
					lineEnd = contents.size();

				std::string line = contents.substr(position, lineEnd - position);
				position = lineEnd + 1;

				size_t first = line.find_first_not_of(" \t\r");
				if (first == std::string::npos || line[first] == '#')
					continue;

				size_t last = line.find_last_not_of(" \t\r");
				lines->push_back(line.substr(first, last - first + 1));
			}

			return (true);
		}
	}
}
