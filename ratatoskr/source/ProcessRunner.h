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

#ifndef RATATOSKR_PROCESSRUNNER_H
#define RATATOSKR_PROCESSRUNNER_H

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	// Runs a host tool as a child process with a hard timeout, capturing both output streams.
	class ProcessRunner
	{
		public:

			enum
			{
				kRunCompleted = 0,
				kRunFailedToStart,
				kRunTimedOut
			};

			enum
			{
				kReadBufferSize = 4096
			};

			struct Result
			{
				int status;
				int exitCode;
				std::string standardOutput;
				std::string standardError;
				unsigned int durationMs;
			};

			// On timeout the child is killed; whatever it printed so far is still returned.
			static Result Run(const std::vector<std::string>& arguments, int timeoutMs);

			// Both ends close on exec. Returns false with errno set on failure.
			static bool OpenPipe(int fds[2]);

			// Splits on whitespace, honouring single and double quotes.
			static std::vector<std::string> SplitCommandLine(const std::string& commandLine);
	};
}

#endif
