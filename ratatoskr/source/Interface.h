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

#ifndef RATATOSKR_INTERFACE_H
#define RATATOSKR_INTERFACE_H

// C Standard Library
#include <stdarg.h>

// Ratatoskr
#include "Ratatoskr.h"

namespace Ratatoskr
{
	class Interface
	{
		public:

			enum
			{
				kExitSuccess = 0,
				kExitFailure = 1,
				kExitAuthorizationDenied = 2
			};

		private:

			static bool verbose;
			static bool stdoutErrors;
			static bool machineOutput;

			static const char *version;
			static const char *usage;
			static const char *releaseInfo;

			static void VPrint(bool toError, const char *prefix, const char *format, va_list args);

		public:

			static void SetVerbose(bool verbose);
			static bool IsVerbose(void);

			// Route warnings and errors to stdout instead of stderr.
			static void SetStdoutErrors(bool stdoutErrors);

			// Moves everything but PrintResult() output to stderr, keeping stdout parseable.
			static void SetMachineOutput(bool machineOutput);

			// Always stdout. Used for the action's result.
			static void PrintResult(const char *format, ...);

			static void Print(const char *format, ...);
			static void PrintVerbose(const char *format, ...);
			static void PrintWarning(const char *format, ...);
			static void PrintError(const char *format, ...);
			static void PrintErrorSameLine(const char *format, ...);

			static void PrintVersion(void);
			static void PrintUsage(void);
			static void PrintReleaseInfo(void);
			static void PrintDeviceDetectionFailed(void);
	};
}

#endif
