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

// C++ Standard Library
#include <mutex>

// Ratatoskr
#include "Interface.h"

using namespace Ratatoskr;

bool Interface::verbose = false;
bool Interface::stdoutErrors = false;
bool Interface::machineOutput = false;

const char *Interface::version = RATATOSKR_VERSION;

const char *Interface::usage = "Usage: ratatoskr <action> [--verbose] [--stdout-errors] [--json] <arguments...>\n\
\n\
Actions:\n\
 detect       Enumerates attached devices and prints one line per device.\n\
 info         --serial <serial> [--catalog <file>] [--methods <file>]\n\
              Describes a single device and the profile resolved for it.\n\
 bypass       [--serial <serial>] [--method <name>] [--dry-run]\n\
              --methods <file> --authorized <file> [--catalog <file>]\n\
              [--audit-log <file>] [--cache-ttl <seconds>]\n\
              [--switch-penalty <percent>]\n\
              Ranks the candidate methods for the device and runs them in\n\
              order until one succeeds. Without --serial every locked\n\
              device is processed concurrently.\n\
 help         Prints this text.\n\
 version      Prints the version.\n\
\n\
Common options:\n\
 --adb <path>  --fastboot <path>\n\
 --command-timeout <ms>  --acquire-timeout <ms>\n\
 --switch-timeout <ms>  --scan-timeout <ms>\n";

const char *Interface::releaseInfo = "Ratatoskr v" RATATOSKR_VERSION "\n\
Device detection and method orchestration over USB.\n\
Only operate on devices you are authorized to service.\n\n";

namespace
{
	// Sessions for distinct devices print from their own threads.
	std::mutex& OutputMutex(void)
	{
		static std::mutex outputMutex;
		return (outputMutex);
	}
}

void Interface::VPrint(bool toError, const char *prefix, const char *format, va_list args)
{
	FILE *stream;

	if (toError)
		stream = stdoutErrors ? stdout : stderr;
	else
		stream = machineOutput ? stderr : stdout;

	std::lock_guard<std::mutex> lock(OutputMutex());

	if (prefix)
		fputs(prefix, stream);

	vfprintf(stream, format, args);
	fflush(stream);
}

void Interface::SetVerbose(bool verbose)
{
	Interface::verbose = verbose;
}

bool Interface::IsVerbose(void)
{
	return (verbose);
}

void Interface::SetStdoutErrors(bool stdoutErrors)
{
	Interface::stdoutErrors = stdoutErrors;
}

void Interface::SetMachineOutput(bool machineOutput)
{
	Interface::machineOutput = machineOutput;
}

void Interface::PrintResult(const char *format, ...)
{
	va_list args;
	va_start(args, format);

	std::lock_guard<std::mutex> lock(OutputMutex());

	vfprintf(stdout, format, args);
	fflush(stdout);

	va_end(args);
}

void Interface::Print(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	VPrint(false, nullptr, format, args);
	va_end(args);
}

void Interface::PrintVerbose(const char *format, ...)
{
	if (!verbose)
		return;

	va_list args;
	va_start(args, format);
	VPrint(false, nullptr, format, args);
	va_end(args);
}

void Interface::PrintWarning(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	VPrint(true, "WARNING: ", format, args);
	va_end(args);
}

void Interface::PrintError(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	VPrint(true, "ERROR: ", format, args);
	va_end(args);
}

void Interface::PrintErrorSameLine(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	VPrint(true, nullptr, format, args);
	va_end(args);
}

void Interface::PrintVersion(void)
{
	Print("%s\n", version);
}

void Interface::PrintUsage(void)
{
	Print("%s", usage);
}

void Interface::PrintReleaseInfo(void)
{
	Print("%s", releaseInfo);
}

void Interface::PrintDeviceDetectionFailed(void)
{
	Print("Failed to detect compatible device\n");
}
